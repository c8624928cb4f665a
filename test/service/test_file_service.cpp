#include <catch2/catch_test_macros.hpp>

#include <file_editor/errors/error_detail.hpp>
#include <file_editor/service/file_lock.hpp>
#include <file_editor/service/file_service.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include <unistd.h>

using namespace file_editor;

namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("file_editor_svc_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        fs::remove_all(path_);
        fs::create_directories(path_);
        path_ = fs::canonical(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& Path() const { return path_; }

    void Write(const std::string& name, const std::string& content) const {
        std::ofstream out(path_ / name, std::ios::binary);
        out << content;
    }

    [[nodiscard]] std::string Read(const std::string& name) const {
        std::ifstream in(path_ / name, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), {});
    }

private:
    fs::path path_;
};

std::unique_ptr<FileService> MakeService(const TempDir& dir,
                                         std::int64_t max_bytes = 1024 * 1024) {
    FileServiceOptions options;
    options.working_directory = dir.Path().string();
    options.max_file_size_bytes = max_bytes;
    options.operation_timeout = std::chrono::milliseconds{200};
    auto created = FileService::Create(std::move(options));
    REQUIRE(created.IsOk());
    return std::move(created).Value();
}

ReadFileRequest ReadReq(const std::string& name, int start = 0, int end = 0) {
    ReadFileRequest req;
    req.name = name;
    req.start_line = start;
    req.end_line = end;
    return req;
}

EditOperation Op(int line, const std::string& operation,
                 const std::string& content = "") {
    EditOperation op;
    op.line = line;
    op.operation = operation;
    op.content = content;
    return op;
}

} // anonymous namespace

// ===========================================================================
// Create
// ===========================================================================

TEST_CASE("FileService: Create rejects a missing directory", "[file_service]") {
    FileServiceOptions options;
    options.working_directory = "/nonexistent/file_editor/dir";
    auto r = FileService::Create(options);
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == error_code::kFileSystemError);
    CHECK(r.Error().DataJson()["details"].get<std::string>().find("does not exist") !=
          std::string::npos);
}

TEST_CASE("FileService: Create rejects a regular file", "[file_service]") {
    TempDir dir;
    dir.Write("plain.txt", "x");
    FileServiceOptions options;
    options.working_directory = (dir.Path() / "plain.txt").string();
    auto r = FileService::Create(options);
    REQUIRE(r.IsErr());
    CHECK(r.Error().DataJson()["details"].get<std::string>().find("not a directory") !=
          std::string::npos);
}

TEST_CASE("FileService: Create rejects an empty path", "[file_service]") {
    CHECK(FileService::Create(FileServiceOptions{}).IsErr());
}

TEST_CASE("FileService: Create canonicalizes the directory", "[file_service]") {
    TempDir dir;
    auto service = MakeService(dir);
    CHECK(service->WorkingDirectory() == dir.Path().string());
}

// ===========================================================================
// ListFiles
// ===========================================================================

TEST_CASE("FileService: ListFiles returns sorted regular files", "[file_service]") {
    TempDir dir;
    dir.Write("b.txt", "one\ntwo\n");
    dir.Write("a.txt", "single");
    dir.Write("empty.txt", "");
    dir.Write(".hidden", "secret");
    fs::create_directory(dir.Path() / "subdir");

    auto service = MakeService(dir);
    auto r = service->ListFiles(ListFilesRequest{});
    REQUIRE(r.IsOk());
    const auto& files = r.Value();
    REQUIRE(files.size() == 3);
    CHECK(files[0].name == "a.txt");
    CHECK(files[0].lines == 1);
    CHECK(files[0].size == 6);
    CHECK(files[0].readable);
    CHECK(files[0].writable);
    CHECK(files[0].modified.size() == 20);
    CHECK(files[1].name == "b.txt");
    CHECK(files[1].lines == 2);
    CHECK(files[2].name == "empty.txt");
    CHECK(files[2].lines == 0);
}

TEST_CASE("FileService: ListFiles leaves line count unknown", "[file_service]") {
    TempDir dir;
    dir.Write("binary.bin", std::string("\xFF\xFE\x00\x01", 4));
    dir.Write("big.txt", std::string(64, 'x'));

    auto service = MakeService(dir, 32);
    auto r = service->ListFiles(ListFilesRequest{});
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 2);
    CHECK(r.Value()[0].name == "big.txt");
    CHECK(r.Value()[0].lines == -1);
    CHECK(r.Value()[1].name == "binary.bin");
    CHECK(r.Value()[1].lines == -1);
}

TEST_CASE("FileService: ListFiles skips symlinks leaving the directory", "[file_service]") {
    TempDir dir;
    TempDir outside;
    outside.Write("target.txt", "elsewhere");
    dir.Write("real.txt", "here");
    fs::create_symlink(outside.Path() / "target.txt", dir.Path() / "escape.txt");
    fs::create_symlink(dir.Path() / "real.txt", dir.Path() / "alias.txt");

    auto service = MakeService(dir);
    auto r = service->ListFiles(ListFilesRequest{});
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 2);
    CHECK(r.Value()[0].name == "alias.txt");
    CHECK(r.Value()[1].name == "real.txt");
}

// ===========================================================================
// ReadFile
// ===========================================================================

TEST_CASE("FileService: ReadFile whole file", "[file_service]") {
    TempDir dir;
    dir.Write("notes.txt", "alpha\nbeta\ngamma\n");
    auto service = MakeService(dir);

    auto r = service->ReadFile(ReadReq("notes.txt"));
    REQUIRE(r.IsOk());
    CHECK(r.Value().content == "alpha\nbeta\ngamma");
    CHECK(r.Value().total_lines == 3);
    CHECK(r.Value().actual_end == 2);
    CHECK_FALSE(r.Value().is_range);
}

TEST_CASE("FileService: ReadFile ranges", "[file_service]") {
    TempDir dir;
    dir.Write("notes.txt", "l1\nl2\nl3\nl4\nl5");
    auto service = MakeService(dir);

    SECTION("closed range") {
        auto r = service->ReadFile(ReadReq("notes.txt", 2, 4));
        REQUIRE(r.IsOk());
        CHECK(r.Value().content == "l2\nl3\nl4");
        CHECK(r.Value().is_range);
        CHECK(r.Value().requested_start == 2);
        CHECK(r.Value().requested_end == 4);
        CHECK(r.Value().actual_end == 3);
    }
    SECTION("open end") {
        auto r = service->ReadFile(ReadReq("notes.txt", 4, 0));
        REQUIRE(r.IsOk());
        CHECK(r.Value().content == "l4\nl5");
    }
    SECTION("open start") {
        auto r = service->ReadFile(ReadReq("notes.txt", 0, 2));
        REQUIRE(r.IsOk());
        CHECK(r.Value().content == "l1\nl2");
    }
    SECTION("end past total is clamped") {
        auto r = service->ReadFile(ReadReq("notes.txt", 3, 99));
        REQUIRE(r.IsOk());
        CHECK(r.Value().content == "l3\nl4\nl5");
        CHECK(r.Value().actual_end == 4);
    }
}

TEST_CASE("FileService: ReadFile CRLF content is normalized", "[file_service]") {
    TempDir dir;
    dir.Write("dos.txt", "one\r\ntwo\r\n");
    auto service = MakeService(dir);
    auto r = service->ReadFile(ReadReq("dos.txt"));
    REQUIRE(r.IsOk());
    CHECK(r.Value().content == "one\ntwo");
}

TEST_CASE("FileService: ReadFile range validation", "[file_service]") {
    TempDir dir;
    dir.Write("notes.txt", "a\nb\nc");
    auto service = MakeService(dir);

    auto negative = service->ReadFile(ReadReq("notes.txt", -1, 0));
    REQUIRE(negative.IsErr());
    CHECK(negative.Error().code == error_code::kInvalidParams);
    CHECK(negative.Error().message == "Line numbers must be 1 or greater if specified.");

    auto inverted = service->ReadFile(ReadReq("notes.txt", 3, 2));
    REQUIRE(inverted.IsErr());
    CHECK(inverted.Error().message == "start_line cannot be greater than end_line.");

    auto past = service->ReadFile(ReadReq("notes.txt", 5, 0));
    REQUIRE(past.IsErr());
    CHECK(past.Error().message == "start_line 5 is greater than total lines 3.");
}

TEST_CASE("FileService: ReadFile empty file", "[file_service]") {
    TempDir dir;
    dir.Write("empty.txt", "");
    auto service = MakeService(dir);

    auto whole = service->ReadFile(ReadReq("empty.txt"));
    REQUIRE(whole.IsOk());
    CHECK(whole.Value().content.empty());
    CHECK(whole.Value().total_lines == 0);
    CHECK(whole.Value().actual_end == -1);

    auto ranged = service->ReadFile(ReadReq("empty.txt", 2, 0));
    REQUIRE(ranged.IsErr());
    CHECK(ranged.Error().message == "start_line 2 is invalid for an empty file.");
}

TEST_CASE("FileService: ReadFile missing file", "[file_service]") {
    TempDir dir;
    auto service = MakeService(dir);
    auto r = service->ReadFile(ReadReq("absent.txt"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == error_code::kFileSystemError);
    CHECK(r.Error().TypeName() == error_type::kFileNotFound);
    CHECK(r.Error().message == "File 'absent.txt' not found");
}

TEST_CASE("FileService: ReadFile rejects bad names", "[file_service]") {
    TempDir dir;
    auto service = MakeService(dir);

    for (const std::string name : {"", "../etc/passwd", "a/b.txt", "sp ace.txt"}) {
        auto r = service->ReadFile(ReadReq(name));
        REQUIRE(r.IsErr());
        CHECK(r.Error().code == error_code::kInvalidParams);
        CHECK(r.Error().message == "Filename contains invalid characters.");
    }

    auto dots = service->ReadFile(ReadReq(".."));
    REQUIRE(dots.IsErr());
    CHECK(dots.Error().message == "Path traversal attempt detected.");

    auto dot = service->ReadFile(ReadReq("."));
    REQUIRE(dot.IsErr());
    CHECK(dot.Error().code == error_code::kInvalidParams);
    CHECK(dot.Error().message == "Path traversal attempt detected.");

    auto longname = service->ReadFile(ReadReq(std::string(256, 'a')));
    REQUIRE(longname.IsErr());
    CHECK(longname.Error().message ==
          "Filename length must be between 1 and 255 characters.");
}

TEST_CASE("FileService: ReadFile rejects symlink escape", "[file_service]") {
    TempDir dir;
    TempDir outside;
    outside.Write("secret.txt", "classified");
    fs::create_symlink(outside.Path() / "secret.txt", dir.Path() / "link.txt");
    auto service = MakeService(dir);

    auto r = service->ReadFile(ReadReq("link.txt"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == error_code::kInvalidParams);
    CHECK(r.Error().message == "Path traversal attempt detected (post-symlink).");
}

TEST_CASE("FileService: ReadFile rejects directories", "[file_service]") {
    TempDir dir;
    fs::create_directory(dir.Path() / "sub");
    auto service = MakeService(dir);
    auto r = service->ReadFile(ReadReq("sub"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Path 'sub' is a directory, not a file.");
}

TEST_CASE("FileService: ReadFile size and encoding limits", "[file_service]") {
    TempDir dir;
    dir.Write("big.txt", std::string(2 * 1024 * 1024, 'x'));
    dir.Write("latin1.txt", "caf\xE9");
    auto service = MakeService(dir);

    auto big = service->ReadFile(ReadReq("big.txt"));
    REQUIRE(big.IsErr());
    CHECK(big.Error().code == error_code::kFileSystemError);
    CHECK(big.Error().TypeName() == error_type::kFileTooLarge);
    CHECK(big.Error().message == "File 'big.txt' exceeds maximum allowed size of 1 MB");

    auto latin = service->ReadFile(ReadReq("latin1.txt"));
    REQUIRE(latin.IsErr());
    CHECK(latin.Error().TypeName() == error_type::kInvalidEncoding);
}

// ===========================================================================
// EditFile
// ===========================================================================

TEST_CASE("FileService: EditFile replace, insert and delete", "[file_service]") {
    TempDir dir;
    dir.Write("list.txt", "one\ntwo\nthree\nfour");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "list.txt";
    req.edits = {Op(1, "replace", "ONE"), Op(3, "delete"), Op(4, "insert", "three-and-a-half")};

    auto r = service->EditFile(req);
    REQUIRE(r.IsOk());
    CHECK(r.Value().filename == "list.txt");
    CHECK(r.Value().lines_modified == 3);
    CHECK(r.Value().new_total_lines == 4);
    CHECK_FALSE(r.Value().file_created);
    // Edits refer to the original numbering and apply bottom-up.
    CHECK(dir.Read("list.txt") == "ONE\ntwo\nthree-and-a-half\nfour");
}

TEST_CASE("FileService: EditFile insert at end and case-insensitive ops", "[file_service]") {
    TempDir dir;
    dir.Write("list.txt", "a\nb");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "list.txt";
    req.edits = {Op(3, "INSERT", "c")};
    auto r = service->EditFile(req);
    REQUIRE(r.IsOk());
    CHECK(dir.Read("list.txt") == "a\nb\nc");
}

TEST_CASE("FileService: EditFile unchanged replace is not counted", "[file_service]") {
    TempDir dir;
    dir.Write("same.txt", "keep\nme");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "same.txt";
    req.edits = {Op(1, "replace", "keep")};
    auto r = service->EditFile(req);
    REQUIRE(r.IsOk());
    CHECK(r.Value().lines_modified == 0);
}

TEST_CASE("FileService: EditFile append", "[file_service]") {
    TempDir dir;
    dir.Write("log.txt", "first\n");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "log.txt";
    req.append = "second\nthird\n";
    auto r = service->EditFile(req);
    REQUIRE(r.IsOk());
    CHECK(r.Value().lines_modified == 2);
    CHECK(r.Value().new_total_lines == 3);
    CHECK(dir.Read("log.txt") == "first\nsecond\nthird");
}

TEST_CASE("FileService: EditFile keeps CRLF line endings", "[file_service]") {
    TempDir dir;
    dir.Write("dos.txt", "a\r\nb\r\n");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "dos.txt";
    req.edits = {Op(2, "replace", "B")};
    REQUIRE(service->EditFile(req).IsOk());
    CHECK(dir.Read("dos.txt") == "a\r\nB");
}

TEST_CASE("FileService: EditFile creates missing files on request", "[file_service]") {
    TempDir dir;
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "new.txt";
    req.append = "hello\nworld";

    auto refused = service->EditFile(req);
    REQUIRE(refused.IsErr());
    CHECK(refused.Error().TypeName() == error_type::kFileNotFound);
    CHECK_FALSE(fs::exists(dir.Path() / "new.txt"));

    req.create_if_missing = true;
    auto created = service->EditFile(req);
    REQUIRE(created.IsOk());
    CHECK(created.Value().file_created);
    CHECK(created.Value().lines_modified == 2);
    CHECK(created.Value().new_total_lines == 2);
    CHECK(dir.Read("new.txt") == "hello\nworld");
}

TEST_CASE("FileService: EditFile leaves no temp files and a hidden lock", "[file_service]") {
    TempDir dir;
    dir.Write("x.txt", "1");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "x.txt";
    req.edits = {Op(1, "replace", "2")};
    REQUIRE(service->EditFile(req).IsOk());

    int visible = 0;
    for (const auto& entry : fs::directory_iterator(dir.Path())) {
        const auto name = entry.path().filename().string();
        CHECK(name.find(".tmp.") == std::string::npos);
        if (name[0] != '.') {
            ++visible;
        }
    }
    CHECK(visible == 1);
    CHECK(fs::exists(dir.Path() / ".x.txt.lock"));

    auto listed = service->ListFiles(ListFilesRequest{});
    REQUIRE(listed.IsOk());
    CHECK(listed.Value().size() == 1);
}

TEST_CASE("FileService: EditFile validation errors", "[file_service]") {
    TempDir dir;
    dir.Write("v.txt", "a\nb");
    auto service = MakeService(dir);

    auto edit = [&](EditOperation op) {
        EditFileRequest req;
        req.name = "v.txt";
        req.edits = {std::move(op)};
        return service->EditFile(req);
    };

    auto bad_line = edit(Op(0, "replace", "x"));
    REQUIRE(bad_line.IsErr());
    CHECK(bad_line.Error().message == "Edit operation #1: line number must be 1 or greater.");

    auto bad_op = edit(Op(1, "upsert", "x"));
    REQUIRE(bad_op.IsErr());
    CHECK(bad_op.Error().message ==
          "Edit operation #1: invalid operation 'upsert'. Must be 'replace', 'insert', or 'delete'.");

    auto delete_content = edit(Op(1, "delete", "x"));
    REQUIRE(delete_content.IsErr());
    CHECK(delete_content.Error().message == "Edit operation #1 ('delete'): content must be empty.");

    auto replace_past = edit(Op(3, "replace", "x"));
    REQUIRE(replace_past.IsErr());
    CHECK(replace_past.Error().message == "Edit 'replace': line 3 is out of range (1-2).");

    auto insert_past = edit(Op(4, "insert", "x"));
    REQUIRE(insert_past.IsErr());
    CHECK(insert_past.Error().message ==
          "Edit 'insert': line 4 is out of range (1 to 2 allow insert at 3).");

    auto delete_past = edit(Op(5, "delete"));
    REQUIRE(delete_past.IsErr());
    CHECK(delete_past.Error().message == "Edit 'delete': line 5 is out of range (1-2).");

    // Nothing was written by the failed edits.
    CHECK(dir.Read("v.txt") == "a\nb");
}

TEST_CASE("FileService: EditFile delete on empty file", "[file_service]") {
    TempDir dir;
    dir.Write("empty.txt", "");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "empty.txt";
    req.edits = {Op(1, "delete")};
    auto r = service->EditFile(req);
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Edit 'delete': line 1 is out of range, file is empty.");
}

TEST_CASE("FileService: EditFile rejects invalid UTF-8 content", "[file_service]") {
    TempDir dir;
    dir.Write("u.txt", "ok");
    auto service = MakeService(dir);

    EditFileRequest req;
    req.name = "u.txt";
    req.edits = {Op(1, "replace", "bad\xFF")};
    auto r = service->EditFile(req);
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Edit operation #1: content contains invalid UTF-8 encoding.");

    EditFileRequest append;
    append.name = "u.txt";
    append.append = "\xC0\xAF";
    auto a = service->EditFile(append);
    REQUIRE(a.IsErr());
    CHECK(a.Error().message == "Append content contains invalid UTF-8 encoding.");
}

TEST_CASE("FileService: EditFile times out while another holder has the lock",
          "[file_service]") {
    TempDir dir;
    dir.Write("busy.txt", "x");
    auto service = MakeService(dir);

    auto held = FileLock::Acquire((dir.Path() / ".busy.txt.lock").string(),
                                  std::chrono::milliseconds{100});
    REQUIRE(held.IsOk());

    EditFileRequest req;
    req.name = "busy.txt";
    req.append = "y";
    auto r = service->EditFile(req);
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == error_code::kLockFailed);
    CHECK(r.Error().message ==
          "Could not acquire lock for operation 'edit' on file 'busy.txt'");
}
