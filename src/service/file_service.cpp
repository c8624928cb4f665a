#include <file_editor/service/file_service.hpp>

#include <file_editor/core/log.hpp>
#include <file_editor/core/time_format.hpp>
#include <file_editor/errors/error_catalog.hpp>
#include <file_editor/service/file_lock.hpp>
#include <file_editor/service/line_utils.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

namespace file_editor {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxFilenameLength = 255;
constexpr std::string_view kComponent = log_component::kFileService;

bool IsFilenameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

bool IsPermissionErrno(int err) {
    return err == EACCES || err == EPERM;
}

struct FileStat {
    bool is_dir = false;
    std::int64_t size = 0;
    std::time_t mtime = 0;
    mode_t mode = 0;
};

// stat(2), following symlinks. Err carries errno (ENOENT when missing).
Result<FileStat, int> StatPath(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return Result<FileStat, int>::Err(errno);
    }
    FileStat out;
    out.is_dir = S_ISDIR(st.st_mode);
    out.size = static_cast<std::int64_t>(st.st_size);
    out.mtime = st.st_mtime;
    out.mode = st.st_mode;
    return Result<FileStat, int>::Ok(out);
}

Result<std::string, int> ReadWholeFile(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) {
        return Result<std::string, int>::Err(errno);
    }
    std::string content;
    char buf[64 * 1024];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        content.append(buf, n);
    }
    const bool failed = std::ferror(f) != 0;
    const int err = errno;
    std::fclose(f);
    if (failed) {
        return Result<std::string, int>::Err(err == 0 ? EIO : err);
    }
    return Result<std::string, int>::Ok(std::move(content));
}

// Write to a hidden temp file beside `path`, rename over it, then set
// mode 0644. Err carries errno.
Result<void, int> WriteFileAtomic(const std::string& path,
                                  const std::string& content) {
    static std::atomic<unsigned> counter{0};
    const fs::path target(path);
    const auto tmp = (target.parent_path() /
                      ("." + target.filename().string() + ".tmp." +
                       std::to_string(::getpid()) + "." +
                       std::to_string(counter.fetch_add(1))))
                         .string();

    std::FILE* f = std::fopen(tmp.c_str(), "wb");
    if (f == nullptr) {
        return Result<void, int>::Err(errno);
    }
    const bool wrote =
        content.empty() ||
        std::fwrite(content.data(), 1, content.size(), f) == content.size();
    const int write_err = errno;
    if (std::fclose(f) != 0 || !wrote) {
        const int err = wrote ? errno : write_err;
        std::remove(tmp.c_str());
        return Result<void, int>::Err(err == 0 ? EIO : err);
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        std::remove(tmp.c_str());
        return Result<void, int>::Err(err);
    }
    if (::chmod(path.c_str(), 0644) != 0) {
        return Result<void, int>::Err(errno);
    }
    return Result<void, int>::Ok();
}

// Permission errors map to permission_denied, everything else to an untyped
// filesystem error.
ErrorDetail ErrnoToDetail(int err, const std::string& filename,
                          const std::string& operation,
                          const std::string& what) {
    if (IsPermissionErrno(err)) {
        return NewPermissionDeniedError(filename, operation);
    }
    return NewFileSystemError(filename, operation,
                              what + ": " + std::strerror(err));
}

bool IsInside(const fs::path& root, const fs::path& p) {
    auto r = root.begin();
    auto q = p.begin();
    for (; r != root.end(); ++r, ++q) {
        if (q == p.end() || *r != *q) {
            return false;
        }
    }
    return q != p.end();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Result<std::unique_ptr<FileService>, ErrorDetail> FileService::Create(
    FileServiceOptions options) {
    using R = Result<std::unique_ptr<FileService>, ErrorDetail>;
    const auto& dir = options.working_directory;
    if (dir.empty()) {
        return R::Err(NewFileSystemError(dir, "init",
                                         "working directory is required"));
    }

    std::error_code ec;
    auto canonical = fs::canonical(fs::absolute(dir, ec), ec);
    if (ec) {
        return R::Err(NewFileSystemError(
            dir, "init", "working directory does not exist: " + dir));
    }
    if (!fs::is_directory(canonical, ec)) {
        return R::Err(NewFileSystemError(
            dir, "init", "working directory path is not a directory: " +
                             canonical.string()));
    }
    if (::access(canonical.c_str(), W_OK) != 0) {
        return R::Err(NewFileSystemError(
            dir, "init", "working directory is not writable: " +
                             canonical.string()));
    }
    if (options.max_file_size_bytes <= 0 || options.max_line_count <= 0 ||
        options.max_edits <= 0) {
        return R::Err(NewInternalError("file service limits must be positive"));
    }

    options.working_directory = canonical.string();
    LogInfo(kComponent, "Serving files from " + options.working_directory);
    return R::Ok(std::unique_ptr<FileService>(new FileService(std::move(options))));
}

FileService::FileService(FileServiceOptions options)
    : options_(std::move(options)) {}

int FileService::MaxFileSizeMb() const noexcept {
    return static_cast<int>(options_.max_file_size_bytes / (1024 * 1024));
}

// ---------------------------------------------------------------------------
// Path resolution
// ---------------------------------------------------------------------------
Result<std::string, ErrorDetail> FileService::ResolvePath(
    const std::string& name) const {
    using R = Result<std::string, ErrorDetail>;
    const char* op = "path_resolution";

    if (name.empty() ||
        !std::all_of(name.begin(), name.end(), IsFilenameChar)) {
        return R::Err(NewInvalidParamsError(
            "Filename contains invalid characters.",
            nlohmann::json{{"filename", name}}, name, op));
    }
    if (name.size() > kMaxFilenameLength) {
        return R::Err(NewInvalidParamsError(
            "Filename length must be between 1 and " +
                std::to_string(kMaxFilenameLength) + " characters.",
            nlohmann::json{{"filename", name}, {"length", std::to_string(name.size())}},
            name, op));
    }
    if (name == "." || name == "..") {
        return R::Err(NewInvalidParamsError(
            "Path traversal attempt detected.",
            nlohmann::json{{"filename", name}}, name, op));
    }

    const fs::path root(options_.working_directory);
    const fs::path path = root / name;

    std::error_code ec;
    const auto link_status = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return R::Err(ErrnoToDetail(ec.value(), name, "eval_symlinks",
                                    "Error evaluating symlinks"));
    }
    if (!fs::exists(link_status)) {
        // Nothing on disk yet; the name alone cannot escape.
        return R::Ok(path.string());
    }

    const auto resolved = fs::canonical(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return R::Err(NewFileNotFoundError(name, "eval_symlinks_path_not_found"));
        }
        return R::Err(ErrnoToDetail(ec.value(), name, "eval_symlinks",
                                    "Error evaluating symlinks"));
    }
    if (resolved != root && !IsInside(root, resolved)) {
        return R::Err(NewInvalidParamsError(
            "Path traversal attempt detected (post-symlink).",
            nlohmann::json{{"filename", name}, {"resolved_path", resolved.string()}},
            name, op));
    }
    return R::Ok(path.string());
}

// ---------------------------------------------------------------------------
// ListFiles
// ---------------------------------------------------------------------------
Result<std::vector<FileInfo>, ErrorDetail> FileService::ListFiles(
    const ListFilesRequest& /*request*/) {
    using R = Result<std::vector<FileInfo>, ErrorDetail>;
    const auto& dir = options_.working_directory;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return R::Err(ErrnoToDetail(ec.value(), dir, "list_dir",
                                    "Failed to list directory"));
    }

    std::vector<FileInfo> files;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        const auto& entry = *it;
        const auto name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        if (entry.is_symlink(ec) && ResolvePath(name).IsErr()) {
            continue;
        }
        auto st = StatPath(entry.path().string());
        if (st.IsErr() || st.Value().is_dir) {
            continue;
        }
        const auto& stat = st.Value();

        FileInfo info;
        info.name = name;
        info.size = stat.size;
        info.modified = FormatRfc3339Utc(stat.mtime);
        info.readable = (stat.mode & S_IRUSR) != 0;
        info.writable = (stat.mode & S_IWUSR) != 0;
        info.lines = -1;

        if (stat.size == 0) {
            info.lines = 0;
        } else if (stat.size <= options_.max_file_size_bytes) {
            auto content = ReadWholeFile(entry.path().string());
            if (content.IsOk() && IsValidUtf8(content.Value())) {
                const auto count = SplitLines(content.Value()).size();
                if (count <= static_cast<std::size_t>(options_.max_line_count)) {
                    info.lines = static_cast<int>(count);
                }
            } else if (content.IsErr()) {
                LogDebug(kComponent, "Cannot count lines of " + name + ": " +
                                         std::strerror(content.Error()));
            }
        }
        files.push_back(std::move(info));
    }
    if (ec) {
        return R::Err(ErrnoToDetail(ec.value(), dir, "list_dir",
                                    "Failed to list directory"));
    }

    std::sort(files.begin(), files.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });
    return R::Ok(std::move(files));
}

// ---------------------------------------------------------------------------
// ReadFile
// ---------------------------------------------------------------------------
Result<ReadFileOutcome, ErrorDetail> FileService::ReadFile(
    const ReadFileRequest& request) {
    using R = Result<ReadFileOutcome, ErrorDetail>;
    const auto& name = request.name;
    const char* validation = "read_validation";

    auto path_result = ResolvePath(name);
    if (path_result.IsErr()) {
        return R::Err(std::move(path_result).Error());
    }
    const auto path = std::move(path_result).Value();

    const int req_start = request.start_line;
    const int req_end = request.end_line;
    const bool is_range = req_start != 0 || req_end != 0;
    const nlohmann::json requested = {{"start_line", req_start}, {"end_line", req_end}};

    if (req_start < 0 || req_end < 0) {
        return R::Err(NewInvalidParamsError(
            "Line numbers must be 1 or greater if specified.", requested, name,
            validation));
    }
    if (req_start > 0 && req_end > 0 && req_start > req_end) {
        return R::Err(NewInvalidParamsError(
            "start_line cannot be greater than end_line.", requested, name,
            validation));
    }

    auto st = StatPath(path);
    if (st.IsErr()) {
        if (st.Error() == ENOENT || st.Error() == ENOTDIR) {
            return R::Err(NewFileNotFoundError(name, "read"));
        }
        return R::Err(ErrnoToDetail(st.Error(), name, "get_stats",
                                    "Error getting file stats"));
    }
    if (st.Value().is_dir) {
        return R::Err(NewInvalidParamsError(
            "Path '" + name + "' is a directory, not a file.",
            nlohmann::json{{"filename", name}}, name, validation));
    }
    if (st.Value().size > options_.max_file_size_bytes) {
        return R::Err(NewFileTooLargeError(name, "read", st.Value().size,
                                           MaxFileSizeMb()));
    }

    auto bytes = ReadWholeFile(path).MapError([&name](int err) {
        return ErrnoToDetail(err, name, "read_bytes", "Error reading file content");
    });
    if (bytes.IsErr()) {
        return R::Err(std::move(bytes).Error());
    }
    if (!IsValidUtf8(bytes.Value())) {
        return R::Err(NewInvalidEncodingError(name, "read",
                                              "File content is not valid UTF-8"));
    }

    const auto lines = SplitLines(bytes.Value());
    const int total = static_cast<int>(lines.size());
    if (total > options_.max_line_count) {
        return R::Err(NewInvalidParamsError(
            "File exceeds maximum line count of " +
                std::to_string(options_.max_line_count) + ".",
            nlohmann::json{{"filename", name},
                           {"line_count", total},
                           {"max_line_count", options_.max_line_count}},
            name, validation));
    }

    int start = req_start;
    int end = req_end;
    if (!is_range) {
        start = 1;
        end = total;
    } else {
        if (start == 0) start = 1;
        if (end == 0) end = total;
    }

    if (total == 0) {
        // An empty file only supports a whole read (or an explicit 1-0).
        if (start > 1 || (start == 1 && end > 0 && is_range)) {
            return R::Err(NewInvalidParamsError(
                "start_line " + std::to_string(req_start) +
                    " is invalid for an empty file.",
                nlohmann::json{{"filename", name},
                               {"start_line", req_start},
                               {"total_lines", total}},
                name, validation));
        }
        start = 1;
        end = 0;
    } else {
        if (start > total) {
            return R::Err(NewInvalidParamsError(
                "start_line " + std::to_string(start) +
                    " is greater than total lines " + std::to_string(total) + ".",
                nlohmann::json{{"filename", name},
                               {"start_line", start},
                               {"total_lines", total}},
                name, validation));
        }
        end = std::min(end, total);
    }

    ReadFileOutcome out;
    out.filename = name;
    out.total_lines = total;
    out.requested_start = req_start;
    out.requested_end = req_end;
    out.is_range = is_range;

    if (total == 0 || start > end) {
        out.actual_end = -1;
    } else {
        const std::vector<std::string> selected(lines.begin() + (start - 1),
                                                lines.begin() + end);
        out.content = JoinLines(selected);
        out.actual_end = end - 1;
    }
    return R::Ok(std::move(out));
}

// ---------------------------------------------------------------------------
// EditFile
// ---------------------------------------------------------------------------
Result<EditFileOutcome, ErrorDetail> FileService::EditFile(
    const EditFileRequest& request) {
    using R = Result<EditFileOutcome, ErrorDetail>;
    const auto& name = request.name;
    const char* validation = "edit_validation";

    auto path_result = ResolvePath(name);
    if (path_result.IsErr()) {
        return R::Err(std::move(path_result).Error());
    }
    const auto path = std::move(path_result).Value();

    if (request.edits.size() > static_cast<std::size_t>(options_.max_edits)) {
        return R::Err(NewInvalidParamsError(
            "Number of edits exceeds maximum allowed of " +
                std::to_string(options_.max_edits) + ".",
            nlohmann::json{{"num_edits", request.edits.size()},
                           {"max_edits", options_.max_edits}},
            name, validation));
    }

    // Validate and normalize every edit before touching the file.
    std::vector<EditOperation> edits = request.edits;
    for (std::size_t i = 0; i < edits.size(); ++i) {
        auto& edit = edits[i];
        const auto label = "Edit operation #" + std::to_string(i + 1);
        if (edit.line < 1) {
            return R::Err(NewInvalidParamsError(
                label + ": line number must be 1 or greater.",
                nlohmann::json{{"edit_index", i}, {"line", edit.line}}, name,
                validation));
        }
        std::string op = edit.operation;
        std::transform(op.begin(), op.end(), op.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (op != "replace" && op != "insert" && op != "delete") {
            return R::Err(NewInvalidParamsError(
                label + ": invalid operation '" + edit.operation +
                    "'. Must be 'replace', 'insert', or 'delete'.",
                nlohmann::json{{"edit_index", i}, {"operation", edit.operation}},
                name, validation));
        }
        edit.operation = op;
        if (op == "delete" && !edit.content.empty()) {
            return R::Err(NewInvalidParamsError(
                label + " ('delete'): content must be empty.",
                nlohmann::json{{"edit_index", i}}, name, validation));
        }
        if (!IsValidUtf8(edit.content)) {
            return R::Err(NewInvalidParamsError(
                label + ": content contains invalid UTF-8 encoding.",
                nlohmann::json{{"edit_index", i}}, name, validation));
        }
    }
    if (!IsValidUtf8(request.append)) {
        return R::Err(NewInvalidParamsError(
            "Append content contains invalid UTF-8 encoding.", std::nullopt,
            name, validation));
    }

    auto lock = FileLock::Acquire(FileLock::LockPathFor(path),
                                  options_.operation_timeout);
    if (lock.IsErr()) {
        LogWarn(kComponent, "Lock for " + name + " not acquired: " + lock.Error());
        return R::Err(NewLockFailedError(name, "edit", lock.Error()));
    }

    std::vector<std::string> lines;
    std::string line_ending = "\n";
    bool created = false;

    auto st = StatPath(path);
    if (st.IsOk()) {
        if (st.Value().is_dir) {
            return R::Err(NewInvalidParamsError(
                "Path '" + name + "' is a directory, not a file.",
                nlohmann::json{{"filename", name}}, name, validation));
        }
        if (st.Value().size > options_.max_file_size_bytes) {
            return R::Err(NewFileTooLargeError(name, "read_for_edit",
                                               st.Value().size, MaxFileSizeMb()));
        }
        auto bytes = ReadWholeFile(path).MapError([&name](int err) {
            return ErrnoToDetail(err, name, "read_bytes_on_edit",
                                 "Error reading file content");
        });
        if (bytes.IsErr()) {
            return R::Err(std::move(bytes).Error());
        }
        if (!IsValidUtf8(bytes.Value())) {
            return R::Err(NewInvalidEncodingError(
                name, "read_for_edit", "File content is not valid UTF-8"));
        }
        line_ending = DetectLineEnding(bytes.Value());
        lines = SplitLines(bytes.Value());
    } else if (st.Error() == ENOENT) {
        if (!request.create_if_missing) {
            return R::Err(NewFileNotFoundError(name, "edit"));
        }
        created = true;
    } else {
        return R::Err(ErrnoToDetail(st.Error(), name, "check_exists_on_edit",
                                    "Error checking file existence"));
    }

    const int original_count = static_cast<int>(lines.size());
    if (!created && original_count > options_.max_line_count) {
        return R::Err(NewInvalidParamsError(
            "File exceeds maximum line count of " +
                std::to_string(options_.max_line_count) + " before edits.",
            nlohmann::json{{"filename", name},
                           {"line_count", original_count},
                           {"max_line_count", options_.max_line_count}},
            name, validation));
    }

    // Bottom-up so that earlier line numbers stay valid.
    std::stable_sort(edits.begin(), edits.end(),
                     [](const EditOperation& a, const EditOperation& b) {
                         return a.line > b.line;
                     });

    int modified = 0;
    for (const auto& edit : edits) {
        const auto index = static_cast<std::size_t>(edit.line - 1);
        const int count = static_cast<int>(lines.size());
        const nlohmann::json where = {
            {"filename", name}, {"line", edit.line}, {"total_lines", count}};

        if (edit.operation == "replace") {
            if (index >= lines.size()) {
                return R::Err(NewInvalidParamsError(
                    "Edit 'replace': line " + std::to_string(edit.line) +
                        " is out of range (1-" + std::to_string(count) + ").",
                    where, name, validation));
            }
            if (lines[index] != edit.content) {
                lines[index] = edit.content;
                ++modified;
            }
        } else if (edit.operation == "insert") {
            if (index > lines.size()) {
                return R::Err(NewInvalidParamsError(
                    "Edit 'insert': line " + std::to_string(edit.line) +
                        " is out of range (1 to " + std::to_string(count) +
                        " allow insert at " + std::to_string(count + 1) + ").",
                    where, name, validation));
            }
            lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(index),
                         edit.content);
            ++modified;
        } else {
            if (lines.empty()) {
                return R::Err(NewInvalidParamsError(
                    "Edit 'delete': line " + std::to_string(edit.line) +
                        " is out of range, file is empty.",
                    where, name, validation));
            }
            if (index >= lines.size()) {
                return R::Err(NewInvalidParamsError(
                    "Edit 'delete': line " + std::to_string(edit.line) +
                        " is out of range (1-" + std::to_string(count) + ").",
                    where, name, validation));
            }
            lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(index));
            ++modified;
        }
    }

    if (!request.append.empty()) {
        auto appended = SplitLines(request.append);
        modified += static_cast<int>(appended.size());
        lines.insert(lines.end(), std::make_move_iterator(appended.begin()),
                     std::make_move_iterator(appended.end()));
    }

    const int new_total = static_cast<int>(lines.size());
    if (new_total > options_.max_line_count) {
        return R::Err(NewInvalidParamsError(
            "Edit results in file exceeding maximum line count of " +
                std::to_string(options_.max_line_count) + " (new count: " +
                std::to_string(new_total) + ").",
            nlohmann::json{{"filename", name},
                           {"new_line_count", new_total},
                           {"max_line_count", options_.max_line_count}},
            name, validation));
    }

    auto content = JoinLines(lines);
    if (line_ending != "\n") {
        std::string converted;
        converted.reserve(content.size() + lines.size());
        for (char c : content) {
            if (c == '\n') {
                converted += line_ending;
            } else {
                converted.push_back(c);
            }
        }
        content = std::move(converted);
    }

    if (static_cast<std::int64_t>(content.size()) > options_.max_file_size_bytes) {
        return R::Err(NewFileTooLargeError(
            name, "edit_write", static_cast<std::int64_t>(content.size()),
            MaxFileSizeMb()));
    }

    auto written = WriteFileAtomic(path, content);
    if (written.IsErr()) {
        return R::Err(ErrnoToDetail(written.Error(), name, "write_atomic",
                                    "Error writing file"));
    }

    EditFileOutcome out;
    out.filename = name;
    out.new_total_lines = new_total;
    out.file_created = created;
    out.lines_modified = created ? new_total : modified;

    LogDebug(kComponent, "Edited " + name + ": " + std::to_string(out.lines_modified) +
                             " lines modified, " + std::to_string(new_total) +
                             " total");
    return R::Ok(std::move(out));
}

} // namespace file_editor
