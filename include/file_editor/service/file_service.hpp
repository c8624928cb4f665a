#pragma once

#include <file_editor/service/file_operation_service.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace file_editor {

struct FileServiceOptions {
    std::string working_directory;
    std::int64_t max_file_size_bytes = 10LL * 1024 * 1024;
    int max_line_count = 100000;
    int max_edits = 1000;
    std::chrono::milliseconds operation_timeout{10000};
};

// ---------------------------------------------------------------------------
// FileService: IFileOperationService over a single working directory.
//
// Files are addressed by bare name (no separators); every resolved path
// must stay inside the working directory, symlinks included. Edits hold an
// exclusive FileLock and are written atomically (temp file + rename).
// ---------------------------------------------------------------------------
class FileService : public IFileOperationService {
public:
    // Fails when the working directory is missing, not a directory or not
    // writable.
    static Result<std::unique_ptr<FileService>, ErrorDetail> Create(
        FileServiceOptions options);

    [[nodiscard]] Result<std::vector<FileInfo>, ErrorDetail> ListFiles(
        const ListFilesRequest& request) override;

    [[nodiscard]] Result<ReadFileOutcome, ErrorDetail> ReadFile(
        const ReadFileRequest& request) override;

    [[nodiscard]] Result<EditFileOutcome, ErrorDetail> EditFile(
        const EditFileRequest& request) override;

    [[nodiscard]] const std::string& WorkingDirectory() const noexcept {
        return options_.working_directory;
    }

private:
    explicit FileService(FileServiceOptions options);

    // Validate `name` and map it to an absolute path inside the working
    // directory.
    [[nodiscard]] Result<std::string, ErrorDetail> ResolvePath(
        const std::string& name) const;

    [[nodiscard]] int MaxFileSizeMb() const noexcept;

    FileServiceOptions options_;
};

} // namespace file_editor
