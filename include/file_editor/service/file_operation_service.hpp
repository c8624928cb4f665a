#pragma once

#include <file_editor/core/result.hpp>
#include <file_editor/errors/error_detail.hpp>
#include <file_editor/protocol/tool_models.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace file_editor {

// ---------------------------------------------------------------------------
// FileInfo: one entry of a directory listing.
// ---------------------------------------------------------------------------
struct FileInfo {
    std::string name;
    std::int64_t size = 0;
    std::string modified;  // RFC3339 UTC
    bool readable = false;
    bool writable = false;
    int lines = -1;        // -1 when the count is unknown
};

// ---------------------------------------------------------------------------
// ReadFileOutcome: selected content plus everything needed to render the
// header. requested_start/requested_end echo the request (0 = unset);
// actual_end is the zero-based index of the last returned line, -1 if none.
// ---------------------------------------------------------------------------
struct ReadFileOutcome {
    std::string content;
    std::string filename;
    int total_lines = 0;
    int requested_start = 0;
    int requested_end = 0;
    int actual_end = -1;
    bool is_range = false;
};

struct EditFileOutcome {
    std::string filename;
    int lines_modified = 0;
    int new_total_lines = 0;
    bool file_created = false;
};

// ---------------------------------------------------------------------------
// IFileOperationService: the file capability consumed by the tool
// processor. Business failures are returned as ErrorDetail values; nothing
// is thrown.
// ---------------------------------------------------------------------------
class IFileOperationService {
public:
    virtual ~IFileOperationService() = default;

    // Non-copyable, non-movable (polymorphic base).
    IFileOperationService(const IFileOperationService&) = delete;
    IFileOperationService& operator=(const IFileOperationService&) = delete;
    IFileOperationService(IFileOperationService&&) = delete;
    IFileOperationService& operator=(IFileOperationService&&) = delete;

    [[nodiscard]] virtual Result<std::vector<FileInfo>, ErrorDetail> ListFiles(
        const ListFilesRequest& request) = 0;

    [[nodiscard]] virtual Result<ReadFileOutcome, ErrorDetail> ReadFile(
        const ReadFileRequest& request) = 0;

    [[nodiscard]] virtual Result<EditFileOutcome, ErrorDetail> EditFile(
        const EditFileRequest& request) = 0;

protected:
    IFileOperationService() = default;
};

} // namespace file_editor
