#pragma once

#include <file_editor/errors/error_detail.hpp>
#include <file_editor/service/file_operation_service.hpp>

#include <string>
#include <vector>

namespace file_editor {

// Canonical text renderings of tool outcomes. Clients parse these strings,
// so the exact layout is part of the protocol.

std::string FormatListFilesResult(const std::vector<FileInfo>& files);

// A range whose content came back empty is displayed as
// "lines <start>-<start - 1>", e.g. "lines 10-9".
std::string FormatReadFileResult(const std::string& content,
                                 const std::string& filename,
                                 int total_lines,
                                 int requested_start,
                                 int requested_end,
                                 int actual_end,
                                 bool is_range);

std::string FormatReadFileResult(const ReadFileOutcome& outcome);

std::string FormatEditFileResult(const std::string& filename,
                                 int lines_modified,
                                 int new_total_lines,
                                 bool file_created);

// "Error: <message>"; a null detail gets a generic message.
std::string FormatToolError(const ErrorDetail* detail);

} // namespace file_editor
