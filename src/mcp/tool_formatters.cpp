#include <file_editor/mcp/tool_formatters.hpp>

#include <algorithm>
#include <sstream>

namespace file_editor {

std::string FormatListFilesResult(const std::vector<FileInfo>& files) {
    if (files.empty()) {
        return "Total files: 0";
    }
    std::ostringstream oss;
    oss << "Files in directory:\n\n";
    for (const auto& f : files) {
        oss << "name: " << f.name << ", modified: " << f.modified << ", lines: ";
        if (f.lines == -1) {
            oss << "(unknown)";
        } else {
            oss << f.lines;
        }
        oss << '\n';
    }
    oss << "\nTotal files: " << files.size();
    return oss.str();
}

std::string FormatReadFileResult(const std::string& content,
                                 const std::string& filename,
                                 int total_lines,
                                 int requested_start,
                                 int /*requested_end*/,
                                 int actual_end,
                                 bool is_range) {
    if (total_lines == 0 && !is_range) {
        return "File: " + filename + " (0 lines)\n\n";
    }

    std::ostringstream oss;
    if (is_range) {
        int start = 1;
        int end = 0;
        if (content.empty() && requested_start > 0) {
            start = requested_start;
            end = std::max(requested_start - 1, 0);
        } else if (content.empty()) {
            // Covers both "only end_line given" and an unset range.
            start = 1;
            end = 0;
        } else {
            start = requested_start > 0 ? requested_start : 1;
            const int shown = static_cast<int>(
                std::count(content.begin(), content.end(), '\n')) + 1;
            end = std::max(start + shown - 1, actual_end + 1);
        }
        oss << "File: " << filename << " (lines " << start << '-' << end
            << " of " << total_lines << " total)";
    } else {
        oss << "File: " << filename << " (" << total_lines << " lines)";
    }

    oss << "\n\n";
    if (!content.empty()) {
        oss << content;
    }
    return oss.str();
}

std::string FormatReadFileResult(const ReadFileOutcome& outcome) {
    return FormatReadFileResult(outcome.content, outcome.filename,
                                outcome.total_lines, outcome.requested_start,
                                outcome.requested_end, outcome.actual_end,
                                outcome.is_range);
}

std::string FormatEditFileResult(const std::string& filename,
                                 int lines_modified,
                                 int new_total_lines,
                                 bool file_created) {
    std::ostringstream oss;
    oss << "File edited successfully: " << filename
        << "\nLines modified: " << lines_modified
        << "\nTotal lines: " << new_total_lines
        << "\nFile created: " << (file_created ? "true" : "false");
    return oss.str();
}

std::string FormatToolError(const ErrorDetail* detail) {
    if (detail == nullptr) {
        return "Error: An unexpected error occurred, but no details were provided.";
    }
    return "Error: " + detail->message;
}

} // namespace file_editor
