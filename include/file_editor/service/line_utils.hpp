#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace file_editor {

// Convert "\r\n" and lone "\r" to "\n".
std::string NormalizeNewlines(std::string_view content);

// Split into lines after normalizing newlines. A single trailing newline
// does not produce an extra empty line; "" yields no lines and "\n" yields
// one empty line.
std::vector<std::string> SplitLines(std::string_view content);

// Join with "\n", no trailing newline.
std::string JoinLines(const std::vector<std::string>& lines);

// Dominant line ending of existing content: "\r\n", "\r" or "\n".
std::string DetectLineEnding(std::string_view content);

// Strict UTF-8 check (no overlongs, no surrogates, max U+10FFFF).
bool IsValidUtf8(std::string_view content);

} // namespace file_editor
