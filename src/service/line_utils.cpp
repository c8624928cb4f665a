#include <file_editor/service/line_utils.hpp>

namespace file_editor {

std::string NormalizeNewlines(std::string_view content) {
    std::string out;
    out.reserve(content.size());
    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> SplitLines(std::string_view content) {
    std::vector<std::string> lines;
    if (content.empty()) {
        return lines;
    }
    const auto normalized = NormalizeNewlines(content);

    std::size_t start = 0;
    while (true) {
        const auto nl = normalized.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(normalized.substr(start));
            break;
        }
        lines.push_back(normalized.substr(start, nl - start));
        start = nl + 1;
    }

    // "a\n" splits into {"a", ""}; the trailing piece is not a line.
    // "\n" alone stays as one empty line.
    if (normalized.back() == '\n' && lines.size() > 1) {
        lines.pop_back();
    }
    return lines;
}

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

std::string DetectLineEnding(std::string_view content) {
    const auto cr = content.find('\r');
    if (cr == std::string_view::npos) {
        return "\n";
    }
    if (cr + 1 < content.size() && content[cr + 1] == '\n') {
        return "\r\n";
    }
    const auto lf = content.find('\n');
    if (lf != std::string_view::npos && lf < cr) {
        return "\n";
    }
    return "\r";
}

bool IsValidUtf8(std::string_view content) {
    const std::size_t n = content.size();
    const auto byte = [&content](std::size_t at) {
        return static_cast<unsigned char>(content[at]);
    };
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = byte(i);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;  // no surrogates
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        if (byte(i + 1) < lo || byte(i + 1) > hi) {
            return false;
        }
        for (std::size_t k = 2; k < len; ++k) {
            if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

} // namespace file_editor
