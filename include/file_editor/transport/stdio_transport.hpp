#pragma once

#include <file_editor/core/result.hpp>
#include <file_editor/errors/error_detail.hpp>
#include <file_editor/mcp/tool_processor.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace file_editor {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON-RPC over a pair of streams.
//
// One request per line, one response line per non-blank request, written
// in input order. Logs never go to the output stream.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    explicit StdioTransport(const ToolProcessor& processor,
                            std::istream& in = std::cin,
                            std::ostream& out = std::cout);

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    // Blocks until end of input. A stream failure other than EOF is
    // reported as an error.
    [[nodiscard]] Result<void, ErrorDetail> Run();

    // Serialized response for one input line; nullopt for blank lines.
    [[nodiscard]] std::optional<std::string> HandleLine(const std::string& line) const;

private:
    const ToolProcessor& processor_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace file_editor
