#pragma once

#include <file_editor/core/result.hpp>
#include <file_editor/mcp/tool_registry.hpp>
#include <file_editor/protocol/jsonrpc.hpp>
#include <file_editor/protocol/tool_models.hpp>
#include <file_editor/service/file_operation_service.hpp>

#include <string>
#include <vector>

namespace file_editor {

inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "file-editing-server";
inline constexpr const char* kServerDescription =
    "High-performance file editing server for AI agents";

// ---------------------------------------------------------------------------
// ToolProcessor: MCP method dispatch shared by every transport.
//
// Handles:
//   - initialize
//   - tools/list
//   - tools/call (list_files, read_file, edit_file)
//
// Protocol failures come back as JsonRpcError; business failures from the
// file service become isError tool results. No state is kept between
// requests.
// ---------------------------------------------------------------------------
class ToolProcessor {
public:
    explicit ToolProcessor(IFileOperationService& service);

    ToolProcessor(const ToolProcessor&) = delete;
    ToolProcessor& operator=(const ToolProcessor&) = delete;

    [[nodiscard]] Result<McpToolResult, JsonRpcError> ProcessRequest(
        const JsonRpcRequest& request) const;

    // Envelope validation followed by ProcessRequest, packaged as the
    // response to send back. An invalid envelope is -32600 with the
    // request's id preserved.
    [[nodiscard]] JsonRpcResponse HandleRequest(const JsonRpcRequest& request) const;

    // Typed entry points, used by tools/call and the REST routes.
    [[nodiscard]] McpToolResult CallListFiles(const ListFilesRequest& request) const;
    [[nodiscard]] McpToolResult CallReadFile(const ReadFileRequest& request) const;
    [[nodiscard]] McpToolResult CallEditFile(const EditFileRequest& request) const;

    // The three tool definitions in advertised order.
    static const std::vector<ToolDefinition>& Definitions();

    [[nodiscard]] const ToolRegistry& Registry() const noexcept {
        return registry_;
    }

private:
    [[nodiscard]] Result<McpToolResult, JsonRpcError> HandleToolsCall(
        const JsonRpcRequest& request) const;

    IFileOperationService& service_;
    ToolRegistry registry_;
};

// Compact JSON text of a response. When the payload cannot be serialised
// (e.g. invalid UTF-8 in a string), an internal-error response for the same
// id is returned instead.
std::string SerializeResponse(const JsonRpcResponse& response);

} // namespace file_editor
