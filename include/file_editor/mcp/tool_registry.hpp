#pragma once

#include <file_editor/core/result.hpp>
#include <file_editor/protocol/jsonrpc.hpp>
#include <file_editor/protocol/tool_models.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace file_editor {

// A tool handler takes the raw `arguments` of a tools/call and returns the
// tool result, or a protocol error when the arguments cannot be decoded.
using ToolHandler = std::function<Result<McpToolResult, JsonRpcError>(
    const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: tool definitions in registration order plus their
// handlers. Filled once at startup, read-only afterwards.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(ToolDefinition definition, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDefinition>& Tools() const noexcept {
        return definitions_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Unknown names yield an isError tool result, not a protocol error.
    [[nodiscard]] Result<McpToolResult, JsonRpcError> Execute(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    std::vector<ToolDefinition> definitions_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace file_editor
