#include <file_editor/mcp/tool_registry.hpp>

#include <file_editor/core/log.hpp>
#include <file_editor/errors/error_catalog.hpp>

namespace file_editor {

void ToolRegistry::Register(ToolDefinition definition, ToolHandler handler) {
    handlers_[definition.name] = std::move(handler);
    definitions_.push_back(std::move(definition));
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<McpToolResult, JsonRpcError> ToolRegistry::Execute(
    const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<McpToolResult, JsonRpcError>::Ok(
            McpToolResult::Text("Error: Unknown tool '" + name + "'.", true));
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError(log_component::kProcessor, "Tool '" + name + "' failed: " + e.what());
        const auto detail = NewInternalError(
            std::string("Tool '") + name + "' failed: " + e.what());
        return Result<McpToolResult, JsonRpcError>::Err(*ToJsonRpcError(&detail));
    }
}

} // namespace file_editor
