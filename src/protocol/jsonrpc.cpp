#include <file_editor/protocol/jsonrpc.hpp>

namespace file_editor {

nlohmann::json JsonRpcErrorData::ToJson() const {
    auto j = nlohmann::json::object();
    if (!filename.empty()) j["filename"] = filename;
    if (!operation.empty()) j["operation"] = operation;
    if (!timestamp.empty()) j["timestamp"] = timestamp;
    if (!details.empty()) j["details"] = details;
    return j;
}

nlohmann::json JsonRpcError::ToJson() const {
    nlohmann::json j = {
        {"code", code},
        {"message", message},
    };
    if (data.has_value()) {
        j["data"] = data->ToJson();
    }
    return j;
}

McpToolResult McpToolResult::Text(std::string text, bool is_error) {
    McpToolResult result;
    result.content.push_back(ToolContent{"text", std::move(text)});
    result.is_error = is_error;
    return result;
}

nlohmann::json McpToolResult::ToJson() const {
    auto items = nlohmann::json::array();
    for (const auto& c : content) {
        items.push_back({{"type", c.type}, {"text", c.text}});
    }
    return {
        {"content", std::move(items)},
        {"isError", is_error},
    };
}

JsonRpcResponse::JsonRpcResponse(
    nlohmann::json id, std::variant<McpToolResult, JsonRpcError> outcome)
    : id_(std::move(id)), outcome_(std::move(outcome)) {}

JsonRpcResponse JsonRpcResponse::Success(nlohmann::json id,
                                         McpToolResult result) {
    return JsonRpcResponse(std::move(id), std::move(result));
}

JsonRpcResponse JsonRpcResponse::Failure(nlohmann::json id,
                                         JsonRpcError error) {
    return JsonRpcResponse(std::move(id), std::move(error));
}

nlohmann::json JsonRpcResponse::ToJson() const {
    nlohmann::json j = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id_},
    };
    if (IsError()) {
        j["error"] = RpcError().ToJson();
    } else {
        j["result"] = ToolResult().ToJson();
    }
    return j;
}

} // namespace file_editor
