#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace file_editor {

inline constexpr const char* kJsonRpcVersion = "2.0";

// ---------------------------------------------------------------------------
// JsonRpcErrorData: the fixed set of context fields carried by a JSON-RPC
// error object. Empty fields are omitted on the wire.
// ---------------------------------------------------------------------------
struct JsonRpcErrorData {
    std::string filename;
    std::string operation;
    std::string timestamp;
    std::string details;

    [[nodiscard]] nlohmann::json ToJson() const;

    bool operator==(const JsonRpcErrorData& other) const {
        return filename == other.filename && operation == other.operation &&
               timestamp == other.timestamp && details == other.details;
    }
};

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<JsonRpcErrorData> data;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// McpToolResult: {content: [{type, text}], isError}.
// ---------------------------------------------------------------------------
struct ToolContent {
    std::string type = "text";
    std::string text;
};

struct McpToolResult {
    std::vector<ToolContent> content;
    bool is_error = false;

    // A result holding a single text block.
    static McpToolResult Text(std::string text, bool is_error = false);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// JsonRpcRequest: decoded envelope. `params` stays raw JSON until the
// method has been resolved; nullopt means the member was absent.
// ---------------------------------------------------------------------------
struct JsonRpcRequest {
    std::string jsonrpc;
    nlohmann::json id;  // null when absent
    std::string method;
    std::optional<nlohmann::json> params;
};

// ---------------------------------------------------------------------------
// JsonRpcResponse: exactly one of result or error.
// ---------------------------------------------------------------------------
class JsonRpcResponse {
public:
    static JsonRpcResponse Success(nlohmann::json id, McpToolResult result);
    static JsonRpcResponse Failure(nlohmann::json id, JsonRpcError error);

    [[nodiscard]] const nlohmann::json& Id() const noexcept { return id_; }
    [[nodiscard]] bool IsError() const noexcept { return outcome_.index() == 1; }
    [[nodiscard]] const McpToolResult& ToolResult() const {
        return std::get<0>(outcome_);
    }
    [[nodiscard]] const JsonRpcError& RpcError() const {
        return std::get<1>(outcome_);
    }

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    JsonRpcResponse(nlohmann::json id,
                    std::variant<McpToolResult, JsonRpcError> outcome);

    nlohmann::json id_;
    std::variant<McpToolResult, JsonRpcError> outcome_;
};

} // namespace file_editor
