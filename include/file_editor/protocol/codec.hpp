#pragma once

#include <file_editor/core/result.hpp>
#include <file_editor/protocol/jsonrpc.hpp>
#include <file_editor/protocol/tool_models.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace file_editor {

// How a decoder treats object members it does not know.
enum class UnknownFields {
    Ignore,
    Reject,
};

// Decoders check JSON types only. Value constraints (line >= 1, filename
// pattern, operation names) belong to the file service. Errors are
// human-readable reasons.

Result<JsonRpcRequest, std::string> DecodeRequest(
    const nlohmann::json& doc, UnknownFields unknown = UnknownFields::Ignore);

// Parse raw text and decode it. Syntax errors are reported with the parser's
// message.
Result<JsonRpcRequest, std::string> ParseRequest(
    std::string_view text, UnknownFields unknown = UnknownFields::Ignore);

// Best-effort recovery of "id" from a raw line that failed to decode.
// Returns null when nothing usable is found.
nlohmann::json RecoverRequestId(std::string_view text);

// Envelope rules shared by every transport: jsonrpc must be "2.0" and the
// method non-empty. The error is the invalid-request detail text.
Result<void, std::string> ValidateEnvelope(const JsonRpcRequest& request);

// Missing params are rejected; null params decode as an empty object.
Result<ToolCallParams, std::string> DecodeToolCallParams(
    const std::optional<nlohmann::json>& params);

Result<ListFilesRequest, std::string> DecodeListFilesRequest(
    const nlohmann::json& args, UnknownFields unknown = UnknownFields::Ignore);

Result<ReadFileRequest, std::string> DecodeReadFileRequest(
    const nlohmann::json& args, UnknownFields unknown = UnknownFields::Ignore);

Result<EditFileRequest, std::string> DecodeEditFileRequest(
    const nlohmann::json& args, UnknownFields unknown = UnknownFields::Ignore);

} // namespace file_editor
