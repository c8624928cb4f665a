#pragma once

#include <file_editor/errors/error_detail.hpp>
#include <file_editor/protocol/jsonrpc.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace file_editor {

// ---------------------------------------------------------------------------
// Constructors. Every detail is stamped with the current UTC time.
// ---------------------------------------------------------------------------
ErrorDetail NewParseError(const std::string& details);
ErrorDetail NewInvalidRequestError(const std::string& details);
ErrorDetail NewMethodNotFoundError(const std::string& method);

// An empty summary becomes "Invalid params".
ErrorDetail NewInvalidParamsError(
    const std::string& summary,
    std::optional<nlohmann::json> param_issues = std::nullopt,
    const std::string& filename = "",
    const std::string& operation = "");

ErrorDetail NewInternalError(const std::string& details);
ErrorDetail NewFileSystemError(const std::string& filename,
                               const std::string& operation,
                               const std::string& details);
ErrorDetail NewFileNotFoundError(const std::string& filename,
                                 const std::string& operation);
ErrorDetail NewPermissionDeniedError(const std::string& filename,
                                     const std::string& operation);
ErrorDetail NewFileTooLargeError(const std::string& filename,
                                 const std::string& operation,
                                 std::int64_t current_size,
                                 int max_size_mb);
ErrorDetail NewInvalidEncodingError(const std::string& filename,
                                    const std::string& operation,
                                    const std::string& details);
ErrorDetail NewLockFailedError(const std::string& filename,
                               const std::string& operation,
                               const std::string& details);

// ---------------------------------------------------------------------------
// Conversions. A null detail converts to nothing.
// ---------------------------------------------------------------------------

// {"error": {"code", "message", "data"}} for HTTP bodies.
std::optional<nlohmann::json> ToErrorResponse(const ErrorDetail* detail);

// Projection onto the JSON-RPC error object. Parameter issues are folded
// into `details`.
std::optional<JsonRpcError> ToJsonRpcError(const ErrorDetail* detail);

// HTTP status for an error code; -32001 is refined by the detail's type.
int MapErrorToHttpStatus(int code, const ErrorDetail* detail);

} // namespace file_editor
