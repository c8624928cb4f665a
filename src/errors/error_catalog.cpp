#include <file_editor/errors/error_catalog.hpp>

#include <file_editor/core/time_format.hpp>

namespace file_editor {

namespace {

ErrorDetail MakeDetail(int code, std::string message, ErrorData data) {
    return ErrorDetail{code, std::move(message), std::move(data),
                       NowRfc3339Utc()};
}

// Fixed JSON-RPC fields of a payload.
struct RpcDataVisitor {
    JsonRpcErrorData operator()(const GenericErrorData& d) const {
        return {"", "", "", d.details};
    }

    JsonRpcErrorData operator()(const InvalidParamsData& d) const {
        auto details = d.details;
        if (d.param_issues.has_value()) {
            details += ". Parameter issues: " + d.param_issues->dump();
        }
        return {d.filename, d.operation, "", std::move(details)};
    }

    JsonRpcErrorData operator()(const FileSystemErrorData& d) const {
        return {d.filename, d.operation, "", d.details};
    }

    JsonRpcErrorData operator()(const FileNotFoundData& d) const {
        return {d.filename, d.operation, "", ""};
    }

    JsonRpcErrorData operator()(const PermissionDeniedData& d) const {
        return {d.filename, d.operation, "", ""};
    }

    JsonRpcErrorData operator()(const FileTooLargeData& d) const {
        return {d.filename, d.operation, "",
                "size " + std::to_string(d.current_size) +
                    " bytes, limit " + std::to_string(d.max_size_mb) + " MB"};
    }

    JsonRpcErrorData operator()(const InvalidEncodingData& d) const {
        return {d.filename, d.operation, "", d.details};
    }

    JsonRpcErrorData operator()(const LockFailedData& d) const {
        return {d.filename, d.operation, "", d.details};
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Constructors
// ---------------------------------------------------------------------------
ErrorDetail NewParseError(const std::string& details) {
    return MakeDetail(error_code::kParseError, "Parse error",
                      GenericErrorData{details});
}

ErrorDetail NewInvalidRequestError(const std::string& details) {
    return MakeDetail(error_code::kInvalidRequest, "Invalid Request",
                      GenericErrorData{details});
}

ErrorDetail NewMethodNotFoundError(const std::string& method) {
    return MakeDetail(error_code::kMethodNotFound,
                      "Method not found: " + method,
                      GenericErrorData{"Method '" + method + "' is not supported"});
}

ErrorDetail NewInvalidParamsError(const std::string& summary,
                                  std::optional<nlohmann::json> param_issues,
                                  const std::string& filename,
                                  const std::string& operation) {
    const std::string message = summary.empty() ? "Invalid params" : summary;
    return MakeDetail(error_code::kInvalidParams, message,
                      InvalidParamsData{message, std::move(param_issues),
                                        filename, operation});
}

ErrorDetail NewInternalError(const std::string& details) {
    return MakeDetail(error_code::kInternalError, "Internal error",
                      GenericErrorData{details});
}

ErrorDetail NewFileSystemError(const std::string& filename,
                               const std::string& operation,
                               const std::string& details) {
    return MakeDetail(error_code::kFileSystemError, "File system error",
                      FileSystemErrorData{filename, operation, details});
}

ErrorDetail NewFileNotFoundError(const std::string& filename,
                                 const std::string& operation) {
    return MakeDetail(error_code::kFileSystemError,
                      "File '" + filename + "' not found",
                      FileNotFoundData{filename, operation});
}

ErrorDetail NewPermissionDeniedError(const std::string& filename,
                                     const std::string& operation) {
    return MakeDetail(error_code::kFileSystemError,
                      "Permission denied for file '" + filename + "'",
                      PermissionDeniedData{filename, operation});
}

ErrorDetail NewFileTooLargeError(const std::string& filename,
                                 const std::string& operation,
                                 std::int64_t current_size,
                                 int max_size_mb) {
    return MakeDetail(error_code::kFileSystemError,
                      "File '" + filename + "' exceeds maximum allowed size of " +
                          std::to_string(max_size_mb) + " MB",
                      FileTooLargeData{filename, operation, current_size,
                                       max_size_mb});
}

ErrorDetail NewInvalidEncodingError(const std::string& filename,
                                    const std::string& operation,
                                    const std::string& details) {
    return MakeDetail(error_code::kFileSystemError,
                      "File '" + filename + "' is not valid UTF-8",
                      InvalidEncodingData{filename, operation, details});
}

ErrorDetail NewLockFailedError(const std::string& filename,
                               const std::string& operation,
                               const std::string& details) {
    return MakeDetail(error_code::kLockFailed,
                      "Could not acquire lock for operation '" + operation +
                          "' on file '" + filename + "'",
                      LockFailedData{filename, operation, details});
}

// ---------------------------------------------------------------------------
// Conversions
// ---------------------------------------------------------------------------
std::optional<nlohmann::json> ToErrorResponse(const ErrorDetail* detail) {
    if (detail == nullptr) {
        return std::nullopt;
    }
    return nlohmann::json{{"error", detail->ToJson()}};
}

std::optional<JsonRpcError> ToJsonRpcError(const ErrorDetail* detail) {
    if (detail == nullptr) {
        return std::nullopt;
    }
    auto data = std::visit(RpcDataVisitor{}, detail->data);
    data.timestamp = detail->timestamp;
    return JsonRpcError{detail->code, detail->message, std::move(data)};
}

int MapErrorToHttpStatus(int code, const ErrorDetail* detail) {
    switch (code) {
        case error_code::kParseError:     return 400;
        case error_code::kInvalidRequest: return 400;
        case error_code::kMethodNotFound: return 404;
        case error_code::kInvalidParams:  return 400;
        case error_code::kInternalError:  return 500;
        case error_code::kLockFailed:     return 409;
        case error_code::kFileSystemError: {
            if (detail == nullptr) {
                return 500;
            }
            const auto type = detail->TypeName();
            if (type == error_type::kFileNotFound) return 404;
            if (type == error_type::kPermissionDenied) return 403;
            if (type == error_type::kInvalidEncoding) return 400;
            if (type == error_type::kFileTooLarge) return 413;
            return 500;
        }
        default:
            return 500;
    }
}

} // namespace file_editor
