#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace file_editor {

// ---------------------------------------------------------------------------
// Error codes. JSON-RPC standard codes plus the application range.
// ---------------------------------------------------------------------------
namespace error_code {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr int kFileSystemError = -32001;
constexpr int kLockFailed = -32002;

} // namespace error_code

// Values of the "type" discriminator on filesystem errors.
namespace error_type {

inline constexpr const char* kFileNotFound = "file_not_found";
inline constexpr const char* kPermissionDenied = "permission_denied";
inline constexpr const char* kFileTooLarge = "file_too_large";
inline constexpr const char* kInvalidEncoding = "invalid_encoding";

} // namespace error_type

// ---------------------------------------------------------------------------
// Per-kind payloads carried by ErrorDetail::data.
// ---------------------------------------------------------------------------
struct GenericErrorData {
    std::string details;
};

struct InvalidParamsData {
    std::string details;
    std::optional<nlohmann::json> param_issues;
    std::string filename;
    std::string operation;
};

// Untyped filesystem failure (-32001 without a "type").
struct FileSystemErrorData {
    std::string filename;
    std::string operation;
    std::string details;
};

struct FileNotFoundData {
    std::string filename;
    std::string operation;
};

struct PermissionDeniedData {
    std::string filename;
    std::string operation;
};

struct FileTooLargeData {
    std::string filename;
    std::string operation;
    std::int64_t current_size = 0;
    int max_size_mb = 0;
};

struct InvalidEncodingData {
    std::string filename;
    std::string operation;
    std::string details;
};

struct LockFailedData {
    std::string filename;
    std::string operation;
    std::string details;
};

using ErrorData = std::variant<GenericErrorData,
                               InvalidParamsData,
                               FileSystemErrorData,
                               FileNotFoundData,
                               PermissionDeniedData,
                               FileTooLargeData,
                               InvalidEncodingData,
                               LockFailedData>;

// ---------------------------------------------------------------------------
// ErrorDetail: internal error value. Build through the catalog functions so
// that code, message and timestamp stay consistent.
// ---------------------------------------------------------------------------
struct ErrorDetail {
    int code = 0;
    std::string message;
    ErrorData data;
    std::string timestamp;  // RFC3339 UTC

    // "type" discriminator, empty for untyped errors.
    [[nodiscard]] std::string TypeName() const;

    // Conventional key/value rendering of `data`, timestamp included.
    [[nodiscard]] nlohmann::json DataJson() const;

    // {"code", "message", "data"}
    [[nodiscard]] nlohmann::json ToJson() const;
};

} // namespace file_editor
