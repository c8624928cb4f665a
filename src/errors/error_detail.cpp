#include <file_editor/errors/error_detail.hpp>

namespace file_editor {

namespace {

using Json = nlohmann::json;

// Renders each payload as the conventional key/value map.
struct DataJsonVisitor {
    Json operator()(const GenericErrorData& d) const {
        return {{"details", d.details}};
    }

    Json operator()(const InvalidParamsData& d) const {
        Json j = {{"details", d.details}};
        if (d.param_issues.has_value()) {
            j["param_issues"] = *d.param_issues;
        }
        if (!d.filename.empty()) j["filename"] = d.filename;
        if (!d.operation.empty()) j["operation"] = d.operation;
        return j;
    }

    Json operator()(const FileSystemErrorData& d) const {
        return {
            {"filename", d.filename},
            {"operation", d.operation},
            {"details", d.details},
        };
    }

    Json operator()(const FileNotFoundData& d) const {
        return {
            {"filename", d.filename},
            {"operation", d.operation},
            {"type", error_type::kFileNotFound},
        };
    }

    Json operator()(const PermissionDeniedData& d) const {
        return {
            {"filename", d.filename},
            {"operation", d.operation},
            {"type", error_type::kPermissionDenied},
        };
    }

    Json operator()(const FileTooLargeData& d) const {
        return {
            {"filename", d.filename},
            {"operation", d.operation},
            {"current_size", d.current_size},
            {"max_size_mb", d.max_size_mb},
            {"type", error_type::kFileTooLarge},
        };
    }

    Json operator()(const InvalidEncodingData& d) const {
        return {
            {"filename", d.filename},
            {"operation", d.operation},
            {"details", d.details},
            {"type", error_type::kInvalidEncoding},
        };
    }

    Json operator()(const LockFailedData& d) const {
        return {
            {"filename", d.filename},
            {"operation", d.operation},
            {"details", d.details},
        };
    }
};

} // anonymous namespace

std::string ErrorDetail::TypeName() const {
    if (std::holds_alternative<FileNotFoundData>(data)) {
        return error_type::kFileNotFound;
    }
    if (std::holds_alternative<PermissionDeniedData>(data)) {
        return error_type::kPermissionDenied;
    }
    if (std::holds_alternative<FileTooLargeData>(data)) {
        return error_type::kFileTooLarge;
    }
    if (std::holds_alternative<InvalidEncodingData>(data)) {
        return error_type::kInvalidEncoding;
    }
    return "";
}

nlohmann::json ErrorDetail::DataJson() const {
    auto j = std::visit(DataJsonVisitor{}, data);
    if (!timestamp.empty()) {
        j["timestamp"] = timestamp;
    }
    return j;
}

nlohmann::json ErrorDetail::ToJson() const {
    return {
        {"code", code},
        {"message", message},
        {"data", DataJson()},
    };
}

} // namespace file_editor
