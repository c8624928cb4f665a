#include <file_editor/protocol/codec.hpp>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <initializer_list>
#include <optional>

namespace file_editor {

namespace {

using Json = nlohmann::json;

// A decoding failure reason, or nullopt when the member was fine.
using FieldError = std::optional<std::string>;

// Request ids may be any JSON scalar or null; they are echoed verbatim.
bool IsScalarId(const Json& id) {
    return id.is_string() || id.is_number() || id.is_boolean() || id.is_null();
}

FieldError CheckKnownFields(const Json& obj,
                            std::initializer_list<const char*> known,
                            UnknownFields unknown,
                            const std::string& where = "") {
    if (unknown == UnknownFields::Ignore) {
        return std::nullopt;
    }
    for (const auto& item : obj.items()) {
        const auto found = std::find_if(
            known.begin(), known.end(),
            [&](const char* k) { return item.key() == k; });
        if (found == known.end()) {
            std::string reason = "unknown field '" + item.key() + "'";
            if (!where.empty()) {
                reason += " in " + where;
            }
            return reason;
        }
    }
    return std::nullopt;
}

// Absent and null members leave `out` untouched.
FieldError ReadString(const Json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return std::string("field '") + key + "' must be a string, got " +
               it->type_name();
    }
    out = it->get<std::string>();
    return std::nullopt;
}

FieldError ReadInt(const Json& obj, const char* key, int& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        return std::string("field '") + key + "' must be an integer, got " +
               it->type_name();
    }
    if (it->is_number_unsigned()) {
        const auto v = it->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(INT_MAX)) {
            return std::string("field '") + key + "' is out of range";
        }
        out = static_cast<int>(v);
        return std::nullopt;
    }
    const auto v = it->get<std::int64_t>();
    if (v < INT_MIN || v > INT_MAX) {
        return std::string("field '") + key + "' is out of range";
    }
    out = static_cast<int>(v);
    return std::nullopt;
}

FieldError ReadBool(const Json& obj, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        return std::string("field '") + key + "' must be a boolean, got " +
               it->type_name();
    }
    out = it->get<bool>();
    return std::nullopt;
}

// Tool arguments: null is an empty object, anything else must be an object.
FieldError CheckArgumentsObject(const Json& args) {
    if (args.is_null() || args.is_object()) {
        return std::nullopt;
    }
    return std::string("arguments must be a JSON object, got ") +
           args.type_name();
}

FieldError DecodeEditOperation(const Json& j, std::size_t index,
                               UnknownFields unknown, EditOperation& out) {
    const auto where = "edits[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        return where + " must be a JSON object, got " + j.type_name();
    }
    if (auto err = CheckKnownFields(j, {"line", "content", "operation"},
                                    unknown, where)) {
        return err;
    }
    if (auto err = ReadInt(j, "line", out.line)) return *err + " in " + where;
    if (auto err = ReadString(j, "content", out.content)) return *err + " in " + where;
    if (auto err = ReadString(j, "operation", out.operation)) return *err + " in " + where;
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Envelope
// ---------------------------------------------------------------------------
Result<JsonRpcRequest, std::string> DecodeRequest(const Json& doc,
                                                  UnknownFields unknown) {
    using R = Result<JsonRpcRequest, std::string>;
    if (!doc.is_object()) {
        return R::Err(std::string("request must be a JSON object, got ") +
                      doc.type_name());
    }
    if (auto err = CheckKnownFields(doc, {"jsonrpc", "id", "method", "params"},
                                    unknown)) {
        return R::Err(*err);
    }

    JsonRpcRequest req;
    if (auto err = ReadString(doc, "jsonrpc", req.jsonrpc)) {
        return R::Err(*err);
    }
    if (auto err = ReadString(doc, "method", req.method)) {
        return R::Err(*err);
    }

    auto id = doc.find("id");
    if (id != doc.end()) {
        if (!IsScalarId(*id)) {
            return R::Err(std::string("field 'id' must be a string, number, boolean or null, got ") +
                          id->type_name());
        }
        req.id = *id;
    }

    auto params = doc.find("params");
    if (params != doc.end()) {
        req.params = *params;
    }
    return R::Ok(std::move(req));
}

Result<JsonRpcRequest, std::string> ParseRequest(std::string_view text,
                                                 UnknownFields unknown) {
    Json doc;
    try {
        doc = Json::parse(text.begin(), text.end());
    } catch (const Json::parse_error& e) {
        return Result<JsonRpcRequest, std::string>::Err(e.what());
    }
    return DecodeRequest(doc, unknown);
}

Json RecoverRequestId(std::string_view text) {
    auto doc = Json::parse(text.begin(), text.end(), nullptr,
                           /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return nullptr;
    }
    auto id = doc.find("id");
    if (id == doc.end()) {
        return nullptr;
    }
    if (IsScalarId(*id) && !id->is_null()) {
        return *id;
    }
    return nullptr;
}

Result<void, std::string> ValidateEnvelope(const JsonRpcRequest& request) {
    if (request.jsonrpc != kJsonRpcVersion) {
        return Result<void, std::string>::Err(
            "Invalid JSON-RPC version. Must be '2.0'.");
    }
    if (request.method.empty()) {
        return Result<void, std::string>::Err("Method not specified.");
    }
    return Result<void, std::string>::Ok();
}

// ---------------------------------------------------------------------------
// tools/call params
// ---------------------------------------------------------------------------
Result<ToolCallParams, std::string> DecodeToolCallParams(
    const std::optional<Json>& params) {
    using R = Result<ToolCallParams, std::string>;
    if (!params.has_value()) {
        return R::Err("params are required");
    }
    ToolCallParams out;
    if (params->is_null()) {
        return R::Ok(std::move(out));
    }
    if (!params->is_object()) {
        return R::Err(std::string("params must be a JSON object, got ") +
                      params->type_name());
    }
    if (auto err = ReadString(*params, "name", out.name)) {
        return R::Err(*err);
    }
    auto args = params->find("arguments");
    if (args != params->end()) {
        out.arguments = *args;
        out.has_arguments = true;
    }
    return R::Ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Tool arguments
// ---------------------------------------------------------------------------
Result<ListFilesRequest, std::string> DecodeListFilesRequest(
    const Json& args, UnknownFields unknown) {
    using R = Result<ListFilesRequest, std::string>;
    if (auto err = CheckArgumentsObject(args)) {
        return R::Err(*err);
    }
    if (args.is_object()) {
        if (auto err = CheckKnownFields(args, {}, unknown)) {
            return R::Err(*err);
        }
    }
    return R::Ok(ListFilesRequest{});
}

Result<ReadFileRequest, std::string> DecodeReadFileRequest(
    const Json& args, UnknownFields unknown) {
    using R = Result<ReadFileRequest, std::string>;
    if (auto err = CheckArgumentsObject(args)) {
        return R::Err(*err);
    }
    ReadFileRequest req;
    if (args.is_null()) {
        return R::Ok(std::move(req));
    }
    if (auto err = CheckKnownFields(args, {"name", "start_line", "end_line"},
                                    unknown)) {
        return R::Err(*err);
    }
    if (auto err = ReadString(args, "name", req.name)) return R::Err(*err);
    if (auto err = ReadInt(args, "start_line", req.start_line)) return R::Err(*err);
    if (auto err = ReadInt(args, "end_line", req.end_line)) return R::Err(*err);
    return R::Ok(std::move(req));
}

Result<EditFileRequest, std::string> DecodeEditFileRequest(
    const Json& args, UnknownFields unknown) {
    using R = Result<EditFileRequest, std::string>;
    if (auto err = CheckArgumentsObject(args)) {
        return R::Err(*err);
    }
    EditFileRequest req;
    if (args.is_null()) {
        return R::Ok(std::move(req));
    }
    if (auto err = CheckKnownFields(
            args, {"name", "edits", "append", "create_if_missing"}, unknown)) {
        return R::Err(*err);
    }
    if (auto err = ReadString(args, "name", req.name)) return R::Err(*err);
    if (auto err = ReadString(args, "append", req.append)) return R::Err(*err);
    if (auto err = ReadBool(args, "create_if_missing", req.create_if_missing)) {
        return R::Err(*err);
    }

    auto edits = args.find("edits");
    if (edits != args.end() && !edits->is_null()) {
        if (!edits->is_array()) {
            return R::Err(std::string("field 'edits' must be an array, got ") +
                          edits->type_name());
        }
        req.edits.reserve(edits->size());
        for (std::size_t i = 0; i < edits->size(); ++i) {
            EditOperation op;
            if (auto err = DecodeEditOperation((*edits)[i], i, unknown, op)) {
                return R::Err(*err);
            }
            req.edits.push_back(std::move(op));
        }
    }
    return R::Ok(std::move(req));
}

} // namespace file_editor
