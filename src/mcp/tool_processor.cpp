#include <file_editor/mcp/tool_processor.hpp>

#include <file_editor/core/log.hpp>
#include <file_editor/core/version.hpp>
#include <file_editor/errors/error_catalog.hpp>
#include <file_editor/mcp/tool_formatters.hpp>
#include <file_editor/protocol/codec.hpp>

#include <string>

namespace file_editor {

namespace {

using Json = nlohmann::json;
using CallResult = Result<McpToolResult, JsonRpcError>;

Json FileNameSchema() {
    return {{"type", "string"},
            {"pattern", "^[a-zA-Z0-9._-]+$"},
            {"minLength", 1},
            {"maxLength", 255}};
}

Json LineNumberSchema() {
    return {{"type", "integer"}, {"minimum", 1}};
}

Json TextResponseSchema(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

JsonRpcError InvalidParamsError(const std::string& target, const std::string& reason) {
    const auto detail =
        NewInvalidParamsError("Invalid parameters for " + target + ": " + reason);
    return *ToJsonRpcError(&detail);
}

CallResult InvalidParams(const std::string& target, const std::string& reason) {
    return CallResult::Err(InvalidParamsError(target, reason));
}

// Adapts a decode failure (plain reason string) into a -32602 error
// naming the tool.
auto RejectArgumentsOf(const char* tool) {
    return [tool](std::string reason) { return InvalidParamsError(tool, reason); };
}

McpToolResult ToolError(const ErrorDetail& detail) {
    return McpToolResult::Text(FormatToolError(&detail), true);
}

} // anonymous namespace

const std::vector<ToolDefinition>& ToolProcessor::Definitions() {
    static const std::vector<ToolDefinition> definitions = [] {
        std::vector<ToolDefinition> defs;

        ToolDefinition list;
        list.name = "list_files";
        list.description =
            "Lists all non-hidden files in the working directory, providing "
            "name, modification time, and line count.";
        list.arguments_schema = {{"type", "object"},
                                 {"properties", Json::object()}};
        list.response_schema = TextResponseSchema(
            "Text output detailing files: name, modified, lines.");
        list.annotations = {true, false};
        defs.push_back(std::move(list));

        ToolDefinition read;
        read.name = "read_file";
        read.description =
            "Reads the content of a specified file, optionally within a given "
            "line range.";
        read.arguments_schema = {
            {"type", "object"},
            {"properties",
             {{"name", FileNameSchema()},
              {"start_line", LineNumberSchema()},
              {"end_line", LineNumberSchema()}}},
            {"required", Json::array({"name"})}};
        read.response_schema =
            TextResponseSchema("Text output of file content or range.");
        read.annotations = {true, false};
        defs.push_back(std::move(read));

        ToolDefinition edit;
        edit.name = "edit_file";
        edit.description =
            "Edits a file using line-based operations, creates if missing "
            "(with flag), or appends content.";
        Json edit_item = {
            {"type", "object"},
            {"properties",
             {{"line", LineNumberSchema()},
              {"content", {{"type", "string"}}},
              {"operation",
               {{"type", "string"},
                {"enum", Json::array({"replace", "insert", "delete"})}}}}},
            {"required", Json::array({"line", "operation"})}};
        edit.arguments_schema = {
            {"type", "object"},
            {"properties",
             {{"name", FileNameSchema()},
              {"edits", {{"type", "array"}, {"items", edit_item}}},
              {"append", {{"type", "string"}}},
              {"create_if_missing", {{"type", "boolean"}, {"default", false}}}}},
            {"required", Json::array({"name"})}};
        edit.response_schema =
            TextResponseSchema("Text output summarizing edit results.");
        edit.annotations = {false, true};
        defs.push_back(std::move(edit));

        return defs;
    }();
    return definitions;
}

ToolProcessor::ToolProcessor(IFileOperationService& service)
    : service_(service) {
    const auto& defs = Definitions();

    registry_.Register(defs[0], [this](const Json& args) {
        return DecodeListFilesRequest(args)
            .MapError(RejectArgumentsOf("list_files"))
            .Map([this](const ListFilesRequest& req) { return CallListFiles(req); });
    });

    registry_.Register(defs[1], [this](const Json& args) {
        return DecodeReadFileRequest(args)
            .MapError(RejectArgumentsOf("read_file"))
            .Map([this](const ReadFileRequest& req) { return CallReadFile(req); });
    });

    registry_.Register(defs[2], [this](const Json& args) {
        return DecodeEditFileRequest(args)
            .MapError(RejectArgumentsOf("edit_file"))
            .Map([this](const EditFileRequest& req) { return CallEditFile(req); });
    });
}

Result<McpToolResult, JsonRpcError> ToolProcessor::ProcessRequest(
    const JsonRpcRequest& request) const {
    if (request.method == "initialize") {
        Json descriptor = {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", Json::object()}}},
            {"serverInfo",
             {{"name", kServerName},
              {"version", kVersion},
              {"description", kServerDescription}}}};
        return CallResult::Ok(McpToolResult::Text(descriptor.dump()));
    }

    if (request.method == "tools/list") {
        Json tools = Json::array();
        for (const auto& def : registry_.Tools()) {
            tools.push_back(def.ToJson());
        }
        return CallResult::Ok(McpToolResult::Text(Json{{"tools", tools}}.dump()));
    }

    if (request.method == "tools/call") {
        return HandleToolsCall(request);
    }

    const auto detail = NewMethodNotFoundError(request.method);
    return CallResult::Err(*ToJsonRpcError(&detail));
}

JsonRpcResponse ToolProcessor::HandleRequest(const JsonRpcRequest& request) const {
    auto envelope = ValidateEnvelope(request);
    if (envelope.IsErr()) {
        const auto detail = NewInvalidRequestError(envelope.Error());
        return JsonRpcResponse::Failure(request.id, *ToJsonRpcError(&detail));
    }

    auto result = ProcessRequest(request);
    if (result.IsErr()) {
        return JsonRpcResponse::Failure(request.id, std::move(result).Error());
    }
    return JsonRpcResponse::Success(request.id, std::move(result).Value());
}

Result<McpToolResult, JsonRpcError> ToolProcessor::HandleToolsCall(
    const JsonRpcRequest& request) const {
    auto params = DecodeToolCallParams(request.params);
    if (params.IsErr()) {
        return InvalidParams("tools/call", params.Error());
    }
    const auto& call = params.Value();

    // Unknown names are reported before their arguments are looked at.
    if (registry_.HasTool(call.name) && !call.has_arguments) {
        return InvalidParams(call.name, "arguments are required");
    }

    LogDebug(log_component::kProcessor, "tools/call " + call.name);
    return registry_.Execute(call.name, call.arguments);
}

McpToolResult ToolProcessor::CallListFiles(const ListFilesRequest& request) const {
    auto files = service_.ListFiles(request);
    if (files.IsErr()) {
        return ToolError(files.Error());
    }
    return McpToolResult::Text(FormatListFilesResult(files.Value()));
}

McpToolResult ToolProcessor::CallReadFile(const ReadFileRequest& request) const {
    auto outcome = service_.ReadFile(request);
    if (outcome.IsErr()) {
        return ToolError(outcome.Error());
    }
    return McpToolResult::Text(FormatReadFileResult(outcome.Value()));
}

McpToolResult ToolProcessor::CallEditFile(const EditFileRequest& request) const {
    auto outcome = service_.EditFile(request);
    if (outcome.IsErr()) {
        return ToolError(outcome.Error());
    }
    const auto& o = outcome.Value();
    return McpToolResult::Text(FormatEditFileResult(
        o.filename, o.lines_modified, o.new_total_lines, o.file_created));
}

std::string SerializeResponse(const JsonRpcResponse& response) {
    try {
        return response.ToJson().dump();
    } catch (const Json::type_error& e) {
        LogError(log_component::kProcessor, std::string("Failed to serialize response: ") + e.what());
        const auto detail = NewInternalError(
            std::string("Failed to serialize response: ") + e.what());
        return JsonRpcResponse::Failure(response.Id(), *ToJsonRpcError(&detail))
            .ToJson()
            .dump(-1, ' ', false, Json::error_handler_t::replace);
    }
}

} // namespace file_editor
