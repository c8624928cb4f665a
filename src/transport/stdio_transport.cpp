#include <file_editor/transport/stdio_transport.hpp>

#include <file_editor/core/log.hpp>
#include <file_editor/errors/error_catalog.hpp>
#include <file_editor/protocol/codec.hpp>

#include <algorithm>
#include <cctype>

namespace file_editor {

namespace {

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // anonymous namespace

StdioTransport::StdioTransport(const ToolProcessor& processor,
                               std::istream& in,
                               std::ostream& out)
    : processor_(processor), in_(in), out_(out) {}

Result<void, ErrorDetail> StdioTransport::Run() {
    LogInfo(log_component::kStdio, "Listening on stdin");

    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (!response) {
            continue;
        }
        out_ << *response << "\n";
        out_.flush();
        if (!out_) {
            return Result<void, ErrorDetail>::Err(
                NewInternalError("failed to write response to stdout"));
        }
    }

    if (in_.bad()) {
        LogError(log_component::kStdio, "Error reading from stdin");
        return Result<void, ErrorDetail>::Err(
            NewInternalError("error reading from stdin"));
    }
    LogInfo(log_component::kStdio, "End of input, shutting down");
    return Result<void, ErrorDetail>::Ok();
}

std::optional<std::string> StdioTransport::HandleLine(const std::string& line) const {
    if (IsBlank(line)) {
        return std::nullopt;
    }

    auto request = ParseRequest(line);
    if (request.IsErr()) {
        LogWarn(log_component::kStdio, "Parse error: " + request.Error());
        const auto detail = NewParseError(request.Error());
        return SerializeResponse(JsonRpcResponse::Failure(
            RecoverRequestId(line), *ToJsonRpcError(&detail)));
    }

    LogDebug(log_component::kStdio, "Request: " + request.Value().method);
    return SerializeResponse(processor_.HandleRequest(request.Value()));
}

} // namespace file_editor
