#include <file_editor/transport/http_transport.hpp>

#include <file_editor/core/log.hpp>
#include <file_editor/errors/error_catalog.hpp>
#include <file_editor/protocol/codec.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <functional>
#include <optional>
#include <string>

namespace file_editor {

namespace {

using Json = nlohmann::json;
using ToolRun = std::function<Result<McpToolResult, std::string>(const Json&)>;

constexpr const char* kJsonContentType = "application/json; charset=utf-8";

std::string Dump(const Json& doc) {
    return doc.dump(-1, ' ', false, Json::error_handler_t::replace);
}

void WriteJson(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_content(body, kJsonContentType);
}

void WriteError(httplib::Response& res, int status, const ErrorDetail& detail) {
    WriteJson(res, status, Dump(*ToErrorResponse(&detail)));
}

// Media type must be application/json; parameters such as charset are
// allowed.
bool IsJsonContentType(const std::string& header) {
    std::string media = header.substr(0, header.find(';'));
    const auto first = media.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    media = media.substr(first, media.find_last_not_of(" \t") - first + 1);
    std::transform(media.begin(), media.end(), media.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return media == "application/json";
}

bool CheckContentType(const httplib::Request& req, httplib::Response& res) {
    if (IsJsonContentType(req.get_header_value("Content-Type"))) {
        return true;
    }
    LogDebug(log_component::kHttp, "Rejected content type '" +
                         req.get_header_value("Content-Type") + "'");
    WriteError(res, 415, NewInvalidRequestError(
                             "Invalid Content-Type header. Must be 'application/json'."));
    return false;
}

void WriteParseError(httplib::Response& res, const std::string& details) {
    const auto detail = NewParseError(details);
    WriteError(res, MapErrorToHttpStatus(detail.code, &detail), detail);
}

std::optional<Json> ParseBody(const httplib::Request& req, httplib::Response& res) {
    try {
        return Json::parse(req.body);
    } catch (const Json::parse_error& e) {
        WriteParseError(res, "Invalid JSON at offset " + std::to_string(e.byte));
        return std::nullopt;
    }
}

void MethodNotAllowed(const httplib::Request&, httplib::Response& res) {
    WriteError(res, 405, NewInvalidRequestError("Method not allowed; use POST"));
}

// Fallback body for statuses produced by the server itself (unknown path,
// payload limit, malformed HTTP).
ErrorDetail DetailForStatus(int status, const std::string& path) {
    switch (status) {
        case 400:
            return NewParseError("Failed to decode request body");
        case 404:
            return NewInvalidRequestError("Not found: " + path);
        case 405:
            return NewInvalidRequestError("Method not allowed; use POST");
        case 413:
            return NewInvalidRequestError("Request body too large");
        default:
            return NewInternalError("HTTP status " + std::to_string(status));
    }
}

void ServeMcp(const ToolProcessor& processor,
              const httplib::Request& req, httplib::Response& res) {
    if (!CheckContentType(req, res)) {
        return;
    }
    auto doc = ParseBody(req, res);
    if (!doc) {
        return;
    }
    auto request = DecodeRequest(*doc, UnknownFields::Reject);
    if (request.IsErr()) {
        WriteParseError(res, "Failed to decode request body: " + request.Error());
        return;
    }

    LogDebug(log_component::kHttp, "Request: " + request.Value().method);
    WriteJson(res, 200, SerializeResponse(processor.HandleRequest(request.Value())));
}

void ServeTool(const httplib::Request& req, httplib::Response& res,
               const ToolRun& run) {
    if (!CheckContentType(req, res)) {
        return;
    }
    auto doc = ParseBody(req, res);
    if (!doc) {
        return;
    }
    auto result = run(*doc);
    if (result.IsErr()) {
        WriteParseError(res, "Failed to decode request body: " + result.Error());
        return;
    }
    WriteJson(res, 200, Dump(result.Value().ToJson()));
}

} // anonymous namespace

struct HttpTransport::Impl {
    httplib::Server server;
};

HttpTransport::HttpTransport(const ToolProcessor& processor,
                             HttpTransportOptions options)
    : processor_(processor),
      options_(std::move(options)),
      impl_(std::make_unique<Impl>()) {
    ConfigureRoutes(impl_->server);
}

HttpTransport::~HttpTransport() = default;

Result<void, ErrorDetail> HttpTransport::Listen() {
    const auto address =
        options_.bind_address + ":" + std::to_string(options_.port);
    if (!impl_->server.bind_to_port(options_.bind_address, options_.port)) {
        LogError(log_component::kHttp, "Failed to bind " + address);
        return Result<void, ErrorDetail>::Err(
            NewInternalError("failed to bind HTTP server to " + address));
    }

    LogInfo(log_component::kHttp, "Listening on " + address);
    if (!impl_->server.listen_after_bind()) {
        return Result<void, ErrorDetail>::Err(
            NewInternalError("HTTP server on " + address + " stopped unexpectedly"));
    }
    LogInfo(log_component::kHttp, "Server stopped");
    return Result<void, ErrorDetail>::Ok();
}

void HttpTransport::Stop() {
    impl_->server.stop();
}

void HttpTransport::ConfigureRoutes(httplib::Server& server) const {
    const ToolProcessor& processor = processor_;

    server.set_payload_max_length(options_.max_request_size_bytes);
    server.set_read_timeout(options_.timeout.count(), 0);
    server.set_write_timeout(options_.timeout.count(), 0);

    const auto workers = static_cast<std::size_t>(std::max(1, options_.max_concurrent));
    server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    server.Post("/mcp", [&processor](const httplib::Request& req,
                                     httplib::Response& res) {
        ServeMcp(processor, req, res);
    });

    server.Post("/list_files", [&processor](const httplib::Request& req,
                                            httplib::Response& res) {
        ServeTool(req, res, [&processor](const Json& body) {
            using R = Result<McpToolResult, std::string>;
            auto args = DecodeListFilesRequest(body, UnknownFields::Reject);
            if (args.IsErr()) {
                return R::Err(args.Error());
            }
            return R::Ok(processor.CallListFiles(args.Value()));
        });
    });

    server.Post("/read_file", [&processor](const httplib::Request& req,
                                           httplib::Response& res) {
        ServeTool(req, res, [&processor](const Json& body) {
            using R = Result<McpToolResult, std::string>;
            auto args = DecodeReadFileRequest(body, UnknownFields::Reject);
            if (args.IsErr()) {
                return R::Err(args.Error());
            }
            return R::Ok(processor.CallReadFile(args.Value()));
        });
    });

    server.Post("/edit_file", [&processor](const httplib::Request& req,
                                           httplib::Response& res) {
        ServeTool(req, res, [&processor](const Json& body) {
            using R = Result<McpToolResult, std::string>;
            auto args = DecodeEditFileRequest(body, UnknownFields::Reject);
            if (args.IsErr()) {
                return R::Err(args.Error());
            }
            return R::Ok(processor.CallEditFile(args.Value()));
        });
    });

    for (const char* path : {"/mcp", "/list_files", "/read_file", "/edit_file"}) {
        server.Get(path, MethodNotAllowed);
        server.Put(path, MethodNotAllowed);
        server.Delete(path, MethodNotAllowed);
        server.Patch(path, MethodNotAllowed);
    }

    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        WriteJson(res, 200, Json{{"status", "ok"}}.dump());
    });

    // Runs for every status >= 400; handlers that already wrote a body keep it.
    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        const auto detail = DetailForStatus(res.status, req.path);
        res.set_content(Dump(*ToErrorResponse(&detail)), kJsonContentType);
    });

    server.set_exception_handler([](const httplib::Request& req,
                                    httplib::Response& res,
                                    std::exception_ptr) {
        LogError(log_component::kHttp, "Unhandled exception while serving " + req.path);
        WriteError(res, 500, NewInternalError("Unhandled exception while serving request"));
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug(log_component::kHttp, req.method + " " + req.path + " -> " +
                             std::to_string(res.status));
    });
}

} // namespace file_editor
