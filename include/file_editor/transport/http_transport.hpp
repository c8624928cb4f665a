#pragma once

#include <file_editor/core/result.hpp>
#include <file_editor/errors/error_detail.hpp>
#include <file_editor/mcp/tool_processor.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace httplib {
class Server;
} // namespace httplib

namespace file_editor {

struct HttpTransportOptions {
    std::string bind_address = "0.0.0.0";
    int port = 8080;
    std::size_t max_request_size_bytes = 10 * 1024 * 1024;
    std::chrono::seconds timeout{10};
    int max_concurrent = 10;
};

// ---------------------------------------------------------------------------
// HttpTransport: JSON-RPC over HTTP plus the REST routes.
//
//   POST /mcp                                  JSON-RPC envelope
//   POST /list_files, /read_file, /edit_file   tool arguments as the body
//   GET  /health                               {"status":"ok"}
//
// Only framing failures (method, content type, size, malformed body) get a
// non-200 status. Requests are served by a pool of max_concurrent threads.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(const ToolProcessor& processor, HttpTransportOptions options);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Binds and serves until Stop() is called. Bind failures are errors.
    [[nodiscard]] Result<void, ErrorDetail> Listen();

    // Safe to call from another thread or a signal-watching thread.
    void Stop();

    // Installs routes, limits and handlers on `server`. Listen() uses this
    // on its own server; tests call it on one they run themselves.
    void ConfigureRoutes(httplib::Server& server) const;

private:
    struct Impl;

    const ToolProcessor& processor_;
    HttpTransportOptions options_;
    std::unique_ptr<Impl> impl_;
};

} // namespace file_editor
