#include <catch2/catch_test_macros.hpp>

#include <file_editor/errors/error_detail.hpp>
#include <file_editor/mcp/tool_processor.hpp>
#include <file_editor/transport/http_transport.hpp>

#include "mocks/mock_file_service.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>
#include <thread>

using namespace file_editor;
using file_editor::testing::MockFileService;
using Json = nlohmann::json;

namespace {

// ---------------------------------------------------------------------------
// Helper: run an httplib::Server on a random port for the lifetime of the
// object.
// ---------------------------------------------------------------------------
class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] int Port() const noexcept { return port_; }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

// Transport routes installed on a test-owned server.
struct Fixture {
    explicit Fixture(HttpTransportOptions options = {})
        : processor(mock), transport(processor, options) {
        transport.ConfigureRoutes(server);
    }

    MockFileService mock;
    ToolProcessor processor;
    HttpTransport transport;
    httplib::Server server;
};

constexpr const char* kJson = "application/json";

Json Body(const httplib::Result& res) {
    REQUIRE(res);
    return Json::parse(res->body);
}

} // anonymous namespace

// ===========================================================================
// POST /mcp
// ===========================================================================

TEST_CASE("HttpTransport: /mcp answers JSON-RPC with 200", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"initialize"})", kJson);
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->get_header_value("Content-Type").find("application/json") == 0);
    const auto body = Body(res);
    CHECK(body["id"] == 1);
    CHECK(body["result"]["isError"] == false);
}

TEST_CASE("HttpTransport: /mcp protocol errors stay 200", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto missing = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":2,"method":"nope"})", kJson);
    REQUIRE(missing);
    CHECK(missing->status == 200);
    CHECK(Body(missing)["error"]["code"] == error_code::kMethodNotFound);

    auto version = cli.Post("/mcp", R"({"jsonrpc":"1.0","id":3,"method":"initialize"})", kJson);
    REQUIRE(version);
    CHECK(version->status == 200);
    CHECK(Body(version)["error"]["code"] == error_code::kInvalidRequest);
}

TEST_CASE("HttpTransport: /mcp tools/call reaches the service", "[http]") {
    Fixture f;
    f.mock.EnqueueRead(MockFileService::ReadResult::Err(ErrorDetail{}));
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post(
        "/mcp",
        R"({"jsonrpc":"2.0","id":"r1","method":"tools/call","params":{"name":"read_file","arguments":{"name":"a.txt"}}})",
        kJson);
    REQUIRE(res);
    CHECK(res->status == 200);
    const auto body = Body(res);
    CHECK(body["id"] == "r1");
    CHECK(body["result"]["isError"] == true);
    const auto calls = f.mock.ReadCalls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].name == "a.txt");
}

TEST_CASE("HttpTransport: malformed body is 400 parse error", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/mcp", "{\"jsonrpc\":", kJson);
    REQUIRE(res);
    CHECK(res->status == 400);
    const auto body = Body(res);
    CHECK(body["error"]["code"] == error_code::kParseError);
    CHECK(body["error"]["data"]["details"].get<std::string>().rfind("Invalid JSON at offset", 0) == 0);
}

TEST_CASE("HttpTransport: unknown envelope field is 400", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"initialize","extra":1})", kJson);
    REQUIRE(res);
    CHECK(res->status == 400);
    CHECK(Body(res)["error"]["data"]["details"] ==
          "Failed to decode request body: unknown field 'extra'");
}

TEST_CASE("HttpTransport: wrong content type is 415", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"initialize"})", "text/plain");
    REQUIRE(res);
    CHECK(res->status == 415);
    const auto body = Body(res);
    CHECK(body["error"]["code"] == error_code::kInvalidRequest);
    CHECK(body["error"]["data"]["details"] ==
          "Invalid Content-Type header. Must be 'application/json'.");
}

TEST_CASE("HttpTransport: content type parameters are accepted", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})",
                        "Application/JSON; charset=utf-8");
    REQUIRE(res);
    CHECK(res->status == 200);
}

TEST_CASE("HttpTransport: non-POST methods are 405", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto get = cli.Get("/mcp");
    REQUIRE(get);
    CHECK(get->status == 405);
    CHECK(Body(get)["error"]["code"] == error_code::kInvalidRequest);

    auto del = cli.Delete("/read_file");
    REQUIRE(del);
    CHECK(del->status == 405);
}

TEST_CASE("HttpTransport: oversized body is 413", "[http]") {
    HttpTransportOptions options;
    options.max_request_size_bytes = 64;
    Fixture f(options);
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    const std::string big = R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"pad":")" +
                            std::string(256, 'x') + "\"}}";
    auto res = cli.Post("/mcp", big, kJson);
    REQUIRE(res);
    CHECK(res->status == 413);
}

TEST_CASE("HttpTransport: unknown path is 404", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Get("/nowhere");
    REQUIRE(res);
    CHECK(res->status == 404);
    CHECK(Body(res)["error"]["data"]["details"] == "Not found: /nowhere");
}

// ===========================================================================
// REST routes and health
// ===========================================================================

TEST_CASE("HttpTransport: /health", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(Body(res) == Json{{"status", "ok"}});
}

TEST_CASE("HttpTransport: /list_files returns a tool result", "[http]") {
    Fixture f;
    f.mock.EnqueueList(MockFileService::ListResult::Ok({}));
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/list_files", "{}", kJson);
    REQUIRE(res);
    CHECK(res->status == 200);
    const auto body = Body(res);
    CHECK(body["content"][0]["type"] == "text");
    CHECK(body["content"][0]["text"] == "Total files: 0");
    CHECK(body["isError"] == false);
}

TEST_CASE("HttpTransport: /edit_file forwards the arguments", "[http]") {
    Fixture f;
    EditFileOutcome outcome;
    outcome.filename = "new.txt";
    outcome.lines_modified = 1;
    outcome.new_total_lines = 1;
    outcome.file_created = true;
    f.mock.EnqueueEdit(MockFileService::EditResult::Ok(outcome));
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/edit_file",
                        R"({"name":"new.txt","append":"hello","create_if_missing":true})", kJson);
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(Body(res)["content"][0]["text"] ==
          "File edited successfully: new.txt\nLines modified: 1\nTotal lines: 1\nFile created: true");

    const auto calls = f.mock.EditCalls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].append == "hello");
    CHECK(calls[0].create_if_missing);
}

TEST_CASE("HttpTransport: REST routes reject unknown fields", "[http]") {
    Fixture f;
    LocalServer local(f.server);
    httplib::Client cli("127.0.0.1", local.Port());

    auto res = cli.Post("/read_file", R"({"name":"a.txt","mode":"fast"})", kJson);
    REQUIRE(res);
    CHECK(res->status == 400);
    CHECK(Body(res)["error"]["data"]["details"] ==
          "Failed to decode request body: unknown field 'mode'");
    CHECK(f.mock.ReadCalls().empty());
}
