#include <file_editor/config/config_loader.hpp>
#include <file_editor/core/log.hpp>
#include <file_editor/core/version.hpp>
#include <file_editor/mcp/tool_processor.hpp>
#include <file_editor/service/file_service.hpp>
#include <file_editor/transport/http_transport.hpp>
#include <file_editor/transport/stdio_transport.hpp>

#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

// Builds the global logger from the logging section of the config.
file_editor::Result<void, std::string> SetUpLogging(
    const file_editor::AppConfig& config) {
    using namespace file_editor;

    auto level = ParseLogLevel(config.log_level);
    if (level.IsErr()) {
        return Result<void, std::string>::Err(level.Error());
    }

    std::unique_ptr<ILogSink> sink;
    if (config.log_file) {
        auto file = FileSink::Open(*config.log_file, config.log_json);
        if (file.IsErr()) {
            return Result<void, std::string>::Err(file.Error());
        }
        sink = std::move(file).Value();
    } else if (config.log_json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ConsoleSink>(std::cerr);
    }

    InitGlobalLogger(std::move(sink), level.Value());
    return Result<void, std::string>::Ok();
}

int RunStdio(const file_editor::ToolProcessor& processor) {
    using namespace file_editor;

    StdioTransport transport(processor, std::cin, std::cout);
    auto result = transport.Run();
    if (result.IsErr()) {
        LogError(log_component::kMain, result.Error().message);
        return kExitFailure;
    }
    return kExitSuccess;
}

// SIGINT/SIGTERM are blocked in every thread and collected by a watcher
// thread, which stops the server.
int RunHttp(const file_editor::ToolProcessor& processor,
            const file_editor::AppConfig& config) {
    using namespace file_editor;

    HttpTransportOptions options;
    options.bind_address = config.bind_address;
    options.port = config.port;
    options.max_request_size_bytes =
        static_cast<std::size_t>(config.max_request_size_mb) * 1024 * 1024;
    options.timeout = std::chrono::seconds{config.operation_timeout_sec};
    options.max_concurrent = config.max_concurrent;

    HttpTransport transport(processor, options);

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread watcher([&transport, signals] {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            LogInfo(log_component::kMain, "Received signal " + std::to_string(received) +
                                ", shutting down");
        }
        transport.Stop();
    });

    auto result = transport.Listen();

    // Wake the watcher if the server ended on its own.
    pthread_kill(watcher.native_handle(), SIGTERM);
    watcher.join();

    if (result.IsErr()) {
        LogError(log_component::kMain, result.Error().message);
        return kExitFailure;
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace file_editor;

    // Step 1: CLI (handles --help and --version internally via argparse).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        std::cerr << "Error: " << cli_result.Error() << "\n";
        return kExitFailure;
    }
    const auto overrides = std::move(cli_result).Value();

    // Step 2: YAML config file, if any, then CLI on top.
    AppConfig base;
    if (overrides.config_file) {
        auto yaml_result = LoadFromYaml(*overrides.config_file);
        if (yaml_result.IsErr()) {
            std::cerr << "Error: " << yaml_result.Error() << "\n";
            return kExitFailure;
        }
        base = std::move(yaml_result).Value();
    }
    const AppConfig config = MergeConfigs(base, overrides);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        std::cerr << "Error: " << valid.Error() << "\n";
        return kExitFailure;
    }

    // Step 3: logging. Nothing is logged to stdout.
    auto logging = SetUpLogging(config);
    if (logging.IsErr()) {
        std::cerr << "Error: " << logging.Error() << "\n";
        return kExitFailure;
    }
    LogInfo(log_component::kMain, std::string("file-editor ") + kVersion + " starting (" +
                        config.transport + " transport)");

    // Step 4: file service over the working directory.
    FileServiceOptions service_options;
    service_options.working_directory = config.working_directory;
    service_options.max_file_size_bytes =
        static_cast<std::int64_t>(config.max_file_size_mb) * 1024 * 1024;
    service_options.operation_timeout =
        std::chrono::seconds{config.operation_timeout_sec};

    auto service = FileService::Create(std::move(service_options));
    if (service.IsErr()) {
        const auto& detail = service.Error();
        LogError(log_component::kMain, detail.message + ": " + detail.DataJson().value("details", ""));
        return kExitFailure;
    }
    auto file_service = std::move(service).Value();

    // Step 5: serve.
    ToolProcessor processor(*file_service);
    if (config.transport == "stdio") {
        return RunStdio(processor);
    }
    return RunHttp(processor, config);
}
