#pragma once

#include <file_editor/core/result.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace file_editor {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Accepts debug, info, warn (or warning) and error in any case.
Result<LogLevel, std::string> ParseLogLevel(std::string_view text);

// "DEBUG", "INFO", "WARN", "ERROR".
const char* LogLevelName(LogLevel level);

// Component tags used across the server.
namespace log_component {
inline constexpr std::string_view kMain = "main";
inline constexpr std::string_view kStdio = "stdio";
inline constexpr std::string_view kHttp = "http";
inline constexpr std::string_view kProcessor = "processor";
inline constexpr std::string_view kFileService = "file_service";
} // namespace log_component

// One log event. The views are only valid for the duration of Write().
struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string_view message;
    std::chrono::system_clock::time_point time;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// "<ts> [LEVEL] [component] message" lines. Defaults to stderr because
// stdout carries protocol traffic in stdio mode.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// {"ts":...,"level":...,"component":...,"message":...} per line.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// Appends to a log file in either of the formats above.
class FileSink : public ILogSink {
public:
    static Result<std::unique_ptr<FileSink>, std::string> Open(
        const std::string& path, bool json);

    void Write(const LogRecord& record) override;

private:
    FileSink(std::ofstream file, bool json);

    std::ofstream file_;
    std::unique_ptr<ILogSink> format_;
};

// Filters by level and serialises writes to the sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. Installed once by main(); until then every Log*
// call is dropped.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace file_editor
