#include <file_editor/core/log.hpp>
#include <file_editor/core/time_format.hpp>

#include <nlohmann/json.hpp>

#include <cctype>

namespace file_editor {

namespace {

void WriteTextLine(std::ostream& out, const LogRecord& record) {
    out << FormatIso8601Millis(record.time) << " [" << LogLevelName(record.level)
        << "] [" << record.component << "] " << record.message << '\n';
    out.flush();
}

void WriteJsonLine(std::ostream& out, const LogRecord& record) {
    const nlohmann::json line = {
        {"ts", FormatIso8601Millis(record.time)},
        {"level", LogLevelName(record.level)},
        {"component", std::string(record.component)},
        {"message", std::string(record.message)},
    };
    // Log text may quote file content; never let bad UTF-8 throw here.
    out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        << '\n';
    out.flush();
}

std::mutex& GlobalMutex() {
    static std::mutex m;
    return m;
}

std::unique_ptr<Logger>& GlobalSlot() {
    static std::unique_ptr<Logger> slot;
    return slot;
}

void LogGlobal(LogLevel level, std::string_view component,
               std::string_view message) {
    std::lock_guard<std::mutex> lock(GlobalMutex());
    if (auto& logger = GlobalSlot()) {
        logger->Log(level, component, message);
    }
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

Result<LogLevel, std::string> ParseLogLevel(std::string_view text) {
    using R = Result<LogLevel, std::string>;

    std::string key(text);
    for (auto& c : key) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (key == "debug") return R::Ok(LogLevel::Debug);
    if (key == "info") return R::Ok(LogLevel::Info);
    if (key == "warn" || key == "warning") return R::Ok(LogLevel::Warn);
    if (key == "error") return R::Ok(LogLevel::Error);

    return R::Err("Unknown log level '" + std::string(text) +
                  "' (expected debug, info, warn or error)");
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(const LogRecord& record) {
    WriteTextLine(out_, record);
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    WriteJsonLine(out_, record);
}

Result<std::unique_ptr<FileSink>, std::string> FileSink::Open(
    const std::string& path, bool json) {
    using R = Result<std::unique_ptr<FileSink>, std::string>;

    std::ofstream file(path, std::ios::out | std::ios::app);
    if (!file.is_open()) {
        return R::Err("Cannot open log file '" + path + "' for writing");
    }
    return R::Ok(std::unique_ptr<FileSink>(new FileSink(std::move(file), json)));
}

FileSink::FileSink(std::ofstream file, bool json) : file_(std::move(file)) {
    if (json) {
        format_ = std::make_unique<JsonSink>(file_);
    } else {
        format_ = std::make_unique<ConsoleSink>(file_);
    }
}

void FileSink::Write(const LogRecord& record) {
    format_->Write(record);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    sink_->Write(LogRecord{level, component, message,
                           std::chrono::system_clock::now()});
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    auto logger = std::make_unique<Logger>(std::move(sink), min_level);
    std::lock_guard<std::mutex> lock(GlobalMutex());
    GlobalSlot() = std::move(logger);
}

void LogDebug(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Error, component, message);
}

} // namespace file_editor
