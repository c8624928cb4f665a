#include <file_editor/core/time_format.hpp>

#include <iomanip>
#include <sstream>

namespace file_editor {

namespace {

std::tm ToUtc(std::time_t t) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    return utc;
}

} // anonymous namespace

std::string FormatRfc3339Utc(std::time_t t) {
    const auto utc = ToUtc(t);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string NowRfc3339Utc() {
    return FormatRfc3339Utc(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string FormatIso8601Millis(std::chrono::system_clock::time_point tp) {
    const auto utc = ToUtc(std::chrono::system_clock::to_time_t(tp));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

} // namespace file_editor
