#include <azmcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace azmcp {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kGrey = "\033[90m";

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return kGrey;
        case LogLevel::Info:  return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[1;31m";
    }
    return "";
}

enum class Stamp {
    UtcIso8601,   // 2026-01-31T12:00:00.123Z
    LocalClock,   // 12:00:00
};

std::string Timestamp(Stamp style) {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);

    std::tm tm{};
#ifdef _WIN32
    if (style == Stamp::UtcIso8601) gmtime_s(&tm, &secs); else localtime_s(&tm, &secs);
#else
    if (style == Stamp::UtcIso8601) gmtime_r(&secs, &tm); else localtime_r(&secs, &tm);
#endif

    std::ostringstream oss;
    if (style == Stamp::LocalClock) {
        oss << std::put_time(&tm, "%H:%M:%S");
        return oss.str();
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis << 'Z';
    return oss.str();
}

// Level name padded to five columns.
std::string PaddedLevel(LogLevel level) {
    std::string name = LogLevelName(level);
    name.resize(5, ' ');
    return name;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// TextSink
// ---------------------------------------------------------------------------
TextSink::TextSink(std::ostream& out, bool use_color, std::string service)
    : out_(out), use_color_(use_color), service_(std::move(service)) {}

void TextSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    std::ostringstream line;
    if (use_color_) {
        const char* color = LevelColor(level);
        line << kGrey << Timestamp(Stamp::LocalClock) << kReset << ' '
             << color << PaddedLevel(level) << kReset << ' ';
        if (!service_.empty()) line << kGrey << service_ << kReset << ' ';
        line << component << ": ";
        if (level == LogLevel::Error) {
            line << color << message << kReset;
        } else {
            line << message;
        }
    } else {
        line << Timestamp(Stamp::UtcIso8601) << ' ' << PaddedLevel(level) << ' ';
        if (!service_.empty()) line << service_ << ' ';
        line << component << ": " << message;
    }
    line << '\n';
    out_ << line.str();
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out, std::string service)
    : out_(out), service_(std::move(service)) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json record = {
        {"ts", Timestamp(Stamp::UtcIso8601)},
        {"level", LogLevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    if (!service_.empty()) {
        record["service"] = service_;
    }
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

std::unique_ptr<ILogSink> MakeStderrSink(bool json, bool use_color,
                                         const std::string& service,
                                         std::ostream& out) {
    if (json) {
        return std::make_unique<JsonSink>(out, service);
    }
    return std::make_unique<TextSink>(out, use_color, service);
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

LogLevel Logger::MinLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::IsEnabled(LogLevel level) {
    return level >= MinLevel();
}

void Logger::Write(LogLevel level, std::string_view component,
                   std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_ || !sink_) return;
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
namespace {

std::unique_ptr<Logger>& GlobalSlot() {
    // A sinkless logger drops everything until InitGlobalLogger runs.
    static auto slot = std::make_unique<Logger>(nullptr, LogLevel::Error);
    return slot;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Error, component, message);
}

} // namespace azmcp
