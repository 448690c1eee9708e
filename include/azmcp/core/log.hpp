#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace azmcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

/// "DEBUG", "INFO", "WARN", "ERROR".
const char* LogLevelName(LogLevel level) noexcept;

// ---------------------------------------------------------------------------
// Sinks. Every sink writes to an explicit stream, normally std::cerr: stdout
// carries protocol frames and one-shot command output.
// ---------------------------------------------------------------------------
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines.
//   no color: 2026-01-31T12:00:00.123Z WARN  azure-pricing-mcp fetch: message
//   color:    12:00:00 WARN  azure-pricing-mcp fetch: message
// The service column is left out when no service is set.
class TextSink : public ILogSink {
public:
    explicit TextSink(std::ostream& out, bool use_color = false,
                      std::string service = {});
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ostream& out_;
    bool use_color_;
    std::string service_;
};

// One JSON object per line: ts, level, component, message, plus "service"
// when one is set.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out, std::string service = {});
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ostream& out_;
    std::string service_;
};

/// JsonSink when json is set, otherwise TextSink. Both tag lines with service.
std::unique_ptr<ILogSink> MakeStderrSink(bool json, bool use_color,
                                         const std::string& service = {},
                                         std::ostream& out = std::cerr);

// Thread-safe level filter in front of a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel MinLevel();
    [[nodiscard]] bool IsEnabled(LogLevel level);

    /// Forward to the sink when level passes the filter. A null sink drops
    /// everything.
    void Write(LogLevel level, std::string_view component,
               std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger. Discards everything until InitGlobalLogger is called.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace azmcp
