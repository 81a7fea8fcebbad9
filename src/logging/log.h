#pragma once

// ==============================================================================
// Log - Tagged Logging Facade
// ==============================================================================
// Static facade over an injectable sink. The default sink writes to stderr.
// The DSP layer never logs; only the app layer (parameters, controller,
// console) does.
//
// Usage:
//   Log::info("controller", "frame 3 published");
//   Log::setSink(&captureSink);   // tests
//   Log::setSink(nullptr);        // back to stderr
// ==============================================================================

#include <cstdint>
#include <string_view>

namespace Harmonia {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off     ///< Minimum level that suppresses everything
};

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

/// @brief Parse "debug", "info", "warn", "error" or "off".
/// @return false (level untouched) for anything else
[[nodiscard]] bool parseLogLevel(std::string_view text, LogLevel& level) noexcept;

// ==============================================================================
// ILogSink - destination for formatted entries
// ==============================================================================
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// @param level Severity (never Off)
    /// @param tag Subsystem tag ("controller", "params", ...)
    /// @param message Message body
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

// ==============================================================================
// StderrLogSink - default sink: "[LEVEL] tag: message"
// ==============================================================================
class StderrLogSink final : public ILogSink {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override;
};

// ==============================================================================
// Log
// ==============================================================================
class Log final {
public:
    Log() = delete;

    /// @brief Install a sink. nullptr restores the stderr sink.
    /// @note The sink must outlive every log call made while installed.
    static void setSink(ILogSink* sink) noexcept;

    static void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel minLevel() noexcept;
    [[nodiscard]] static bool isEnabled(LogLevel level) noexcept;

    static void write(LogLevel level, std::string_view tag, std::string_view message);

    static void debug(std::string_view tag, std::string_view message) { write(LogLevel::Debug, tag, message); }
    static void info (std::string_view tag, std::string_view message) { write(LogLevel::Info,  tag, message); }
    static void warn (std::string_view tag, std::string_view message) { write(LogLevel::Warn,  tag, message); }
    static void error(std::string_view tag, std::string_view message) { write(LogLevel::Error, tag, message); }
};

} // namespace Harmonia
