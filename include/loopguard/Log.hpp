#pragma once

#include <cstdint>
#include <functional>
#include <source_location>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace loopguard {

// ============================================================================
// JSONL Structured Logging
// ============================================================================

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

[[nodiscard]] constexpr const char* toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

/**
 * JSONL formatted log entry for machine-readable logging.
 */
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string source;
    int64_t timestamp_ms;

    [[nodiscard]] std::string toJsonl() const;
};

/**
 * Process-wide logger.
 *
 * Entries below the minimum level are dropped before formatting. The
 * default sink writes one JSON line per entry to std::cerr, serialized
 * across threads. A custom sink is called without any lock held, so it
 * may log itself but must be safe to call concurrently.
 */
class Log {
public:
    using Sink = std::function<void(const LogEntry&)>;

    static void setMinimumLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel minimumLevel() noexcept;
    [[nodiscard]] static bool isEnabled(LogLevel level) noexcept;

    /**
     * Replace the sink. Passing an empty function restores the stderr sink.
     */
    static void setSink(Sink sink);

    static void write(LogLevel level, std::string message,
                      const std::source_location& loc = std::source_location::current());

    template<typename... Args>
    static void debug(const std::source_location& loc, fmt::format_string<Args...> formatString, Args&&... args) {
        if (isEnabled(LogLevel::Debug)) {
            write(LogLevel::Debug, fmt::format(formatString, std::forward<Args>(args)...), loc);
        }
    }

    template<typename... Args>
    static void error(const std::source_location& loc, fmt::format_string<Args...> formatString, Args&&... args) {
        if (isEnabled(LogLevel::Error)) {
            write(LogLevel::Error, fmt::format(formatString, std::forward<Args>(args)...), loc);
        }
    }

private:
    Log() = delete;
};

} // namespace loopguard
