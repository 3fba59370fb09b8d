#include "loopguard/Log.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string_view>

namespace loopguard {

namespace {

std::atomic<LogLevel> minimumLevel_{LogLevel::Warning};
std::mutex sinkMutex_;
Log::Sink sink_;

std::string escapeJson(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

int64_t currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace

std::string LogEntry::toJsonl() const {
    return fmt::format(R"({{"level":"{}","message":"{}","source":"{}","timestamp_ms":{}}})",
                       toString(level), escapeJson(message), escapeJson(source), timestamp_ms);
}

void Log::setMinimumLevel(LogLevel level) noexcept {
    minimumLevel_.store(level);
}

LogLevel Log::minimumLevel() noexcept {
    return minimumLevel_.load();
}

bool Log::isEnabled(LogLevel level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(minimumLevel_.load());
}

void Log::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sink_ = std::move(sink);
}

void Log::write(LogLevel level, std::string message, const std::source_location& loc) {
    if (!isEnabled(level)) {
        return;
    }
    LogEntry entry{
        level,
        std::move(message),
        fmt::format("{}:{}", loc.file_name(), loc.line()),
        currentTimeMs()
    };

    // The sink runs unlocked so it may log itself
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        sink = sink_;
    }
    if (sink) {
        sink(entry);
        return;
    }
    std::lock_guard<std::mutex> lock(sinkMutex_);
    std::cerr << entry.toJsonl() << std::endl;
}

} // namespace loopguard
