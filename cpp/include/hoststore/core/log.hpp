#pragma once

#include <atomic>

namespace hoststore::core {

    enum class LogLevel : int {
        Off = 0,
        Error = 1,
        Warn = 2,
        Info = 3,
        Debug = 4,
    };

    // Receives every line that passes the level filter instead of stderr.
    using LogSink = void (*)(LogLevel level, const char* tag, const char* message, void* user);

    extern std::atomic<LogLevel> g_log_level;

    inline void set_log_level(LogLevel level) noexcept {
        g_log_level.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] inline LogLevel get_log_level() noexcept {
        return g_log_level.load(std::memory_order_relaxed);
    }

    [[nodiscard]] inline bool log_enabled(LogLevel level) noexcept {
        return static_cast<int>(level) <= static_cast<int>(get_log_level());
    }

    // Passing nullptr restores the stderr writer.
    void set_log_sink(LogSink sink, void* user) noexcept;

    // Accepts off|error|warn|info|debug; returns false and leaves *out alone otherwise.
    [[nodiscard]] bool parse_log_level(const char* text, LogLevel* out) noexcept;

    void log_write(LogLevel level, const char* tag, const char* fmt, ...) noexcept
        __attribute__((format(printf, 3, 4)));

} // namespace hoststore::core

#define HOSTSTORE_LOG(level, tag, fmt, ...) \
    do { \
        if (::hoststore::core::log_enabled(level)) { \
            ::hoststore::core::log_write(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define HOSTSTORE_LOG_ERROR(tag, fmt, ...) HOSTSTORE_LOG(::hoststore::core::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#define HOSTSTORE_LOG_WARN(tag, fmt, ...)  HOSTSTORE_LOG(::hoststore::core::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#define HOSTSTORE_LOG_INFO(tag, fmt, ...)  HOSTSTORE_LOG(::hoststore::core::LogLevel::Info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define HOSTSTORE_LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define HOSTSTORE_LOG_DEBUG(tag, fmt, ...) HOSTSTORE_LOG(::hoststore::core::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)
#endif
