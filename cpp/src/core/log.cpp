#include "hoststore/core/log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <strings.h>

namespace hoststore::core {

std::atomic<LogLevel> g_log_level{LogLevel::Warn};

namespace {
    struct SinkState {
        std::mutex mutex;
        LogSink sink = nullptr;
        void* user = nullptr;
    };

    SinkState g_sink;

    const char* level_prefix(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Off: break;
        }
        return "";
    }
}

void set_log_sink(LogSink sink, void* user) noexcept {
    std::lock_guard<std::mutex> lock(g_sink.mutex);
    g_sink.sink = sink;
    g_sink.user = user;
}

bool parse_log_level(const char* text, LogLevel* out) noexcept {
    if (!text || !out) {
        return false;
    }
    struct Entry {
        const char* name;
        LogLevel level;
    };
    static constexpr Entry kLevels[] = {
        {"off", LogLevel::Off},
        {"error", LogLevel::Error},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"info", LogLevel::Info},
        {"debug", LogLevel::Debug},
    };
    for (const Entry& e : kLevels) {
        if (strcasecmp(text, e.name) == 0) {
            *out = e.level;
            return true;
        }
    }
    return false;
}

void log_write(LogLevel level, const char* tag, const char* fmt, ...) noexcept {
    char message[2048];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_sink.mutex);
    if (g_sink.sink) {
        g_sink.sink(level, tag ? tag : "", message, g_sink.user);
        return;
    }
    std::fprintf(stderr, "%s: %s: %s\n", tag ? tag : "hoststore", level_prefix(level), message);
}

} // namespace hoststore::core
