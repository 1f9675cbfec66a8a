#include "hoststore/core/types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace hoststore::core {
    std::string utc_now_iso8601() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const std::time_t secs = system_clock::to_time_t(now);
        const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

        std::tm tm{};
        gmtime_r(&secs, &tm);

        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec,
            static_cast<long long>(micros));
        return buf;
    }

    std::string local_backup_stamp() {
        const std::time_t secs = std::time(nullptr);
        std::tm tm{};
        localtime_r(&secs, &tm);

        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
        return buf;
    }
} // namespace hoststore::core
