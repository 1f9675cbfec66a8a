#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace hoststore::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Hash256&, const Hash256&) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // UTC wall clock as ISO-8601 with microseconds and "+00:00", the format stored
    // in the timestamp columns of the prompt database.
    [[nodiscard]] std::string utc_now_iso8601();

    // Local time as YYYYmmdd_HHMMSS, used to stamp backup file names.
    [[nodiscard]] std::string local_backup_stamp();

} // namespace hoststore::core
