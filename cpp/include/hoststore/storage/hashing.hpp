#pragma once

#include <string>

#include "hoststore/core/errors.hpp"
#include "hoststore/core/types.hpp"

namespace hoststore::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const hoststore::core::Hash256& h) noexcept {
        for (hoststore::core::u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // Streams the file through BLAKE3.
    hoststore::core::Status hash_file(const std::string& path, hoststore::core::Hash256* out) noexcept;

    // Lowercase hex, 64 characters.
    [[nodiscard]] std::string hash_to_hex(const hoststore::core::Hash256& h);

} // namespace hoststore::storage
