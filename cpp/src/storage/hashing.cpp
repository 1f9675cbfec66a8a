#include "hoststore/storage/hashing.hpp"

#include <cstddef>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <blake3.h>

namespace hoststore::storage {
    hoststore::core::Status hash_file(const std::string& path, hoststore::core::Hash256* out) noexcept {
        if (out == nullptr){
            return hoststore::core::make_status(hoststore::core::StatusDomain::Core, hoststore::core::StatusCode::Invalid);
        }

        int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0){
            return hoststore::core::status_from_errno(hoststore::core::StatusDomain::Core, errno);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        hoststore::core::u8 buf[64 * 1024];
        for (;;){
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n < 0){
                if (errno == EINTR) continue;
                int err = errno;
                close(fd);
                return hoststore::core::status_from_errno(hoststore::core::StatusDomain::Core, err);
            }
            if (n == 0) break;
            blake3_hasher_update(&hasher, buf, static_cast<size_t>(n));
        }
        close(fd);

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return hoststore::core::ok_status();
    }

    std::string hash_to_hex(const hoststore::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string s;
        s.reserve(h.b.size() * 2);
        for (hoststore::core::u8 b : h.b){
            s.push_back(hex[(b >> 4) & 0xF]);
            s.push_back(hex[b & 0xF]);
        }
        return s;
    }
} // namespace hoststore::storage
