#include "ferry/storage/hashing.hpp"

#include <cerrno>
#include <cstddef>

#include <fcntl.h>
#include <unistd.h>

#include <blake3.h>

namespace ferry::storage {
    ferry::core::Status hash_compute(BufferView data, ferry::core::Hash256* out) noexcept {
        if (out == nullptr){
            return ferry::core::make_status(ferry::core::StatusDomain::Storage, ferry::core::StatusCode::Invalid);
        }
        if (!buffer_ok(data)){
            return ferry::core::make_status(ferry::core::StatusDomain::Storage, ferry::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ferry::core::ok_status();
    }

    ferry::core::Status hash_file(const char* path, ferry::core::Hash256* out, ferry::core::u64* size_out) noexcept {
        if (path == nullptr || out == nullptr) {
            return ferry::core::make_status(ferry::core::StatusDomain::Storage, ferry::core::StatusCode::Invalid);
        }
        const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            const auto code = (errno == ENOENT) ? ferry::core::StatusCode::NotFound : ferry::core::StatusCode::Io;
            return ferry::core::make_status(ferry::core::StatusDomain::Storage, code, static_cast<ferry::core::u32>(errno));
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        u8 buf[64 * 1024];
        ferry::core::u64 total = 0;
        while (true) {
            const ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                ::close(fd);
                return ferry::core::make_status(ferry::core::StatusDomain::Storage, ferry::core::StatusCode::Io, static_cast<ferry::core::u32>(err));
            }
            if (n == 0) {
                break;
            }
            blake3_hasher_update(&hasher, buf, static_cast<size_t>(n));
            total += static_cast<ferry::core::u64>(n);
        }
        ::close(fd);

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        if (size_out) {
            *size_out = total;
        }
        return ferry::core::ok_status();
    }

    std::string hash_to_hex(const ferry::core::Hash256& hash) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(hash.b.size() * 2);
        for (u8 b : hash.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }
} // namespace ferry::storage
