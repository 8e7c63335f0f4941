#pragma once

#include <string>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"
#include "ferry/storage/buffer.hpp"

namespace ferry::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const ferry::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    ferry::core::Status hash_compute(BufferView data, ferry::core::Hash256* out) noexcept;
    // Streams the file through BLAKE3; size_out is optional.
    ferry::core::Status hash_file(const char* path, ferry::core::Hash256* out, ferry::core::u64* size_out) noexcept;
    [[nodiscard]] std::string hash_to_hex(const ferry::core::Hash256& hash);

} // namespace ferry::storage
