#pragma once

#include <string>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"

namespace ferry::security {
    using ferry::core::Status;
    using u32 = ferry::core::u32;

    // Hex encoding of `bytes` CSPRNG bytes. Upload ids use 16 bytes.
    [[nodiscard]] Status random_token_hex(u32 bytes, std::string* out) noexcept;
    // Decimal PIN of exactly `digits` digits, leading zeros allowed.
    [[nodiscard]] Status generate_pin(u32 digits, std::string* out) noexcept;
} // namespace ferry::security
