#include "ferry/security/tokens.hpp"

#include <vector>

#include "sodium_init.hpp"

namespace ferry::security {
    Status random_token_hex(u32 bytes, std::string* out) noexcept {
        if (out == nullptr || bytes == 0 || bytes > 64) {
            return ferry::core::make_status(ferry::core::StatusDomain::Security, ferry::core::StatusCode::Invalid);
        }
        const Status init = detail::ensure_sodium();
        if (!ferry::core::is_ok(init)) {
            return init;
        }

        unsigned char raw[64];
        randombytes_buf(raw, bytes);
        char hex[64 * 2 + 1];
        sodium_bin2hex(hex, sizeof(hex), raw, bytes);
        sodium_memzero(raw, sizeof(raw));
        out->assign(hex, static_cast<size_t>(bytes) * 2);
        return ferry::core::ok_status();
    }

    Status generate_pin(u32 digits, std::string* out) noexcept {
        if (out == nullptr || digits == 0 || digits > 12) {
            return ferry::core::make_status(ferry::core::StatusDomain::Security, ferry::core::StatusCode::Invalid);
        }
        const Status init = detail::ensure_sodium();
        if (!ferry::core::is_ok(init)) {
            return init;
        }
        out->clear();
        out->reserve(digits);
        for (u32 i = 0; i < digits; ++i) {
            out->push_back(static_cast<char>('0' + randombytes_uniform(10)));
        }
        return ferry::core::ok_status();
    }
} // namespace ferry::security
