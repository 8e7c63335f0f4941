#pragma once

#include <sodium.h>

#include "ferry/core/errors.hpp"

namespace ferry::security::detail {
    [[nodiscard]] inline ferry::core::Status ensure_sodium() noexcept {
        if (sodium_init() < 0) {
            return ferry::core::make_status(ferry::core::StatusDomain::External, ferry::core::StatusCode::Unavailable);
        }
        return ferry::core::ok_status();
    }
} // namespace ferry::security::detail
