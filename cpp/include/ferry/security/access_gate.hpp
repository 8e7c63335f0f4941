#pragma once

#include <mutex>
#include <string>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"

namespace ferry::security {
    using ferry::core::Status;

    inline constexpr const char* kSecretHeader = "X-Upload-Pin";
    inline constexpr const char* kSecretHeaderAlias = "X-Upload-Secret";

    // Optional shared-secret check in front of mutating requests. Disabled
    // gates accept everything. Rotation applies to the next check.
    class AccessGate {
    public:
        AccessGate() = default;

        AccessGate(const AccessGate&) = delete;
        AccessGate& operator=(const AccessGate&) = delete;

        // Invalid when secret is empty.
        [[nodiscard]] Status enable(const std::string& secret);
        void disable();
        [[nodiscard]] Status rotate(const std::string& secret);

        [[nodiscard]] bool enabled() const;

        // presented == nullptr means the header was absent.
        //   disabled                -> Ok
        //   missing or empty        -> Unauthenticated
        //   mismatch                -> PermissionDenied
        [[nodiscard]] Status check(const std::string* presented) const noexcept;

    private:
        mutable std::mutex mutex_;
        bool enabled_{false};
        std::string secret_;
    };
} // namespace ferry::security
