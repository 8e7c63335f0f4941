#include "ferry/security/access_gate.hpp"

#include "ferry/core/log.hpp"
#include "sodium_init.hpp"

namespace ferry::security {
    namespace {
        // Equal-length inputs compare in constant time; a length mismatch is rejected up front.
        [[nodiscard]] bool secrets_equal(const std::string& a, const std::string& b) noexcept {
            if (a.size() != b.size()) {
                return false;
            }
            if (a.empty()) {
                return true;
            }
            return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
        }
    } // namespace

    Status AccessGate::enable(const std::string& secret) {
        if (secret.empty()) {
            return ferry::core::make_status(ferry::core::StatusDomain::Security, ferry::core::StatusCode::Invalid);
        }
        const Status init = detail::ensure_sodium();
        if (!ferry::core::is_ok(init)) {
            return init;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        secret_ = secret;
        enabled_ = true;
        return ferry::core::ok_status();
    }

    void AccessGate::disable() {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = false;
        secret_.clear();
    }

    Status AccessGate::rotate(const std::string& secret) {
        const Status s = enable(secret);
        if (ferry::core::is_ok(s)) {
            core::log_info("access gate secret rotated");
        }
        return s;
    }

    bool AccessGate::enabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return enabled_;
    }

    Status AccessGate::check(const std::string* presented) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) {
            return ferry::core::ok_status();
        }
        if (presented == nullptr || presented->empty()) {
            return ferry::core::make_status(ferry::core::StatusDomain::Security, ferry::core::StatusCode::Unauthenticated);
        }
        if (!secrets_equal(*presented, secret_)) {
            return ferry::core::make_status(ferry::core::StatusDomain::Security, ferry::core::StatusCode::PermissionDenied);
        }
        return ferry::core::ok_status();
    }
} // namespace ferry::security
