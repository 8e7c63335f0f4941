#include "ferry/core/models.hpp"

#include <cstring>

namespace ferry::core {
    namespace {
        struct StatusName {
            UploadStatus status;
            const char* name;
        };

        constexpr StatusName kStatusNames[] = {
            {UploadStatus::InProgress, "IN_PROGRESS"},
            {UploadStatus::Completed, "COMPLETED"},
            {UploadStatus::Failed, "FAILED"},
            {UploadStatus::Cancelled, "CANCELLED"},
        };

        [[nodiscard]] Status invariant_violation(SessionInvariant which) noexcept {
            return make_status(StatusDomain::Core, StatusCode::Invalid, static_cast<u32>(which));
        }
    } // namespace

    const char* upload_status_name(UploadStatus s) noexcept {
        for (const StatusName& n : kStatusNames) {
            if (n.status == s) {
                return n.name;
            }
        }
        return "UNKNOWN";
    }

    bool upload_status_from_name(const char* name, UploadStatus* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (const StatusName& n : kStatusNames) {
            if (std::strcmp(n.name, name) == 0) {
                *out = n.status;
                return true;
            }
        }
        return false;
    }

    Status check_session_invariants(const UploadSession& s) noexcept {
        if (s.id.empty()) {
            return invariant_violation(SessionInvariant::EmptyId);
        }
        if (s.storage_handle.empty()) {
            return invariant_violation(SessionInvariant::EmptyHandle);
        }
        if (s.bytes_received > s.expected_size) {
            return invariant_violation(SessionInvariant::ProgressExceedsSize);
        }
        if (s.updated_at < s.created_at) {
            return invariant_violation(SessionInvariant::UpdatedBeforeCreated);
        }
        return ok_status();
    }

    u32 progress_percent(u64 received, u64 expected) noexcept {
        if (expected == 0) {
            return 100;
        }
        if (received >= expected) {
            return 100;
        }
        // received < expected, so the quotient fits and never rounds up to 100
        return static_cast<u32>((static_cast<long double>(received) * 100.0L) / static_cast<long double>(expected));
    }

    bool upload_phase_can_transition(UploadPhase from, UploadPhase to) noexcept {
        switch (from) {
            case UploadPhase::Created:
                return to == UploadPhase::Receiving || to == UploadPhase::Cancelled;
            case UploadPhase::Receiving:
                return to == UploadPhase::Receiving || to == UploadPhase::Completing ||
                       to == UploadPhase::Cancelled || to == UploadPhase::Failed;
            case UploadPhase::Completing:
                return to == UploadPhase::Completed || to == UploadPhase::Failed ||
                       to == UploadPhase::Receiving;
            case UploadPhase::Completed:
            case UploadPhase::Cancelled:
            case UploadPhase::Failed:
                return false;
        }
        return false;
    }

    const char* upload_phase_name(UploadPhase p) noexcept {
        switch (p) {
            case UploadPhase::Created: return "created";
            case UploadPhase::Receiving: return "receiving";
            case UploadPhase::Completing: return "completing";
            case UploadPhase::Completed: return "completed";
            case UploadPhase::Cancelled: return "cancelled";
            case UploadPhase::Failed: return "failed";
        }
        return "unknown";
    }

    UploadState upload_state_of(const UploadSession& s) noexcept {
        UploadState st{};
        switch (s.status) {
            case UploadStatus::InProgress:
                if (s.bytes_received == 0 && s.expected_size > 0) {
                    st.phase = UploadPhase::Created;
                    st.data.offset = 0;
                } else {
                    st.phase = UploadPhase::Receiving;
                    st.data.offset = s.bytes_received;
                }
                break;
            case UploadStatus::Completed:
                st.phase = UploadPhase::Completed;
                st.data.size_bytes = s.expected_size;
                break;
            case UploadStatus::Cancelled:
                st.phase = UploadPhase::Cancelled;
                st.data.offset = s.bytes_received;
                break;
            case UploadStatus::Failed:
                st.phase = UploadPhase::Failed;
                st.data.reason = StatusCode::Unknown;
                break;
        }
        return st;
    }

    UploadStatus upload_phase_status(UploadPhase p) noexcept {
        switch (p) {
            case UploadPhase::Completed: return UploadStatus::Completed;
            case UploadPhase::Cancelled: return UploadStatus::Cancelled;
            case UploadPhase::Failed: return UploadStatus::Failed;
            case UploadPhase::Created:
            case UploadPhase::Receiving:
            case UploadPhase::Completing:
                return UploadStatus::InProgress;
        }
        return UploadStatus::InProgress;
    }
} // namespace ferry::core
