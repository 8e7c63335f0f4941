#pragma once
#include <string>
#include <type_traits>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"

namespace ferry::core {
    // Persisted status of an upload session. Anything other than InProgress is terminal.
    enum class UploadStatus : u8 {
        InProgress = 0,
        Completed = 1,
        Failed = 2,
        Cancelled = 3,
    };

    [[nodiscard]] constexpr bool upload_status_is_terminal(UploadStatus s) noexcept {
        return s != UploadStatus::InProgress;
    }

    // Only InProgress may move, and only to a terminal status.
    [[nodiscard]] constexpr bool upload_status_can_transition(UploadStatus from, UploadStatus to) noexcept {
        return from == UploadStatus::InProgress && to != UploadStatus::InProgress;
    }

    [[nodiscard]] const char* upload_status_name(UploadStatus s) noexcept;
    [[nodiscard]] bool upload_status_from_name(const char* name, UploadStatus* out) noexcept;

    struct UploadSession {
        std::string id;
        std::string filename;
        std::string mime_type;
        u64 expected_size{0};
        u64 bytes_received{0};
        std::string storage_handle;
        UploadStatus status{UploadStatus::InProgress};
        Timestamp created_at{0};
        Timestamp updated_at{0};
    };

    // Per-row invariants; aux identifies the first violated rule.
    enum class SessionInvariant : u32 {
        None = 0,
        EmptyId = 1,
        EmptyHandle = 2,
        ProgressExceedsSize = 3,
        UpdatedBeforeCreated = 4,
    };

    [[nodiscard]] Status check_session_invariants(const UploadSession& s) noexcept;
    [[nodiscard]] u32 progress_percent(u64 received, u64 expected) noexcept;

    // ========================================================================
    // Protocol phase (tagged union)
    // ========================================================================
    //
    //   Created    -> Receiving | Cancelled
    //   Receiving  -> Receiving | Completing | Cancelled | Failed
    //   Completing -> Completed | Failed | Receiving (commit failed, retryable)
    //   Completed, Cancelled, Failed: terminal

    enum class UploadPhase : u8 {
        Created = 0,
        Receiving = 1,
        Completing = 2,
        Completed = 3,
        Cancelled = 4,
        Failed = 5,
    };

    union PhaseData {
        u64 offset;         // Receiving
        u64 size_bytes;     // Completing, Completed
        StatusCode reason;  // Failed
    };

    struct UploadState {
        PhaseData data{};
        UploadPhase phase{UploadPhase::Created};
    };

    [[nodiscard]] bool upload_phase_can_transition(UploadPhase from, UploadPhase to) noexcept;
    [[nodiscard]] const char* upload_phase_name(UploadPhase p) noexcept;
    [[nodiscard]] UploadState upload_state_of(const UploadSession& s) noexcept;
    [[nodiscard]] UploadStatus upload_phase_status(UploadPhase p) noexcept;

    struct PendingEntry {
        std::string handle;
        std::string display_name;
        u64 size_bytes{0};
        Timestamp modified_at{0};
    };

    struct FinalizedFile {
        std::string upload_id;
        std::string filename;
        std::string mime_type;
        std::string path;
        u64 size_bytes{0};
        Hash256 digest{};
        Timestamp finalized_at{0};
    };

    static_assert(std::is_trivially_copyable_v<UploadState>);
    static_assert(std::is_standard_layout_v<UploadState>);
} // namespace ferry::core
