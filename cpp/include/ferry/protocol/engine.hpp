#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ferry/core/errors.hpp"
#include "ferry/core/events.hpp"
#include "ferry/core/models.hpp"
#include "ferry/core/types.hpp"
#include "ferry/db/session_store.hpp"
#include "ferry/protocol/validation.hpp"
#include "ferry/storage/backend.hpp"

namespace ferry::protocol {
    using ferry::core::Status;
    using ferry::core::Timestamp;
    using ferry::core::UploadSession;
    using ferry::core::UploadStatus;
    using u8 = ferry::core::u8;
    using u64 = ferry::core::u64;
    using i64 = ferry::core::i64;

    struct EngineConfig {
        UploadPolicy policy;
        bool single_active_upload{true};
        // A session counts as active while its last write is this recent.
        // 0: every IN_PROGRESS session counts as active.
        i64 active_window_ms{2 * ferry::core::kMillisPerMinute};
    };

    struct CreateRequest {
        std::string filename;
        std::string mime_type;
        u64 expected_size{0};
    };

    struct CreateResult {
        std::string upload_id;
        u64 offset{0};
        bool completed{false};
    };

    struct OffsetInfo {
        u64 offset{0};
        u64 expected_size{0};
        UploadStatus status{UploadStatus::InProgress};
    };

    struct AppendResult {
        u64 offset{0};          // durable offset after the call, or the expected one on mismatch
        u64 expected_size{0};
        bool completed{false};
    };

    struct Capabilities {
        const char* version{nullptr};
        const char* extensions{nullptr};
        u64 max_size{0};  // 0: no limit advertised
    };

    enum class ReconcileOutcome : u8 {
        Unchanged = 0,
        Repaired = 1,
        Finalized = 2,
        MarkedFailed = 3,
    };

    // Resumable-upload state machine over a SessionStore and a
    // StorageBackend. All operations on one upload id are serialized by a
    // per-session mutex; different ids proceed in parallel. The backend's
    // durable size is the authoritative offset.
    class ProtocolEngine {
    public:
        ProtocolEngine(ferry::db::SessionStore& store,
            ferry::storage::StorageBackend& backend,
            ferry::core::EventBus& events,
            EngineConfig cfg);

        ProtocolEngine(const ProtocolEngine&) = delete;
        ProtocolEngine& operator=(const ProtocolEngine&) = delete;

        [[nodiscard]] Status create(const CreateRequest& req, CreateResult* out) noexcept;
        // Gone for cancelled or failed sessions; out is still filled.
        [[nodiscard]] Status query_offset(const std::string& id, OffsetInfo* out) noexcept;
        // Conflict when offset differs from the durable offset (out->offset holds it).
        [[nodiscard]] Status append(const std::string& id, u64 offset, ferry::storage::BufferView chunk, AppendResult* out) noexcept;
        // Commits a fully received session. Idempotent for completed ones.
        [[nodiscard]] Status finalize(const std::string& id) noexcept;
        // Idempotent on terminal sessions; NotFound for unknown ids.
        [[nodiscard]] Status cancel(const std::string& id) noexcept;
        [[nodiscard]] Capabilities capabilities() const noexcept;

        // Re-checks one IN_PROGRESS session against storage.
        [[nodiscard]] Status reconcile_session(const std::string& id, ReconcileOutcome* outcome) noexcept;
        // Removes an IN_PROGRESS session idle since before cutoff, storage entry first.
        [[nodiscard]] Status expire_session(const std::string& id, Timestamp cutoff, bool* expired) noexcept;
        // Holds off create() so a sweep can snapshot storage and metadata consistently.
        [[nodiscard]] std::unique_lock<std::mutex> pause_creates();

        [[nodiscard]] Status list_resumable(std::vector<UploadSession>* out) noexcept;
        [[nodiscard]] Status active_upload_count(u64* out) noexcept;
        [[nodiscard]] const EngineConfig& config() const noexcept { return cfg_; }

    private:
        [[nodiscard]] std::shared_ptr<std::mutex> session_lock(const std::string& id);
        [[nodiscard]] Status check_busy(const std::string& exclude_id) noexcept;
        [[nodiscard]] Status sync_durable(UploadSession& s, u64* durable) noexcept;
        [[nodiscard]] Status finalize_locked(UploadSession& s) noexcept;
        [[nodiscard]] Status complete_locked(UploadSession& s, ferry::storage::CommitResult commit) noexcept;
        // The pending entry is gone. Completes the session when the backend
        // holds a commit for it, marks it failed otherwise (returns Gone).
        [[nodiscard]] Status resolve_missing_locked(UploadSession& s) noexcept;
        void mark_failed_locked(UploadSession& s, ferry::core::StatusCode reason) noexcept;
        void publish(ferry::core::UploadEventType type, const UploadSession& s) const noexcept;

        ferry::db::SessionStore& store_;
        ferry::storage::StorageBackend& backend_;
        ferry::core::EventBus& events_;
        EngineConfig cfg_;

        std::mutex create_mutex_;
        std::mutex locks_mutex_;
        std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;
    };
} // namespace ferry::protocol
