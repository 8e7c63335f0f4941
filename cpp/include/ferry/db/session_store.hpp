#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "ferry/core/errors.hpp"
#include "ferry/core/models.hpp"
#include "ferry/core/types.hpp"

struct sqlite3;

namespace ferry::db {
    using ferry::core::Status;
    using ferry::core::Timestamp;
    using ferry::core::UploadSession;
    using ferry::core::UploadStatus;
    using u64 = ferry::core::u64;

    // Durable table of upload sessions. One SQLite connection, serialized by
    // an internal mutex; safe to share between the engine, the cleanup sweep
    // and listing endpoints.
    class SessionStore {
    public:
        SessionStore() noexcept = default;
        ~SessionStore() noexcept;

        SessionStore(const SessionStore&) = delete;
        SessionStore& operator=(const SessionStore&) = delete;

        // path may be ":memory:". Applies the schema on first open.
        [[nodiscard]] Status open(const std::string& path) noexcept;
        void close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        // Conflict when id or storage_handle already exists, Invalid when the row breaks invariants.
        [[nodiscard]] Status insert(const UploadSession& session) noexcept;
        [[nodiscard]] Status get(const std::string& id, UploadSession* out) noexcept;
        [[nodiscard]] Status get_by_handle(const std::string& handle, UploadSession* out) noexcept;

        [[nodiscard]] Status list_by_status(UploadStatus status, std::vector<UploadSession>* out) noexcept;
        [[nodiscard]] Status list_all(std::vector<UploadSession>* out) noexcept;
        // Sessions in `status` whose updated_at is strictly before cutoff.
        [[nodiscard]] Status list_stale(UploadStatus status, Timestamp cutoff, std::vector<UploadSession>* out) noexcept;
        // Most recently updated IN_PROGRESS session other than exclude_id with updated_at >= since.
        [[nodiscard]] Status find_active(Timestamp since, const std::string& exclude_id,
            UploadSession* out, bool* found) noexcept;
        [[nodiscard]] Status count_by_status(UploadStatus status, u64* out) noexcept;

        // Only IN_PROGRESS rows accept progress. Gone for terminal rows.
        [[nodiscard]] Status update_progress(const std::string& id, u64 bytes_received, Timestamp now) noexcept;
        // Monotonic: IN_PROGRESS -> terminal only. Conflict when the row is already terminal.
        [[nodiscard]] Status update_status(const std::string& id, UploadStatus to, Timestamp now) noexcept;

        [[nodiscard]] Status remove(const std::string& id) noexcept;
        [[nodiscard]] Status remove_finished_before(Timestamp cutoff, u64* removed) noexcept;

    private:
        sqlite3* db_{nullptr};
        mutable std::mutex mutex_;
    };
} // namespace ferry::db
