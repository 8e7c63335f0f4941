#include "ferry/protocol/engine.hpp"

#include <iterator>
#include <limits>
#include <utility>

#include "ferry/core/log.hpp"
#include "ferry/protocol/tus.hpp"
#include "ferry/security/tokens.hpp"

namespace ferry::protocol {

using namespace ferry::core;

namespace {
    constexpr u32 kUploadIdBytes = 16;
    constexpr size_t kLockTablePurgeThreshold = 64;

    [[nodiscard]] Status protocol_status(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Protocol, code, aux);
    }
} // namespace

ProtocolEngine::ProtocolEngine(ferry::db::SessionStore& store,
    ferry::storage::StorageBackend& backend,
    EventBus& events,
    EngineConfig cfg)
    : store_(store), backend_(backend), events_(events), cfg_(std::move(cfg)) {
}

// ========================================================================
// Locking
// ========================================================================

std::shared_ptr<std::mutex> ProtocolEngine::session_lock(const std::string& id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = locks_.find(id);
    if (it != locks_.end()) {
        if (auto m = it->second.lock()) {
            return m;
        }
    }
    if (locks_.size() >= kLockTablePurgeThreshold) {
        for (auto i = locks_.begin(); i != locks_.end();) {
            i = i->second.expired() ? locks_.erase(i) : std::next(i);
        }
    }
    auto m = std::make_shared<std::mutex>();
    locks_[id] = m;
    return m;
}

std::unique_lock<std::mutex> ProtocolEngine::pause_creates() {
    return std::unique_lock<std::mutex>(create_mutex_);
}

Status ProtocolEngine::check_busy(const std::string& exclude_id) noexcept {
    if (!cfg_.single_active_upload) {
        return ok_status();
    }
    const Timestamp since = (cfg_.active_window_ms > 0)
        ? now_ms() - cfg_.active_window_ms
        : std::numeric_limits<Timestamp>::min();
    UploadSession other;
    bool found = false;
    const Status s = store_.find_active(since, exclude_id, &other, &found);
    if (!is_ok(s)) {
        return s;
    }
    if (found) {
        log_info("upload %s rejected: %s is active", exclude_id.empty() ? "(new)" : exclude_id.c_str(),
            other.id.c_str());
        return protocol_status(StatusCode::Busy);
    }
    return ok_status();
}

// ========================================================================
// Internal state transitions
// ========================================================================

void ProtocolEngine::publish(UploadEventType type, const UploadSession& s) const noexcept {
    UploadEvent event;
    event.type = type;
    event.upload_id = s.id;
    event.filename = s.filename;
    event.bytes_received = s.bytes_received;
    event.expected_size = s.expected_size;
    events_.publish(event);
}

Status ProtocolEngine::sync_durable(UploadSession& s, u64* durable) noexcept {
    u64 size = 0;
    Status st = backend_.durable_size(s.storage_handle, &size);
    if (!is_ok(st)) {
        return st;
    }
    if (size > s.expected_size) {
        log_error("upload %s: storage holds %llu bytes, more than the declared %llu",
            s.id.c_str(), static_cast<unsigned long long>(size), static_cast<unsigned long long>(s.expected_size));
        return protocol_status(StatusCode::Corrupt);
    }
    if (size != s.bytes_received) {
        log_warn("upload %s: metadata offset %llu disagrees with storage %llu, using storage",
            s.id.c_str(), static_cast<unsigned long long>(s.bytes_received), static_cast<unsigned long long>(size));
        st = store_.update_progress(s.id, size, now_ms());
        if (!is_ok(st)) {
            log_warn("upload %s: could not repair metadata offset", s.id.c_str());
        }
        s.bytes_received = size;
    }
    *durable = size;
    return ok_status();
}

void ProtocolEngine::mark_failed_locked(UploadSession& s, StatusCode reason) noexcept {
    const Status st = store_.update_status(s.id, UploadStatus::Failed, now_ms());
    if (!is_ok(st)) {
        log_error("upload %s: could not mark failed (%s)", s.id.c_str(), status_code_name(st.code));
        return;
    }
    log_warn("upload %s (%s) is no longer resumable", s.id.c_str(), s.filename.c_str());
    s.status = UploadStatus::Failed;
    UploadEvent event;
    event.type = UploadEventType::Failed;
    event.upload_id = s.id;
    event.filename = s.filename;
    event.bytes_received = s.bytes_received;
    event.expected_size = s.expected_size;
    event.reason = reason;
    events_.publish(event);
}

Status ProtocolEngine::finalize_locked(UploadSession& s) noexcept {
    const UploadState state = upload_state_of(s);
    if (!upload_phase_can_transition(state.phase, UploadPhase::Completing)) {
        return protocol_status(StatusCode::Conflict);
    }

    ferry::storage::CommitResult commit;
    Status st = backend_.finalize(s.storage_handle, &commit);
    if (!is_ok(st)) {
        // Completing -> Receiving: the session stays resumable and finalize can be retried.
        log_error("upload %s: commit failed (%s), session stays in progress",
            s.id.c_str(), status_code_name(st.code));
        return st;
    }

    return complete_locked(s, std::move(commit));
}

Status ProtocolEngine::complete_locked(UploadSession& s, ferry::storage::CommitResult commit) noexcept {
    const Timestamp now = now_ms();
    Status st = ok_status();
    if (s.bytes_received != s.expected_size) {
        st = store_.update_progress(s.id, s.expected_size, now);
        if (!is_ok(st)) {
            log_warn("upload %s: final offset not recorded (%s)", s.id.c_str(), status_code_name(st.code));
        }
    }
    st = store_.update_status(s.id, UploadStatus::Completed, now);
    if (!is_ok(st)) {
        // The commit record stays; the next access to this session completes it.
        log_error("upload %s: committed to %s but status update failed (%s)",
            s.id.c_str(), commit.path.c_str(), status_code_name(st.code));
        return st;
    }
    s.status = UploadStatus::Completed;
    s.bytes_received = s.expected_size;
    log_info("upload %s complete: %s (%llu bytes)", s.id.c_str(), commit.path.c_str(),
        static_cast<unsigned long long>(commit.size_bytes));

    st = backend_.release_commit(s.storage_handle);
    if (!is_ok(st) && st.code != StatusCode::NotFound) {
        log_warn("upload %s: commit record not released (%s)", s.id.c_str(), status_code_name(st.code));
    }

    UploadEvent event;
    event.type = UploadEventType::Finalized;
    event.upload_id = s.id;
    event.filename = s.filename;
    event.bytes_received = s.bytes_received;
    event.expected_size = s.expected_size;
    event.file.upload_id = s.id;
    event.file.filename = s.filename;
    event.file.mime_type = s.mime_type;
    event.file.path = std::move(commit.path);
    event.file.size_bytes = commit.size_bytes;
    event.file.digest = commit.digest;
    event.file.finalized_at = now;
    events_.publish(event);
    return ok_status();
}

Status ProtocolEngine::resolve_missing_locked(UploadSession& s) noexcept {
    ferry::storage::CommitResult commit;
    const Status st = backend_.committed(s.storage_handle, &commit);
    if (is_ok(st)) {
        log_warn("upload %s: pending entry already committed to %s, completing session",
            s.id.c_str(), commit.path.c_str());
        return complete_locked(s, std::move(commit));
    }
    if (st.code != StatusCode::NotFound) {
        return st;
    }
    mark_failed_locked(s, StatusCode::NotFound);
    return protocol_status(StatusCode::Gone);
}

// ========================================================================
// Operations
// ========================================================================

Status ProtocolEngine::create(const CreateRequest& req, CreateResult* out) noexcept {
    if (out == nullptr) {
        return protocol_status(StatusCode::Invalid);
    }
    *out = CreateResult{};

    Status s = validate_upload_request(cfg_.policy, req.filename, req.mime_type, req.expected_size);
    if (!is_ok(s)) {
        return s;
    }

    std::unique_lock<std::mutex> create_guard(create_mutex_);

    s = check_busy(std::string{});
    if (!is_ok(s)) {
        return s;
    }

    u64 available = 0;
    s = backend_.available_bytes(&available);
    if (is_ok(s)) {
        s = check_free_space(cfg_.policy, available, req.expected_size);
        if (!is_ok(s)) {
            log_warn("upload of %s refused: %llu bytes requested, %llu available",
                req.filename.c_str(), static_cast<unsigned long long>(req.expected_size),
                static_cast<unsigned long long>(available));
            return s;
        }
    } else {
        log_warn("free space check skipped: %s", status_code_name(s.code));
    }

    UploadSession session;
    s = ferry::security::random_token_hex(kUploadIdBytes, &session.id);
    if (!is_ok(s)) {
        return s;
    }

    ferry::storage::PendingCreateParams params;
    params.display_name = req.filename;
    params.mime_type = req.mime_type.empty() ? guess_mime_type(req.filename) : req.mime_type;
    params.expected_size = req.expected_size;
    s = backend_.create_pending(params, &session.storage_handle);
    if (!is_ok(s)) {
        log_error("upload of %s: cannot create pending entry (%s)", req.filename.c_str(), status_code_name(s.code));
        return s;
    }

    const Timestamp now = now_ms();
    session.filename = req.filename;
    session.mime_type = params.mime_type;
    session.expected_size = req.expected_size;
    session.bytes_received = 0;
    session.status = UploadStatus::InProgress;
    session.created_at = now;
    session.updated_at = now;

    s = store_.insert(session);
    if (!is_ok(s)) {
        // Session row and placeholder exist together or not at all.
        const Status undo = backend_.cancel(session.storage_handle);
        if (!is_ok(undo) && undo.code != StatusCode::NotFound) {
            log_error("upload of %s: orphaned pending entry %s left for the next sweep",
                req.filename.c_str(), session.storage_handle.c_str());
        }
        return s;
    }
    create_guard.unlock();

    log_info("upload %s created: %s, %llu bytes", session.id.c_str(), session.filename.c_str(),
        static_cast<unsigned long long>(session.expected_size));
    publish(UploadEventType::Created, session);

    out->upload_id = session.id;
    out->offset = 0;

    if (session.expected_size == 0) {
        auto m = session_lock(session.id);
        std::lock_guard<std::mutex> lock(*m);
        s = finalize_locked(session);
        if (!is_ok(s)) {
            return s;
        }
        out->completed = true;
    }
    return ok_status();
}

Status ProtocolEngine::query_offset(const std::string& id, OffsetInfo* out) noexcept {
    if (out == nullptr) {
        return protocol_status(StatusCode::Invalid);
    }
    auto m = session_lock(id);
    std::lock_guard<std::mutex> lock(*m);

    UploadSession s;
    Status st = store_.get(id, &s);
    if (!is_ok(st)) {
        return st;
    }
    out->expected_size = s.expected_size;
    out->status = s.status;
    out->offset = s.bytes_received;

    switch (s.status) {
        case UploadStatus::Completed:
            out->offset = s.expected_size;
            return ok_status();
        case UploadStatus::Cancelled:
        case UploadStatus::Failed:
            return protocol_status(StatusCode::Gone);
        case UploadStatus::InProgress:
            break;
    }

    u64 durable = 0;
    st = sync_durable(s, &durable);
    if (st.code == StatusCode::NotFound) {
        st = resolve_missing_locked(s);
        out->status = s.status;
        if (is_ok(st)) {
            out->offset = s.expected_size;
        }
        return st;
    }
    if (!is_ok(st)) {
        return st;
    }
    out->offset = durable;
    return ok_status();
}

Status ProtocolEngine::append(const std::string& id, u64 offset, ferry::storage::BufferView chunk, AppendResult* out) noexcept {
    if (out == nullptr || !ferry::storage::buffer_ok(chunk)) {
        return protocol_status(StatusCode::Invalid);
    }
    *out = AppendResult{};

    auto m = session_lock(id);
    std::lock_guard<std::mutex> lock(*m);

    UploadSession s;
    Status st = store_.get(id, &s);
    if (!is_ok(st)) {
        return st;
    }
    out->expected_size = s.expected_size;

    if (s.status == UploadStatus::Completed) {
        out->offset = s.expected_size;
        if (offset == s.expected_size && chunk.len == 0) {
            // Retry of the final, already committed append.
            out->completed = true;
            return ok_status();
        }
        return protocol_status(StatusCode::Gone);
    }
    if (upload_status_is_terminal(s.status)) {
        out->offset = s.bytes_received;
        return protocol_status(StatusCode::Gone);
    }

    st = check_busy(id);
    if (!is_ok(st)) {
        out->offset = s.bytes_received;
        return st;
    }

    u64 durable = 0;
    st = sync_durable(s, &durable);
    if (st.code == StatusCode::NotFound) {
        st = resolve_missing_locked(s);
        if (!is_ok(st)) {
            return st;
        }
        out->offset = s.expected_size;
        if (offset == s.expected_size && chunk.len == 0) {
            out->completed = true;
            return ok_status();
        }
        return protocol_status(StatusCode::Gone);
    }
    if (!is_ok(st)) {
        return st;
    }
    out->offset = durable;

    if (offset != durable) {
        return protocol_status(StatusCode::Conflict);
    }
    if (chunk.len > s.expected_size - durable) {
        return protocol_status(StatusCode::TooLarge);
    }
    if (cfg_.policy.verify_magic && durable == 0 && chunk.len > 0 &&
        !media_header_matches(s.filename, chunk)) {
        return protocol_status(StatusCode::Unsupported, 6);
    }

    if (chunk.len > 0) {
        u64 written = 0;
        st = backend_.append(s.storage_handle, chunk, &written);
        if (st.code == StatusCode::NotFound) {
            st = resolve_missing_locked(s);
            return is_ok(st) ? protocol_status(StatusCode::Gone) : st;
        }
        if (!is_ok(st)) {
            log_error("upload %s: write at offset %llu failed (%s)", s.id.c_str(),
                static_cast<unsigned long long>(durable), status_code_name(st.code));
            return st;
        }
        durable += written;
        s.bytes_received = durable;
        out->offset = durable;

        st = store_.update_progress(s.id, durable, now_ms());
        if (!is_ok(st)) {
            // Storage is authoritative; the next offset query repairs the row.
            log_warn("upload %s: progress not recorded (%s)", s.id.c_str(), status_code_name(st.code));
        }
        publish(UploadEventType::Progress, s);
    }

    if (durable == s.expected_size) {
        st = finalize_locked(s);
        if (!is_ok(st)) {
            return st;
        }
        out->completed = true;
    }
    return ok_status();
}

Status ProtocolEngine::finalize(const std::string& id) noexcept {
    auto m = session_lock(id);
    std::lock_guard<std::mutex> lock(*m);

    UploadSession s;
    Status st = store_.get(id, &s);
    if (!is_ok(st)) {
        return st;
    }
    if (s.status == UploadStatus::Completed) {
        return ok_status();
    }
    if (upload_status_is_terminal(s.status)) {
        return protocol_status(StatusCode::Gone);
    }

    u64 durable = 0;
    st = sync_durable(s, &durable);
    if (st.code == StatusCode::NotFound) {
        return resolve_missing_locked(s);
    }
    if (!is_ok(st)) {
        return st;
    }
    if (durable != s.expected_size) {
        return protocol_status(StatusCode::Conflict);
    }
    return finalize_locked(s);
}

Status ProtocolEngine::cancel(const std::string& id) noexcept {
    auto m = session_lock(id);
    std::lock_guard<std::mutex> lock(*m);

    UploadSession s;
    Status st = store_.get(id, &s);
    if (!is_ok(st)) {
        return st;
    }
    if (upload_status_is_terminal(s.status)) {
        return ok_status();
    }
    // A commit that got ahead of the row cannot be taken back.
    ferry::storage::CommitResult commit;
    if (is_ok(backend_.committed(s.storage_handle, &commit))) {
        return complete_locked(s, std::move(commit));
    }

    st = backend_.cancel(s.storage_handle);
    if (!is_ok(st) && st.code != StatusCode::NotFound) {
        log_error("upload %s: cancel failed to remove pending entry (%s)", id.c_str(), status_code_name(st.code));
        return st;
    }

    st = store_.update_status(id, UploadStatus::Cancelled, now_ms());
    if (!is_ok(st) && st.code != StatusCode::Conflict) {
        return st;
    }
    s.status = UploadStatus::Cancelled;
    log_info("upload %s cancelled at %llu of %llu bytes", id.c_str(),
        static_cast<unsigned long long>(s.bytes_received), static_cast<unsigned long long>(s.expected_size));
    publish(UploadEventType::Cancelled, s);
    return ok_status();
}

Capabilities ProtocolEngine::capabilities() const noexcept {
    Capabilities caps;
    caps.version = kTusVersion;
    caps.extensions = kTusExtensions;
    caps.max_size = cfg_.policy.max_upload_bytes;
    return caps;
}

// ========================================================================
// Maintenance hooks
// ========================================================================

Status ProtocolEngine::reconcile_session(const std::string& id, ReconcileOutcome* outcome) noexcept {
    if (outcome == nullptr) {
        return protocol_status(StatusCode::Invalid);
    }
    *outcome = ReconcileOutcome::Unchanged;

    auto m = session_lock(id);
    std::lock_guard<std::mutex> lock(*m);

    UploadSession s;
    Status st = store_.get(id, &s);
    if (st.code == StatusCode::NotFound) {
        return ok_status();
    }
    if (!is_ok(st)) {
        return st;
    }
    if (upload_status_is_terminal(s.status)) {
        return ok_status();
    }

    const u64 recorded = s.bytes_received;
    u64 durable = 0;
    st = sync_durable(s, &durable);
    if (st.code == StatusCode::NotFound) {
        st = resolve_missing_locked(s);
        if (is_ok(st)) {
            *outcome = ReconcileOutcome::Finalized;
            return ok_status();
        }
        if (st.code != StatusCode::Gone) {
            return st;
        }
        *outcome = ReconcileOutcome::MarkedFailed;
        return ok_status();
    }
    if (!is_ok(st)) {
        return st;
    }
    if (durable != recorded) {
        *outcome = ReconcileOutcome::Repaired;
    }
    if (durable == s.expected_size) {
        st = finalize_locked(s);
        if (!is_ok(st)) {
            return st;
        }
        *outcome = ReconcileOutcome::Finalized;
    }
    return ok_status();
}

Status ProtocolEngine::expire_session(const std::string& id, Timestamp cutoff, bool* expired) noexcept {
    if (expired == nullptr) {
        return protocol_status(StatusCode::Invalid);
    }
    *expired = false;

    auto m = session_lock(id);
    std::lock_guard<std::mutex> lock(*m);

    UploadSession s;
    Status st = store_.get(id, &s);
    if (st.code == StatusCode::NotFound) {
        return ok_status();
    }
    if (!is_ok(st)) {
        return st;
    }
    // Re-check under the lock: the client may have resumed since the listing.
    if (s.status != UploadStatus::InProgress || s.updated_at >= cutoff) {
        return ok_status();
    }
    ferry::storage::CommitResult commit;
    if (is_ok(backend_.committed(s.storage_handle, &commit))) {
        return complete_locked(s, std::move(commit));
    }

    st = backend_.cancel(s.storage_handle);
    if (!is_ok(st) && st.code != StatusCode::NotFound) {
        log_error("upload %s: expiry could not remove pending entry (%s), retrying next sweep",
            id.c_str(), status_code_name(st.code));
        return st;
    }
    st = store_.remove(id);
    if (!is_ok(st) && st.code != StatusCode::NotFound) {
        log_error("upload %s: expiry removed storage but not the session row (%s)", id.c_str(),
            status_code_name(st.code));
        return st;
    }
    log_info("upload %s (%s) expired at %llu of %llu bytes", id.c_str(), s.filename.c_str(),
        static_cast<unsigned long long>(s.bytes_received), static_cast<unsigned long long>(s.expected_size));
    publish(UploadEventType::Expired, s);
    *expired = true;
    return ok_status();
}

Status ProtocolEngine::list_resumable(std::vector<UploadSession>* out) noexcept {
    return store_.list_by_status(UploadStatus::InProgress, out);
}

Status ProtocolEngine::active_upload_count(u64* out) noexcept {
    return store_.count_by_status(UploadStatus::InProgress, out);
}

} // namespace ferry::protocol
