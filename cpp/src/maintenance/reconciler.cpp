#include "ferry/maintenance/reconciler.hpp"

#include <string>
#include <unordered_set>

#include "ferry/core/log.hpp"

namespace ferry::maintenance {

using namespace ferry::core;

OrphanReconciler::OrphanReconciler(ferry::db::SessionStore& store,
    ferry::storage::StorageBackend& backend,
    ferry::protocol::ProtocolEngine& engine) noexcept
    : store_(store), backend_(backend), engine_(engine) {
}

Status OrphanReconciler::run(ReconcileReport* report) noexcept {
    if (report == nullptr) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    *report = ReconcileReport{};

    std::vector<PendingEntry> pending;
    std::vector<UploadSession> live;
    {
        // Creates insert the placeholder before the row; pausing them keeps
        // a half-created session from looking like an orphan.
        auto guard = engine_.pause_creates();
        Status s = backend_.list_pending(&pending);
        if (!is_ok(s)) {
            log_error("reconcile: cannot list pending entries (%s)", status_code_name(s.code));
            return s;
        }
        s = store_.list_by_status(UploadStatus::InProgress, &live);
        if (!is_ok(s)) {
            log_error("reconcile: cannot list sessions (%s)", status_code_name(s.code));
            return s;
        }
    }

    std::unordered_set<std::string> live_handles;
    for (const UploadSession& s : live) {
        live_handles.insert(s.storage_handle);
    }

    // ====================================================================
    // Storage -> metadata
    // ====================================================================
    report->pending_seen = pending.size();
    for (PendingEntry& entry : pending) {
        if (live_handles.count(entry.handle) != 0) {
            continue;
        }
        const Status s = backend_.cancel(entry.handle);
        if (is_ok(s) || s.code == StatusCode::NotFound) {
            log_info("reconcile: removed orphaned entry %s (%s, %llu bytes)", entry.handle.c_str(),
                entry.display_name.c_str(), static_cast<unsigned long long>(entry.size_bytes));
            ++report->orphans_deleted;
        } else {
            log_warn("reconcile: could not remove orphaned entry %s (%s)", entry.handle.c_str(),
                status_code_name(s.code));
            ++report->errors;
        }
        report->orphans.push_back(std::move(entry));
    }

    // ====================================================================
    // Metadata -> storage
    // ====================================================================
    for (const UploadSession& session : live) {
        ++report->sessions_checked;
        ferry::protocol::ReconcileOutcome outcome = ferry::protocol::ReconcileOutcome::Unchanged;
        const Status s = engine_.reconcile_session(session.id, &outcome);
        if (!is_ok(s)) {
            log_warn("reconcile: session %s not reconciled (%s)", session.id.c_str(), status_code_name(s.code));
            ++report->errors;
            continue;
        }
        switch (outcome) {
            case ferry::protocol::ReconcileOutcome::Unchanged:
                break;
            case ferry::protocol::ReconcileOutcome::Repaired:
                ++report->sessions_repaired;
                break;
            case ferry::protocol::ReconcileOutcome::Finalized:
                ++report->sessions_finalized;
                break;
            case ferry::protocol::ReconcileOutcome::MarkedFailed:
                ++report->sessions_failed;
                break;
        }
    }

    if (report->orphans_deleted > 0 || report->sessions_failed > 0 || report->sessions_finalized > 0) {
        log_info("reconcile: %llu orphans removed, %llu sessions failed, %llu finalized",
            static_cast<unsigned long long>(report->orphans_deleted),
            static_cast<unsigned long long>(report->sessions_failed),
            static_cast<unsigned long long>(report->sessions_finalized));
    }
    return ok_status();
}

} // namespace ferry::maintenance
