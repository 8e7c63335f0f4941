#include "ferry/maintenance/cleanup.hpp"

#include <chrono>
#include <vector>

#include "ferry/core/log.hpp"

namespace ferry::maintenance {

using namespace ferry::core;

CleanupScheduler::CleanupScheduler(boost::asio::io_context& ioc,
    ferry::db::SessionStore& store,
    ferry::protocol::ProtocolEngine& engine,
    OrphanReconciler& reconciler,
    CleanupConfig cfg)
    : timer_(ioc), store_(store), engine_(engine), reconciler_(reconciler), cfg_(cfg) {
}

CleanupScheduler::~CleanupScheduler() {
    stop();
}

Status CleanupScheduler::run_once(Timestamp now, SweepReport* report) noexcept {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return sweep_locked(now, report);
}

Status CleanupScheduler::sweep_locked(Timestamp now, SweepReport* report) noexcept {
    if (report == nullptr) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    *report = SweepReport{};

    // 1. Idle sessions past their TTL: storage entry and row go together.
    const Timestamp ttl_cutoff = now - cfg_.session_ttl_ms;
    std::vector<UploadSession> stale;
    Status s = store_.list_stale(UploadStatus::InProgress, ttl_cutoff, &stale);
    if (!is_ok(s)) {
        log_error("cleanup: cannot list stale sessions (%s)", status_code_name(s.code));
        ++report->errors;
    }
    for (const UploadSession& session : stale) {
        bool expired = false;
        s = engine_.expire_session(session.id, ttl_cutoff, &expired);
        if (!is_ok(s)) {
            ++report->errors;
            continue;
        }
        if (expired) {
            ++report->sessions_expired;
        }
    }

    // 2. Terminal rows past retention. Their storage was committed or removed already.
    u64 removed = 0;
    s = store_.remove_finished_before(now - cfg_.finished_retention_ms, &removed);
    if (!is_ok(s)) {
        log_error("cleanup: cannot remove finished sessions (%s)", status_code_name(s.code));
        ++report->errors;
    }
    report->finished_removed = removed;

    // 3. Orphans in either direction.
    s = reconciler_.run(&report->reconcile);
    if (!is_ok(s)) {
        ++report->errors;
    }
    report->errors += report->reconcile.errors;

    sweeps_.fetch_add(1);
    log_info("cleanup: %llu expired, %llu finished removed, %llu orphans removed, %llu errors",
        static_cast<unsigned long long>(report->sessions_expired),
        static_cast<unsigned long long>(report->finished_removed),
        static_cast<unsigned long long>(report->reconcile.orphans_deleted),
        static_cast<unsigned long long>(report->errors));
    return ok_status();
}

void CleanupScheduler::start() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    schedule();
}

void CleanupScheduler::stop() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    running_ = false;
    timer_.cancel();
}

// Called with run_mutex_ held.
void CleanupScheduler::schedule() {
    timer_.expires_after(std::chrono::milliseconds(cfg_.interval_ms));
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!running_) {
            return;
        }
        SweepReport report;
        const Status s = sweep_locked(now_ms(), &report);
        if (!is_ok(s)) {
            log_error("cleanup: sweep failed (%s)", status_code_name(s.code));
        }
        schedule();
    });
}

} // namespace ferry::maintenance
