#pragma once

#include <atomic>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"
#include "ferry/db/session_store.hpp"
#include "ferry/maintenance/reconciler.hpp"
#include "ferry/protocol/engine.hpp"

namespace ferry::maintenance {
    using ferry::core::Timestamp;
    using i64 = ferry::core::i64;

    struct CleanupConfig {
        i64 session_ttl_ms{24 * ferry::core::kMillisPerHour};
        i64 finished_retention_ms{24 * ferry::core::kMillisPerHour};
        i64 interval_ms{6 * ferry::core::kMillisPerHour};
    };

    struct SweepReport {
        u64 sessions_expired{0};
        u64 finished_removed{0};
        u64 errors{0};
        ReconcileReport reconcile;
    };

    // Periodic maintenance on a steady_timer of the given io_context:
    // expires idle sessions, drops old terminal rows, then reconciles.
    // Call stop() before the io_context's threads are joined.
    class CleanupScheduler {
    public:
        CleanupScheduler(boost::asio::io_context& ioc,
            ferry::db::SessionStore& store,
            ferry::protocol::ProtocolEngine& engine,
            OrphanReconciler& reconciler,
            CleanupConfig cfg);
        ~CleanupScheduler();

        CleanupScheduler(const CleanupScheduler&) = delete;
        CleanupScheduler& operator=(const CleanupScheduler&) = delete;

        // One full sweep as of `now`. Item failures are logged, counted and retried next sweep.
        [[nodiscard]] Status run_once(Timestamp now, SweepReport* report) noexcept;

        void start();
        void stop();
        [[nodiscard]] u64 sweeps_completed() const noexcept { return sweeps_.load(); }

    private:
        void schedule();
        [[nodiscard]] Status sweep_locked(Timestamp now, SweepReport* report) noexcept;

        boost::asio::steady_timer timer_;
        ferry::db::SessionStore& store_;
        ferry::protocol::ProtocolEngine& engine_;
        OrphanReconciler& reconciler_;
        CleanupConfig cfg_;

        std::mutex run_mutex_;
        bool running_{false};
        std::atomic<u64> sweeps_{0};
    };
} // namespace ferry::maintenance
