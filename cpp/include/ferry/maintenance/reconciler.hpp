#pragma once

#include <vector>

#include "ferry/core/errors.hpp"
#include "ferry/core/models.hpp"
#include "ferry/core/types.hpp"
#include "ferry/db/session_store.hpp"
#include "ferry/protocol/engine.hpp"
#include "ferry/storage/backend.hpp"

namespace ferry::maintenance {
    using ferry::core::Status;
    using u64 = ferry::core::u64;

    struct ReconcileReport {
        u64 pending_seen{0};
        u64 orphans_deleted{0};
        u64 sessions_checked{0};
        u64 sessions_repaired{0};
        u64 sessions_finalized{0};
        u64 sessions_failed{0};
        u64 errors{0};
        std::vector<ferry::core::PendingEntry> orphans;
    };

    // Brings storage and session metadata back into agreement:
    //   pending entries without a live session are deleted,
    //   live sessions whose entry vanished are marked failed,
    //   lagging offsets are repaired and fully received sessions committed.
    // An entry referenced by an IN_PROGRESS session is never deleted.
    class OrphanReconciler {
    public:
        OrphanReconciler(ferry::db::SessionStore& store,
            ferry::storage::StorageBackend& backend,
            ferry::protocol::ProtocolEngine& engine) noexcept;

        // Per-item failures are counted in report->errors and do not abort the sweep.
        [[nodiscard]] Status run(ReconcileReport* report) noexcept;

    private:
        ferry::db::SessionStore& store_;
        ferry::storage::StorageBackend& backend_;
        ferry::protocol::ProtocolEngine& engine_;
    };
} // namespace ferry::maintenance
