#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "ferry/core/events.hpp"
#include "ferry/db/session_store.hpp"
#include "ferry/maintenance/cleanup.hpp"
#include "ferry/maintenance/reconciler.hpp"
#include "ferry/protocol/engine.hpp"
#include "ferry/storage/fs_backend.hpp"
#include "test_support.hpp"

using namespace ferry::core;
using namespace ferry::maintenance;
using ferry::protocol::AppendResult;
using ferry::protocol::CreateRequest;
using ferry::protocol::CreateResult;
using ferry::test::pattern_bytes;
using ferry::test::view;

namespace {
    class MaintenanceTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ASSERT_TRUE(is_ok(store_.open(dir_.sub("sessions.db"))));
            ferry::storage::FsBackendConfig bcfg;
            bcfg.root = dir_.path();
            fs_ = std::make_unique<ferry::storage::FsStorageBackend>(bcfg);
            ASSERT_TRUE(is_ok(fs_->init()));
            ferry::protocol::EngineConfig cfg;
            cfg.single_active_upload = false;
            engine_ = std::make_unique<ferry::protocol::ProtocolEngine>(store_, *fs_, events_, cfg);
            reconciler_ = std::make_unique<OrphanReconciler>(store_, *fs_, *engine_);
        }

        UploadSession create(const std::string& name, u64 size) {
            CreateRequest req;
            req.filename = name;
            req.expected_size = size;
            CreateResult res;
            EXPECT_TRUE(is_ok(engine_->create(req, &res)));
            UploadSession s;
            EXPECT_TRUE(is_ok(store_.get(res.upload_id, &s)));
            return s;
        }

        std::string stray_entry(const std::string& name) {
            ferry::storage::PendingCreateParams p;
            p.display_name = name;
            p.expected_size = 10;
            std::string handle;
            EXPECT_TRUE(is_ok(fs_->create_pending(p, &handle)));
            return handle;
        }

        ferry::test::TempDir dir_;
        EventBus events_;
        ferry::db::SessionStore store_;
        std::unique_ptr<ferry::storage::FsStorageBackend> fs_;
        std::unique_ptr<ferry::protocol::ProtocolEngine> engine_;
        std::unique_ptr<OrphanReconciler> reconciler_;
    };
} // namespace

TEST_F(MaintenanceTest, ReconcilerRemovesOrphansOnly) {
    const UploadSession live = create("live.mp4", 100);
    const std::string stray = stray_entry("stray.mp4");

    ReconcileReport report;
    ASSERT_TRUE(is_ok(reconciler_->run(&report)));
    EXPECT_EQ(report.pending_seen, 2u);
    EXPECT_EQ(report.orphans_deleted, 1u);
    ASSERT_EQ(report.orphans.size(), 1u);
    EXPECT_EQ(report.orphans[0].handle, stray);
    EXPECT_EQ(report.orphans[0].display_name, "stray.mp4");
    EXPECT_EQ(report.sessions_checked, 1u);
    EXPECT_EQ(report.errors, 0u);

    u64 size = 0;
    EXPECT_TRUE(is_ok(fs_->durable_size(live.storage_handle, &size)));
    EXPECT_EQ(fs_->durable_size(stray, &size).code, StatusCode::NotFound);
}

TEST_F(MaintenanceTest, ReconcilerFailsSessionsWithoutStorage) {
    const UploadSession s = create("gone.mp4", 100);
    ASSERT_TRUE(is_ok(fs_->cancel(s.storage_handle)));

    ReconcileReport report;
    ASSERT_TRUE(is_ok(reconciler_->run(&report)));
    EXPECT_EQ(report.sessions_failed, 1u);

    UploadSession after;
    ASSERT_TRUE(is_ok(store_.get(s.id, &after)));
    EXPECT_EQ(after.status, UploadStatus::Failed);
}

TEST_F(MaintenanceTest, ReconcilerRepairsLaggingOffset) {
    const UploadSession s = create("lag.mp4", 100);
    const auto data = pattern_bytes(100);
    u64 written = 0;
    // Bytes that reached storage but whose progress was never recorded.
    ASSERT_TRUE(is_ok(fs_->append(s.storage_handle, view(data, 0, 30), &written)));

    ReconcileReport report;
    ASSERT_TRUE(is_ok(reconciler_->run(&report)));
    EXPECT_EQ(report.sessions_repaired, 1u);

    UploadSession after;
    ASSERT_TRUE(is_ok(store_.get(s.id, &after)));
    EXPECT_EQ(after.bytes_received, 30u);
    EXPECT_EQ(after.status, UploadStatus::InProgress);
}

TEST_F(MaintenanceTest, ReconcilerCommitsFullyReceivedSession) {
    const UploadSession s = create("full.mkv", 64);
    const auto data = pattern_bytes(64);
    u64 written = 0;
    ASSERT_TRUE(is_ok(fs_->append(s.storage_handle, view(data), &written)));

    ReconcileReport report;
    ASSERT_TRUE(is_ok(reconciler_->run(&report)));
    EXPECT_EQ(report.sessions_finalized, 1u);

    UploadSession after;
    ASSERT_TRUE(is_ok(store_.get(s.id, &after)));
    EXPECT_EQ(after.status, UploadStatus::Completed);
    EXPECT_EQ(ferry::test::read_file(fs_->media_root() + "/full.mkv").size(), 64u);
}

TEST_F(MaintenanceTest, ReconcilerCompletesSessionCommittedBeforeCrash) {
    const UploadSession s = create("crash.mp4", 16);
    const auto data = pattern_bytes(16);
    u64 written = 0;
    ASSERT_TRUE(is_ok(fs_->append(s.storage_handle, view(data), &written)));
    ferry::storage::CommitResult commit;
    ASSERT_TRUE(is_ok(fs_->finalize(s.storage_handle, &commit)));

    u64 finalized = 0;
    events_.subscribe([&](const UploadEvent& e) {
        if (e.type == UploadEventType::Finalized) {
            ++finalized;
        }
    });

    ReconcileReport report;
    ASSERT_TRUE(is_ok(reconciler_->run(&report)));
    EXPECT_EQ(report.sessions_finalized, 1u);
    EXPECT_EQ(report.sessions_failed, 0u);
    EXPECT_EQ(finalized, 1u);

    UploadSession after;
    ASSERT_TRUE(is_ok(store_.get(s.id, &after)));
    EXPECT_EQ(after.status, UploadStatus::Completed);
    EXPECT_EQ(ferry::test::read_file(commit.path).size(), 16u);
}

TEST_F(MaintenanceTest, SweepExpiresIdleSessionsAndOldRows) {
    CleanupConfig cfg;
    cfg.session_ttl_ms = kMillisPerHour;
    cfg.finished_retention_ms = 2 * kMillisPerHour;
    boost::asio::io_context ioc;
    CleanupScheduler scheduler(ioc, store_, *engine_, *reconciler_, cfg);

    const UploadSession idle = create("idle.mp4", 100);
    const UploadSession done = create("done.mp4", 0);
    const Timestamp t0 = now_ms();

    SweepReport report;
    ASSERT_TRUE(is_ok(scheduler.run_once(t0, &report)));
    EXPECT_EQ(report.sessions_expired, 0u);
    EXPECT_EQ(report.finished_removed, 0u);

    // Past the TTL but inside retention.
    ASSERT_TRUE(is_ok(scheduler.run_once(t0 + kMillisPerHour + 1000, &report)));
    EXPECT_EQ(report.sessions_expired, 1u);
    EXPECT_EQ(report.finished_removed, 0u);
    EXPECT_EQ(report.errors, 0u);

    UploadSession row;
    EXPECT_EQ(store_.get(idle.id, &row).code, StatusCode::NotFound);
    u64 size = 0;
    EXPECT_EQ(fs_->durable_size(idle.storage_handle, &size).code, StatusCode::NotFound);
    ASSERT_TRUE(is_ok(store_.get(done.id, &row)));

    ASSERT_TRUE(is_ok(scheduler.run_once(t0 + 2 * kMillisPerHour + 1000, &report)));
    EXPECT_EQ(report.finished_removed, 1u);
    EXPECT_EQ(store_.get(done.id, &row).code, StatusCode::NotFound);
    EXPECT_EQ(scheduler.sweeps_completed(), 3u);
}

TEST_F(MaintenanceTest, SweepKeepsRecentlyResumedSession) {
    CleanupConfig cfg;
    cfg.session_ttl_ms = kMillisPerHour;
    boost::asio::io_context ioc;
    CleanupScheduler scheduler(ioc, store_, *engine_, *reconciler_, cfg);

    const UploadSession s = create("active.mp4", 100);
    SweepReport report;
    ASSERT_TRUE(is_ok(scheduler.run_once(s.updated_at + kMillisPerHour - 1, &report)));
    EXPECT_EQ(report.sessions_expired, 0u);

    UploadSession row;
    ASSERT_TRUE(is_ok(store_.get(s.id, &row)));
    EXPECT_EQ(row.status, UploadStatus::InProgress);
}

TEST_F(MaintenanceTest, TimerRunsSweeps) {
    CleanupConfig cfg;
    cfg.interval_ms = 10;
    boost::asio::io_context ioc;
    CleanupScheduler scheduler(ioc, store_, *engine_, *reconciler_, cfg);

    scheduler.start();
    ioc.run_for(std::chrono::milliseconds(300));
    scheduler.stop();
    EXPECT_GE(scheduler.sweeps_completed(), 1u);
}
