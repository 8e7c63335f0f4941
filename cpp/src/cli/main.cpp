#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "ferry/cli/app.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/errors.hpp"
#include "ferry/core/events.hpp"
#include "ferry/core/log.hpp"
#include "ferry/db/session_store.hpp"
#include "ferry/maintenance/cleanup.hpp"
#include "ferry/maintenance/reconciler.hpp"
#include "ferry/net/assets.hpp"
#include "ferry/net/router.hpp"
#include "ferry/net/server.hpp"
#include "ferry/protocol/engine.hpp"
#include "ferry/protocol/history.hpp"
#include "ferry/protocol/validation.hpp"
#include "ferry/security/access_gate.hpp"
#include "ferry/security/tokens.hpp"
#include "ferry/storage/fs_backend.hpp"
#include "ferry/storage/hashing.hpp"

using ferry::core::Status;

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Helpers
// ========================================================================

void print_status_error(const char* context, Status s) {
    std::fprintf(stderr, "error: %s failed: %s (%s, aux=%u)\n", context,
        ferry::core::status_code_name(s.code), ferry::core::status_domain_name(s.domain), s.aux);
}

// Records committed files in the log until a real indexer is attached.
class LogIndexingSink final : public ferry::core::IndexingSink {
public:
    void on_file_finalized(const ferry::core::FinalizedFile& file) override {
        ferry::core::log_info("stored %s (%s, blake3 %s)", file.path.c_str(),
            ferry::protocol::format_bytes(file.size_bytes).c_str(),
            ferry::storage::hash_to_hex(file.digest).c_str());
    }
};

// Store, backend and engine shared by every command.
struct Core {
    ferry::db::SessionStore store;
    std::unique_ptr<ferry::storage::FsStorageBackend> backend;
    ferry::core::EventBus events;
    std::unique_ptr<ferry::protocol::ProtocolEngine> engine;
    std::unique_ptr<ferry::maintenance::OrphanReconciler> reconciler;
};

Status open_core(const ferry::core::ServiceConfig& cfg, Core* core) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.data_root, ec);
    if (ec) {
        ferry::core::log_error("cannot create %s: %s", cfg.data_root.c_str(), ec.message().c_str());
        return ferry::core::make_status(ferry::core::StatusDomain::Cli, ferry::core::StatusCode::Io,
            static_cast<ferry::core::u32>(ec.value()));
    }
    const std::string db_path = ferry::core::config_db_path(cfg);
    std::filesystem::create_directories(std::filesystem::path(db_path).parent_path(), ec);

    Status s = core->store.open(db_path);
    if (!ferry::core::is_ok(s)) {
        print_status_error("session store open", s);
        return s;
    }

    ferry::storage::FsBackendConfig backend_cfg;
    backend_cfg.root = cfg.data_root;
    core->backend = std::make_unique<ferry::storage::FsStorageBackend>(backend_cfg);
    s = core->backend->init();
    if (!ferry::core::is_ok(s)) {
        print_status_error("storage init", s);
        return s;
    }

    core->engine = std::make_unique<ferry::protocol::ProtocolEngine>(
        core->store, *core->backend, core->events, ferry::cli::engine_config(cfg));
    core->reconciler = std::make_unique<ferry::maintenance::OrphanReconciler>(
        core->store, *core->backend, *core->engine);
    return ferry::core::ok_status();
}

// ========================================================================
// Commands
// ========================================================================

int handle_serve(ferry::core::ServiceConfig& cfg) {
    Core core;
    if (!ferry::core::is_ok(open_core(cfg, &core))) {
        return EXIT_FAILURE;
    }

    ferry::security::AccessGate gate;
    if (cfg.pin_required) {
        if (cfg.pin.empty()) {
            const Status s = ferry::security::generate_pin(4, &cfg.pin);
            if (!ferry::core::is_ok(s)) {
                print_status_error("PIN generation", s);
                return EXIT_FAILURE;
            }
        }
        const Status s = gate.enable(cfg.pin);
        if (!ferry::core::is_ok(s)) {
            print_status_error("PIN gate", s);
            return EXIT_FAILURE;
        }
    }

    ferry::protocol::UploadHistory history(core.events);
    LogIndexingSink index_sink;
    const ferry::core::SubscriptionId index_sub = ferry::core::attach_indexing_sink(core.events, index_sink);

    std::unique_ptr<ferry::net::DirectoryAssetProvider> assets;
    if (!cfg.assets_root.empty()) {
        assets = std::make_unique<ferry::net::DirectoryAssetProvider>(cfg.assets_root);
    }

    ferry::net::RouterDeps deps;
    deps.engine = core.engine.get();
    deps.gate = &gate;
    deps.backend = core.backend.get();
    deps.assets = assets.get();
    deps.history = &history;
    ferry::net::RequestRouter router(deps);
    ferry::net::TransferServer server(ferry::cli::server_config(cfg), router);

    ferry::maintenance::CleanupScheduler scheduler(server.io_context(), core.store, *core.engine,
        *core.reconciler, ferry::cli::cleanup_config(cfg));

    // Startup pass: leftovers of an unclean shutdown are handled before clients reconnect.
    ferry::maintenance::SweepReport report;
    Status s = scheduler.run_once(ferry::core::now_ms(), &report);
    if (!ferry::core::is_ok(s)) {
        print_status_error("startup sweep", s);
    }

    ferry::core::u16 port = 0;
    s = server.start(&port);
    if (!ferry::core::is_ok(s)) {
        print_status_error("server start", s);
        core.events.unsubscribe(index_sub);
        return EXIT_FAILURE;
    }
    scheduler.start();

    std::printf("ferry listening on %s:%u\n", cfg.bind_address.c_str(), static_cast<unsigned>(port));
    std::printf("data_root=%s\n", cfg.data_root.c_str());
    if (gate.enabled()) {
        std::printf("PIN: %s\n", cfg.pin.c_str());
    }
    std::fflush(stdout);

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    ferry::core::log_info("shutting down");
    scheduler.stop();
    server.stop();
    core.events.unsubscribe(index_sub);
    core.store.close();
    return EXIT_SUCCESS;
}

int handle_sweep(const ferry::core::ServiceConfig& cfg) {
    Core core;
    if (!ferry::core::is_ok(open_core(cfg, &core))) {
        return EXIT_FAILURE;
    }
    boost::asio::io_context ioc;
    ferry::maintenance::CleanupScheduler scheduler(ioc, core.store, *core.engine, *core.reconciler,
        ferry::cli::cleanup_config(cfg));
    ferry::maintenance::SweepReport report;
    const Status s = scheduler.run_once(ferry::core::now_ms(), &report);
    if (!ferry::core::is_ok(s)) {
        print_status_error("sweep", s);
        return EXIT_FAILURE;
    }
    std::printf("expired=%llu finished_removed=%llu orphans_deleted=%llu repaired=%llu finalized=%llu failed=%llu errors=%llu\n",
        static_cast<unsigned long long>(report.sessions_expired),
        static_cast<unsigned long long>(report.finished_removed),
        static_cast<unsigned long long>(report.reconcile.orphans_deleted),
        static_cast<unsigned long long>(report.reconcile.sessions_repaired),
        static_cast<unsigned long long>(report.reconcile.sessions_finalized),
        static_cast<unsigned long long>(report.reconcile.sessions_failed),
        static_cast<unsigned long long>(report.errors));
    for (const ferry::core::PendingEntry& orphan : report.reconcile.orphans) {
        std::printf("orphan removed: %s (%s)\n", orphan.display_name.c_str(),
            ferry::protocol::format_bytes(orphan.size_bytes).c_str());
    }
    return report.errors == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int handle_list(const ferry::core::ServiceConfig& cfg, const char* status_filter) {
    Core core;
    if (!ferry::core::is_ok(open_core(cfg, &core))) {
        return EXIT_FAILURE;
    }

    std::vector<ferry::core::UploadSession> sessions;
    Status s;
    if (status_filter != nullptr && std::strcmp(status_filter, "all") == 0) {
        s = core.store.list_all(&sessions);
    } else {
        ferry::core::UploadStatus status = ferry::core::UploadStatus::InProgress;
        if (status_filter != nullptr && !ferry::core::upload_status_from_name(status_filter, &status)) {
            std::fprintf(stderr, "error: unknown status '%s'\n", status_filter);
            return EXIT_FAILURE;
        }
        s = core.store.list_by_status(status, &sessions);
    }
    if (!ferry::core::is_ok(s)) {
        print_status_error("list", s);
        return EXIT_FAILURE;
    }

    if (sessions.empty()) {
        std::printf("no uploads\n");
        return EXIT_SUCCESS;
    }
    for (const ferry::core::UploadSession& u : sessions) {
        std::printf("%s  %-11s %3u%%  %s / %s  %s\n", u.id.c_str(),
            ferry::core::upload_status_name(u.status),
            ferry::core::progress_percent(u.bytes_received, u.expected_size),
            ferry::protocol::format_bytes(u.bytes_received).c_str(),
            ferry::protocol::format_bytes(u.expected_size).c_str(),
            u.filename.c_str());
    }
    return EXIT_SUCCESS;
}

int handle_pin() {
    std::string pin;
    const Status s = ferry::security::generate_pin(4, &pin);
    if (!ferry::core::is_ok(s)) {
        print_status_error("PIN generation", s);
        return EXIT_FAILURE;
    }
    std::printf("%s\n", pin.c_str());
    return EXIT_SUCCESS;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);
    signal(SIGTERM, sigint_handler);

    ferry::core::ServiceConfig cfg;
    Status s = ferry::core::config_apply_env(&cfg);
    if (!ferry::core::is_ok(s)) {
        print_status_error("environment", s);
        return EXIT_FAILURE;
    }

    ferry::cli::CliArgs args{const_cast<const char* const*>(argv + 1), static_cast<ferry::cli::u32>(argc > 0 ? argc - 1 : 0)};

    ferry::cli::CommandId command = ferry::cli::CommandId::Serve;
    if (args.argc > 0 && args.argv[0][0] != '-') {
        ferry::cli::u32 count = 0;
        const ferry::cli::CommandSpec* specs = ferry::cli::command_specs(&count);
        ferry::cli::CommandInvocation inv;
        ferry::cli::u32 consumed = 0;
        s = ferry::cli::parse_command(args, specs, count, &inv, &consumed);
        if (!ferry::core::is_ok(s)) {
            std::fprintf(stderr, "error: unknown command '%s'\n", args.argv[0]);
            ferry::cli::print_usage(stderr);
            return EXIT_FAILURE;
        }
        command = inv.id;
        args = inv.args;
    }

    ferry::cli::ParsedOption storage[ferry::cli::kMaxParsedOptions];
    ferry::cli::ParsedOptions opts{storage, 0, ferry::cli::kMaxParsedOptions};
    ferry::cli::u32 option_count = 0;
    const ferry::cli::OptionSpec* option_specs = ferry::cli::option_specs(&option_count);
    ferry::cli::u32 consumed = 0;
    s = ferry::cli::parse_options(args, option_specs, option_count, &opts, &consumed);
    if (!ferry::core::is_ok(s) || consumed != args.argc) {
        std::fprintf(stderr, "error: invalid arguments\n");
        ferry::cli::print_usage(stderr);
        return EXIT_FAILURE;
    }
    if (command == ferry::cli::CommandId::Help || ferry::cli::find_option(opts, ferry::cli::OptionId::Help)) {
        ferry::cli::print_usage(stdout);
        return EXIT_SUCCESS;
    }

    s = ferry::cli::apply_options(opts, &cfg);
    if (!ferry::core::is_ok(s)) {
        print_status_error("option", s);
        return EXIT_FAILURE;
    }
    s = ferry::core::config_validate(cfg);
    if (!ferry::core::is_ok(s)) {
        print_status_error("configuration", s);
        return EXIT_FAILURE;
    }
    ferry::core::log_set_level(cfg.log_level);

    switch (command) {
        case ferry::cli::CommandId::Sweep:
            return handle_sweep(cfg);
        case ferry::cli::CommandId::List: {
            const ferry::cli::ParsedOption* status = ferry::cli::find_option(opts, ferry::cli::OptionId::Status);
            return handle_list(cfg, status ? status->value.str : nullptr);
        }
        case ferry::cli::CommandId::Pin:
            return handle_pin();
        case ferry::cli::CommandId::Serve:
        default:
            return handle_serve(cfg);
    }
}
