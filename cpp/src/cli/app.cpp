#include "ferry/cli/app.hpp"

#include <exception>
#include <limits>

namespace ferry::cli {
    using ferry::core::ServiceConfig;
    using ferry::core::Status;

    namespace {
        constexpr CommandSpec kCommands[] = {
            {CommandId::Serve, "serve", "run the upload server (default)"},
            {CommandId::Sweep, "sweep", "run one cleanup and reconcile pass, then exit"},
            {CommandId::List, "list", "list resumable uploads"},
            {CommandId::Pin, "pin", "print a freshly generated PIN"},
            {CommandId::Help, "help", "show this help"},
        };

        constexpr OptionSpec kOptions[] = {
            {OptionId::Port, OptionType::I64, "port", 'p'},
            {OptionId::Bind, OptionType::String, "bind", 'b'},
            {OptionId::DataRoot, OptionType::String, "data", 'd'},
            {OptionId::DbPath, OptionType::String, "db", '\0'},
            {OptionId::Assets, OptionType::String, "assets", '\0'},
            {OptionId::Pin, OptionType::String, "pin", '\0'},
            {OptionId::NoPin, OptionType::Flag, "no-pin", '\0'},
            {OptionId::Threads, OptionType::I64, "threads", 't'},
            {OptionId::LogLevel, OptionType::String, "log-level", 'l'},
            {OptionId::TtlHours, OptionType::I64, "ttl-hours", '\0'},
            {OptionId::Status, OptionType::String, "status", 's'},
            {OptionId::Help, OptionType::Flag, "help", 'h'},
        };

        [[nodiscard]] Status cli_invalid(u32 aux) noexcept {
            return ferry::core::make_status(ferry::core::StatusDomain::Cli, ferry::core::StatusCode::Invalid, aux);
        }
    } // namespace

    const CommandSpec* command_specs(u32* count) noexcept {
        *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
        return kCommands;
    }

    const OptionSpec* option_specs(u32* count) noexcept {
        *count = static_cast<u32>(sizeof(kOptions) / sizeof(kOptions[0]));
        return kOptions;
    }

    Status apply_options(const ParsedOptions& opts, ServiceConfig* cfg) noexcept {
        if (cfg == nullptr) {
            return cli_invalid(0);
        }
        try {
            for (u32 i = 0; i < opts.len; ++i) {
                const ParsedOption& o = opts.data[i];
                switch (o.id) {
                    case OptionId::Port:
                        if (o.value.i64v <= 0 || o.value.i64v > std::numeric_limits<ferry::core::u16>::max()) {
                            return cli_invalid(static_cast<u32>(o.id));
                        }
                        cfg->preferred_port = static_cast<ferry::core::u16>(o.value.i64v);
                        break;
                    case OptionId::Bind:
                        cfg->bind_address = o.value.str;
                        break;
                    case OptionId::DataRoot:
                        cfg->data_root = o.value.str;
                        break;
                    case OptionId::DbPath:
                        cfg->db_path = o.value.str;
                        break;
                    case OptionId::Assets:
                        cfg->assets_root = o.value.str;
                        break;
                    case OptionId::Pin:
                        cfg->pin_required = true;
                        cfg->pin = o.value.str;
                        break;
                    case OptionId::NoPin:
                        cfg->pin_required = false;
                        cfg->pin.clear();
                        break;
                    case OptionId::Threads:
                        if (o.value.i64v <= 0 || o.value.i64v > 256) {
                            return cli_invalid(static_cast<u32>(o.id));
                        }
                        cfg->worker_threads = static_cast<u32>(o.value.i64v);
                        break;
                    case OptionId::LogLevel:
                        if (!ferry::core::log_level_from_name(o.value.str, &cfg->log_level)) {
                            return cli_invalid(static_cast<u32>(o.id));
                        }
                        break;
                    case OptionId::TtlHours:
                        if (o.value.i64v <= 0) {
                            return cli_invalid(static_cast<u32>(o.id));
                        }
                        cfg->session_ttl_ms = o.value.i64v * ferry::core::kMillisPerHour;
                        break;
                    case OptionId::Status:
                    case OptionId::Help:
                    case OptionId::None:
                        break;
                }
            }
        } catch (const std::exception&) {
            return ferry::core::make_status(ferry::core::StatusDomain::Cli, ferry::core::StatusCode::Unavailable);
        }
        return ferry::core::ok_status();
    }

    ferry::protocol::EngineConfig engine_config(const ServiceConfig& cfg) {
        ferry::protocol::EngineConfig out;
        out.policy.allowed_extensions = cfg.allowed_extensions;
        out.policy.max_upload_bytes = cfg.max_upload_bytes;
        out.policy.min_free_bytes = cfg.min_free_bytes;
        out.policy.verify_magic = cfg.verify_magic;
        out.single_active_upload = true;
        out.active_window_ms = cfg.active_window_ms;
        return out;
    }

    ferry::net::ServerConfig server_config(const ServiceConfig& cfg) {
        ferry::net::ServerConfig out;
        out.bind_address = cfg.bind_address;
        out.ports = ferry::core::config_candidate_ports(cfg);
        out.worker_threads = cfg.worker_threads;
        out.read_timeout_ms = cfg.read_timeout_ms;
        out.chunk_buffer_bytes = cfg.chunk_buffer_bytes;
        return out;
    }

    ferry::maintenance::CleanupConfig cleanup_config(const ServiceConfig& cfg) noexcept {
        ferry::maintenance::CleanupConfig out;
        out.session_ttl_ms = cfg.session_ttl_ms;
        out.finished_retention_ms = cfg.finished_retention_ms;
        out.interval_ms = cfg.sweep_interval_ms;
        return out;
    }

    void print_usage(std::FILE* out) {
        std::fprintf(out, "usage: ferry [command] [options]\n\ncommands:\n");
        for (const CommandSpec& c : kCommands) {
            std::fprintf(out, "  %-8s %s\n", c.name, c.summary);
        }
        std::fprintf(out,
            "\noptions:\n"
            "  -p, --port N         preferred port (fallbacks follow FERRY_FALLBACK_PORTS)\n"
            "  -b, --bind ADDR      bind address\n"
            "  -d, --data DIR       storage root\n"
            "      --db PATH        session database (default <data>/sessions.db)\n"
            "      --assets DIR     static web assets\n"
            "      --pin PIN        require this PIN for uploads\n"
            "      --no-pin         disable the PIN gate\n"
            "  -t, --threads N      worker threads\n"
            "  -l, --log-level L    debug, info, warn, error or off\n"
            "      --ttl-hours N    idle time before an incomplete upload expires\n"
            "  -s, --status S       list: IN_PROGRESS (default), COMPLETED, FAILED, CANCELLED or all\n"
            "\nenvironment: FERRY_DATA_ROOT FERRY_DB_PATH FERRY_ASSETS_ROOT FERRY_BIND FERRY_PORT\n"
            "             FERRY_FALLBACK_PORTS FERRY_PIN FERRY_SESSION_TTL_HOURS FERRY_SWEEP_MINUTES\n"
            "             FERRY_WORKER_THREADS FERRY_LOG_LEVEL FERRY_DB_JOURNAL_MODE\n");
    }
} // namespace ferry::cli
