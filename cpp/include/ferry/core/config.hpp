#pragma once

#include <string>
#include <vector>

#include "ferry/core/errors.hpp"
#include "ferry/core/log.hpp"
#include "ferry/core/types.hpp"

namespace ferry::core {
    inline constexpr u16 kDefaultPort = 8080;
    inline constexpr u64 kDefaultMinFreeBytes = 500ull * 1024ull * 1024ull;
    inline constexpr u32 kDefaultChunkBufferBytes = 1024u * 1024u;

    struct ServiceConfig {
        std::string data_root{"./ferry-data"};
        std::string db_path;        // empty: <data_root>/sessions.db
        std::string assets_root;    // empty: no static assets
        std::string bind_address{"0.0.0.0"};

        u16 preferred_port{kDefaultPort};
        std::vector<u16> fallback_ports{8081, 8082, 8083, 8084, 8085, 8088, 8089, 8090};

        bool pin_required{false};
        std::string pin;            // empty with pin_required: generate one at startup

        i64 session_ttl_ms{24 * kMillisPerHour};
        i64 finished_retention_ms{24 * kMillisPerHour};
        i64 sweep_interval_ms{6 * kMillisPerHour};
        i64 active_window_ms{2 * kMillisPerMinute};  // 0: any IN_PROGRESS session counts as active

        u64 max_upload_bytes{0};    // 0: unlimited
        u64 min_free_bytes{kDefaultMinFreeBytes};
        std::vector<std::string> allowed_extensions{"mp4", "mkv"};
        bool verify_magic{false};

        u32 chunk_buffer_bytes{kDefaultChunkBufferBytes};
        u32 read_timeout_ms{30000};
        u32 worker_threads{4};

        LogLevel log_level{LogLevel::Info};
    };

    // Overlays FERRY_* environment variables onto cfg. Unset variables leave fields untouched.
    [[nodiscard]] Status config_apply_env(ServiceConfig* cfg) noexcept;
    [[nodiscard]] Status config_validate(const ServiceConfig& cfg) noexcept;

    [[nodiscard]] std::string config_db_path(const ServiceConfig& cfg);
    // Preferred port first, then fallbacks, duplicates removed.
    [[nodiscard]] std::vector<u16> config_candidate_ports(const ServiceConfig& cfg);
    [[nodiscard]] bool parse_port_list(const char* text, std::vector<u16>* out);
} // namespace ferry::core
