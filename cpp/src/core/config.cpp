#include "ferry/core/config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>

namespace ferry::core {
    namespace {
        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || out == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status env_i64(const char* name, i64 min, i64 max, i64* out) noexcept {
            const char* v = std::getenv(name);
            if (v == nullptr) {
                return ok_status();
            }
            i64 parsed{};
            if (!parse_i64(v, &parsed) || parsed < min || parsed > max) {
                log_error("invalid value for %s: '%s'", name, v);
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            *out = parsed;
            return ok_status();
        }
    } // namespace

    bool parse_port_list(const char* text, std::vector<u16>* out) {
        if (text == nullptr || out == nullptr) {
            return false;
        }
        std::vector<u16> ports;
        const char* p = text;
        while (*p != '\0') {
            const char* comma = std::strchr(p, ',');
            const char* end = comma ? comma : p + std::strlen(p);
            u32 v{};
            auto r = std::from_chars(p, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end || v == 0 || v > 65535) {
                return false;
            }
            ports.push_back(static_cast<u16>(v));
            if (comma == nullptr) {
                break;
            }
            p = comma + 1;
        }
        *out = std::move(ports);
        return true;
    }

    Status config_apply_env(ServiceConfig* cfg) noexcept {
        if (cfg == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        if (const char* v = std::getenv("FERRY_DATA_ROOT")) {
            cfg->data_root = v;
        }
        if (const char* v = std::getenv("FERRY_DB_PATH")) {
            cfg->db_path = v;
        }
        if (const char* v = std::getenv("FERRY_ASSETS_ROOT")) {
            cfg->assets_root = v;
        }
        if (const char* v = std::getenv("FERRY_BIND")) {
            cfg->bind_address = v;
        }
        if (const char* v = std::getenv("FERRY_PIN")) {
            cfg->pin = v;
            cfg->pin_required = cfg->pin_required || (*v != '\0');
        }
        if (const char* v = std::getenv("FERRY_FALLBACK_PORTS")) {
            std::vector<u16> ports;
            if (!parse_port_list(v, &ports)) {
                log_error("invalid value for FERRY_FALLBACK_PORTS: '%s'", v);
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            cfg->fallback_ports = std::move(ports);
        }
        if (const char* v = std::getenv("FERRY_LOG_LEVEL")) {
            if (!log_level_from_name(v, &cfg->log_level)) {
                log_error("invalid value for FERRY_LOG_LEVEL: '%s'", v);
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
        }

        i64 port = cfg->preferred_port;
        Status s = env_i64("FERRY_PORT", 1, 65535, &port);
        if (!is_ok(s)) return s;
        cfg->preferred_port = static_cast<u16>(port);

        i64 ttl_hours = cfg->session_ttl_ms / kMillisPerHour;
        s = env_i64("FERRY_SESSION_TTL_HOURS", 1, 24 * 365, &ttl_hours);
        if (!is_ok(s)) return s;
        cfg->session_ttl_ms = ttl_hours * kMillisPerHour;

        i64 sweep_minutes = cfg->sweep_interval_ms / kMillisPerMinute;
        s = env_i64("FERRY_SWEEP_MINUTES", 1, 24 * 60 * 7, &sweep_minutes);
        if (!is_ok(s)) return s;
        cfg->sweep_interval_ms = sweep_minutes * kMillisPerMinute;

        i64 threads = cfg->worker_threads;
        s = env_i64("FERRY_WORKER_THREADS", 1, 256, &threads);
        if (!is_ok(s)) return s;
        cfg->worker_threads = static_cast<u32>(threads);

        return ok_status();
    }

    Status config_validate(const ServiceConfig& cfg) noexcept {
        if (cfg.data_root.empty()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 1);
        }
        if (cfg.preferred_port == 0) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 2);
        }
        if (cfg.session_ttl_ms <= 0 || cfg.sweep_interval_ms <= 0 || cfg.finished_retention_ms < 0) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 3);
        }
        if (cfg.active_window_ms < 0) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 4);
        }
        if (cfg.chunk_buffer_bytes < 4096 || cfg.worker_threads == 0) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 5);
        }
        if (cfg.allowed_extensions.empty()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 6);
        }
        return ok_status();
    }

    std::string config_db_path(const ServiceConfig& cfg) {
        if (!cfg.db_path.empty()) {
            return cfg.db_path;
        }
        return cfg.data_root + "/sessions.db";
    }

    std::vector<u16> config_candidate_ports(const ServiceConfig& cfg) {
        std::vector<u16> ports;
        ports.reserve(cfg.fallback_ports.size() + 1);
        ports.push_back(cfg.preferred_port);
        for (u16 p : cfg.fallback_ports) {
            if (p != 0 && std::find(ports.begin(), ports.end(), p) == ports.end()) {
                ports.push_back(p);
            }
        }
        return ports;
    }
} // namespace ferry::core
