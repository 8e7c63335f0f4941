#include "ferry/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace ferry::core {
    namespace {
        std::atomic<u8> g_level{static_cast<u8>(LogLevel::Info)};
        std::mutex g_write_mutex;

        [[nodiscard]] const char* level_prefix(LogLevel level) noexcept {
            switch (level) {
                case LogLevel::Debug: return "debug";
                case LogLevel::Info: return "info";
                case LogLevel::Warn: return "warn";
                case LogLevel::Error: return "error";
                case LogLevel::Off: return "off";
            }
            return "info";
        }
    } // namespace

    void log_set_level(LogLevel level) noexcept {
        g_level.store(static_cast<u8>(level), std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
    }

    bool log_level_from_name(const char* name, LogLevel* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        const LogLevel all[] = {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off};
        for (LogLevel l : all) {
            if (std::strcmp(level_prefix(l), name) == 0) {
                *out = l;
                return true;
            }
        }
        return false;
    }

    void log_vwrite(LogLevel level, const char* fmt, va_list args) noexcept {
        if (fmt == nullptr || level == LogLevel::Off) {
            return;
        }
        if (static_cast<u8>(level) < g_level.load(std::memory_order_relaxed)) {
            return;
        }

        char line[1024];
        std::vsnprintf(line, sizeof(line), fmt, args);

        // One fprintf per line keeps concurrent writers from interleaving.
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::fprintf(stderr, "%s: %s\n", level_prefix(level), line);
    }

    void log_write(LogLevel level, const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(level, fmt, args);
        va_end(args);
    }

    void log_debug(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Debug, fmt, args);
        va_end(args);
    }

    void log_info(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Info, fmt, args);
        va_end(args);
    }

    void log_warn(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Warn, fmt, args);
        va_end(args);
    }

    void log_error(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Error, fmt, args);
        va_end(args);
    }
} // namespace ferry::core
