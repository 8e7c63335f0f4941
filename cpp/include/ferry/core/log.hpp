#pragma once

#include <cstdarg>

#include "ferry/core/types.hpp"

namespace ferry::core {
    enum class LogLevel : u8 {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;
    [[nodiscard]] bool log_level_from_name(const char* name, LogLevel* out) noexcept;

    // Writes "<level>: <message>\n" to stderr when level passes the threshold.
    [[gnu::format(printf, 2, 0)]] void log_vwrite(LogLevel level, const char* fmt, va_list args) noexcept;
    [[gnu::format(printf, 2, 3)]] void log_write(LogLevel level, const char* fmt, ...) noexcept;

    [[gnu::format(printf, 1, 2)]] void log_debug(const char* fmt, ...) noexcept;
    [[gnu::format(printf, 1, 2)]] void log_info(const char* fmt, ...) noexcept;
    [[gnu::format(printf, 1, 2)]] void log_warn(const char* fmt, ...) noexcept;
    [[gnu::format(printf, 1, 2)]] void log_error(const char* fmt, ...) noexcept;
} // namespace ferry::core
