#pragma once

#include <cstdio>

#include "ferry/cli/commands.hpp"
#include "ferry/cli/options.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/errors.hpp"
#include "ferry/maintenance/cleanup.hpp"
#include "ferry/net/server.hpp"
#include "ferry/protocol/engine.hpp"

namespace ferry::cli {
    inline constexpr u32 kMaxParsedOptions = 32;

    [[nodiscard]] const CommandSpec* command_specs(u32* count) noexcept;
    [[nodiscard]] const OptionSpec* option_specs(u32* count) noexcept;

    // Command-line options override environment and defaults.
    [[nodiscard]] ferry::core::Status apply_options(const ParsedOptions& opts, ferry::core::ServiceConfig* cfg) noexcept;

    [[nodiscard]] ferry::protocol::EngineConfig engine_config(const ferry::core::ServiceConfig& cfg);
    [[nodiscard]] ferry::net::ServerConfig server_config(const ferry::core::ServiceConfig& cfg);
    [[nodiscard]] ferry::maintenance::CleanupConfig cleanup_config(const ferry::core::ServiceConfig& cfg) noexcept;

    void print_usage(std::FILE* out);
} // namespace ferry::cli
