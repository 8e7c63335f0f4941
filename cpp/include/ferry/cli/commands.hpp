#pragma once

#include <type_traits>

#include "ferry/cli/options.hpp"
#include "ferry/core/errors.hpp"

namespace ferry::cli {
    using u32 = ferry::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Serve = 2,
        Sweep = 3,
        List = 4,
        Pin = 5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* summary{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs; the remaining arguments go to out->args.
    [[nodiscard]] ferry::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);

} // namespace ferry::cli
