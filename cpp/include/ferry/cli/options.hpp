#pragma once

#include <type_traits>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"

namespace ferry::cli {
    using u8 = ferry::core::u8;
    using u32 = ferry::core::u32;
    using i64 = ferry::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Port = 1,
        Bind = 2,
        DataRoot = 3,
        DbPath = 4,
        Assets = 5,
        Pin = 6,
        NoPin = 7,
        Threads = 8,
        LogLevel = 9,
        TtlHours = 10,
        Status = 11,
        Help = 12,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options fails once cap is reached.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading options up to the first positional argument or "--".
    [[nodiscard]] ferry::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins; nullptr when absent.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace ferry::cli
