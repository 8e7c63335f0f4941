#include <array>

#include <gtest/gtest.h>

#include "ferry/cli/app.hpp"
#include "ferry/cli/options.hpp"

TEST(CliOptions, ParsesLongAndShortAndStopsAtPositional) {
    const std::array<ferry::cli::OptionSpec, 4> specs = {{
        {ferry::cli::OptionId::DataRoot, ferry::cli::OptionType::String, "data", 'd'},
        {ferry::cli::OptionId::Bind, ferry::cli::OptionType::String, "bind", 'b'},
        {ferry::cli::OptionId::Port, ferry::cli::OptionType::I64, "port", 'p'},
        {ferry::cli::OptionId::NoPin, ferry::cli::OptionType::Flag, "no-pin", '\0'},
    }};

    const char* argv[] = {"--no-pin", "--data", "/srv/media", "-b", "127.0.0.1", "extra", "args"};
    const ferry::cli::CliArgs args{argv, 7};

    ferry::cli::ParsedOption buf[8]{};
    ferry::cli::ParsedOptions out{buf, 0, 8};
    ferry::cli::u32 consumed = 0;
    const ferry::core::Status s = ferry::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, ferry::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].type, ferry::cli::OptionType::Flag);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, ferry::cli::OptionId::DataRoot);
    EXPECT_STREQ(out.data[1].value.str, "/srv/media");

    EXPECT_EQ(out.data[2].id, ferry::cli::OptionId::Bind);
    EXPECT_STREQ(out.data[2].value.str, "127.0.0.1");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<ferry::cli::OptionSpec, 2> specs = {{
        {ferry::cli::OptionId::DataRoot, ferry::cli::OptionType::String, "data", 'd'},
        {ferry::cli::OptionId::Port, ferry::cli::OptionType::I64, "port", 'p'},
    }};

    const char* argv[] = {"--data=/tmp/x", "-p9090"};
    const ferry::cli::CliArgs args{argv, 2};

    ferry::cli::ParsedOption buf[8]{};
    ferry::cli::ParsedOptions out{buf, 0, 8};
    ferry::cli::u32 consumed = 0;
    const ferry::core::Status s = ferry::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, ferry::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "/tmp/x");
    EXPECT_EQ(out.data[1].value.i64v, 9090);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<ferry::cli::OptionSpec, 2> specs = {{
        {ferry::cli::OptionId::DataRoot, ferry::cli::OptionType::String, "data", 'd'},
        {ferry::cli::OptionId::Help, ferry::cli::OptionType::Flag, "help", 'h'},
    }};

    const char* argv[] = {"--data", "1", "--", "--help"};
    const ferry::cli::CliArgs args{argv, 4};

    ferry::cli::ParsedOption buf[8]{};
    ferry::cli::ParsedOptions out{buf, 0, 8};
    ferry::cli::u32 consumed = 0;
    const ferry::core::Status s = ferry::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, ferry::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "1");
}

TEST(CliOptions, InvalidOnUnknownOrMissingValue) {
    const std::array<ferry::cli::OptionSpec, 2> specs = {{
        {ferry::cli::OptionId::DataRoot, ferry::cli::OptionType::String, "data", 'd'},
        {ferry::cli::OptionId::Port, ferry::cli::OptionType::I64, "port", 'p'},
    }};

    {
        const char* argv[] = {"--nope"};
        ferry::cli::ParsedOption buf[2]{};
        ferry::cli::ParsedOptions out{buf, 0, 2};
        ferry::cli::u32 consumed = 0;
        const ferry::core::Status s =
            ferry::cli::parse_options({argv, 1}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, ferry::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--data"};
        ferry::cli::ParsedOption buf[2]{};
        ferry::cli::ParsedOptions out{buf, 0, 2};
        ferry::cli::u32 consumed = 0;
        const ferry::core::Status s =
            ferry::cli::parse_options({argv, 1}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, ferry::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--port", "80a"};
        ferry::cli::ParsedOption buf[2]{};
        ferry::cli::ParsedOptions out{buf, 0, 2};
        ferry::cli::u32 consumed = 0;
        const ferry::core::Status s =
            ferry::cli::parse_options({argv, 2}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, ferry::core::StatusCode::Invalid);
    }
}

TEST(CliOptions, LastOccurrenceWins) {
    ferry::cli::u32 count = 0;
    const ferry::cli::OptionSpec* specs = ferry::cli::option_specs(&count);
    const char* argv[] = {"-p", "9000", "--port=9001"};
    ferry::cli::ParsedOption buf[ferry::cli::kMaxParsedOptions]{};
    ferry::cli::ParsedOptions out{buf, 0, ferry::cli::kMaxParsedOptions};
    ferry::cli::u32 consumed = 0;
    ASSERT_TRUE(ferry::core::is_ok(ferry::cli::parse_options({argv, 3}, specs, count, &out, &consumed)));

    const ferry::cli::ParsedOption* port = ferry::cli::find_option(out, ferry::cli::OptionId::Port);
    ASSERT_NE(port, nullptr);
    EXPECT_EQ(port->value.i64v, 9001);
    EXPECT_EQ(ferry::cli::find_option(out, ferry::cli::OptionId::Bind), nullptr);
}

TEST(CliOptions, ApplyOverridesServiceConfig) {
    ferry::cli::u32 count = 0;
    const ferry::cli::OptionSpec* specs = ferry::cli::option_specs(&count);
    const char* argv[] = {"-p", "9000", "--data", "/srv/ferry", "--pin", "2468", "-t", "8", "-l", "debug", "--ttl-hours", "2"};
    ferry::cli::ParsedOption buf[ferry::cli::kMaxParsedOptions]{};
    ferry::cli::ParsedOptions out{buf, 0, ferry::cli::kMaxParsedOptions};
    ferry::cli::u32 consumed = 0;
    ASSERT_TRUE(ferry::core::is_ok(ferry::cli::parse_options({argv, 12}, specs, count, &out, &consumed)));

    ferry::core::ServiceConfig cfg;
    ASSERT_TRUE(ferry::core::is_ok(ferry::cli::apply_options(out, &cfg)));
    EXPECT_EQ(cfg.preferred_port, 9000);
    EXPECT_EQ(cfg.data_root, "/srv/ferry");
    EXPECT_TRUE(cfg.pin_required);
    EXPECT_EQ(cfg.pin, "2468");
    EXPECT_EQ(cfg.worker_threads, 8u);
    EXPECT_EQ(cfg.log_level, ferry::core::LogLevel::Debug);
    EXPECT_EQ(cfg.session_ttl_ms, 2 * ferry::core::kMillisPerHour);

    const ferry::net::ServerConfig server = ferry::cli::server_config(cfg);
    ASSERT_FALSE(server.ports.empty());
    EXPECT_EQ(server.ports.front(), 9000);
    EXPECT_EQ(server.worker_threads, 8u);

    const ferry::maintenance::CleanupConfig cleanup = ferry::cli::cleanup_config(cfg);
    EXPECT_EQ(cleanup.session_ttl_ms, 2 * ferry::core::kMillisPerHour);

    const ferry::protocol::EngineConfig engine = ferry::cli::engine_config(cfg);
    EXPECT_TRUE(engine.single_active_upload);
    EXPECT_EQ(engine.policy.min_free_bytes, cfg.min_free_bytes);
}

TEST(CliOptions, ApplyRejectsOutOfRangeValues) {
    ferry::cli::u32 count = 0;
    const ferry::cli::OptionSpec* specs = ferry::cli::option_specs(&count);

    struct Case {
        const char* flag;
        const char* value;
        ferry::cli::OptionId id;
    };
    const std::array<Case, 5> cases = {{
        {"--port", "0", ferry::cli::OptionId::Port},
        {"--port", "70000", ferry::cli::OptionId::Port},
        {"--threads", "0", ferry::cli::OptionId::Threads},
        {"--log-level", "loud", ferry::cli::OptionId::LogLevel},
        {"--ttl-hours", "-1", ferry::cli::OptionId::TtlHours},
    }};

    for (const Case& c : cases) {
        SCOPED_TRACE(c.flag);
        const char* argv[] = {c.flag, c.value};
        ferry::cli::ParsedOption buf[4]{};
        ferry::cli::ParsedOptions out{buf, 0, 4};
        ferry::cli::u32 consumed = 0;
        ASSERT_TRUE(ferry::core::is_ok(ferry::cli::parse_options({argv, 2}, specs, count, &out, &consumed)));
        ferry::core::ServiceConfig cfg;
        const ferry::core::Status s = ferry::cli::apply_options(out, &cfg);
        EXPECT_EQ(s.code, ferry::core::StatusCode::Invalid);
        EXPECT_EQ(s.aux, static_cast<ferry::cli::u32>(c.id));
    }
}

TEST(CliOptions, NoPinClearsEarlierPin) {
    ferry::cli::u32 count = 0;
    const ferry::cli::OptionSpec* specs = ferry::cli::option_specs(&count);
    const char* argv[] = {"--pin", "1111", "--no-pin"};
    ferry::cli::ParsedOption buf[4]{};
    ferry::cli::ParsedOptions out{buf, 0, 4};
    ferry::cli::u32 consumed = 0;
    ASSERT_TRUE(ferry::core::is_ok(ferry::cli::parse_options({argv, 3}, specs, count, &out, &consumed)));
    ferry::core::ServiceConfig cfg;
    ASSERT_TRUE(ferry::core::is_ok(ferry::cli::apply_options(out, &cfg)));
    EXPECT_FALSE(cfg.pin_required);
    EXPECT_TRUE(cfg.pin.empty());
}
