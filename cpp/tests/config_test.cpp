#include <cstdlib>

#include <gtest/gtest.h>

#include "ferry/core/config.hpp"
#include "ferry/core/log.hpp"

using namespace ferry::core;

namespace {
    const char* const kEnvVars[] = {
        "FERRY_DATA_ROOT", "FERRY_DB_PATH", "FERRY_ASSETS_ROOT", "FERRY_BIND", "FERRY_PIN",
        "FERRY_FALLBACK_PORTS", "FERRY_LOG_LEVEL", "FERRY_PORT", "FERRY_SESSION_TTL_HOURS",
        "FERRY_SWEEP_MINUTES", "FERRY_WORKER_THREADS",
    };

    class ConfigEnvTest : public ::testing::Test {
    protected:
        void SetUp() override { clear(); }
        void TearDown() override { clear(); }

        static void clear() {
            for (const char* name : kEnvVars) {
                ::unsetenv(name);
            }
        }
    };
} // namespace

TEST(Config, DefaultsAreValid) {
    ServiceConfig cfg;
    EXPECT_TRUE(is_ok(config_validate(cfg)));
    EXPECT_EQ(cfg.preferred_port, 8080);
    EXPECT_EQ(cfg.session_ttl_ms, 24 * kMillisPerHour);
    EXPECT_EQ(cfg.sweep_interval_ms, 6 * kMillisPerHour);
    EXPECT_EQ(cfg.min_free_bytes, 500ull * 1024ull * 1024ull);
    EXPECT_FALSE(cfg.pin_required);
    ASSERT_EQ(cfg.allowed_extensions.size(), 2u);
}

TEST(Config, DbPathDefaultsUnderDataRoot) {
    ServiceConfig cfg;
    cfg.data_root = "/srv/ferry";
    EXPECT_EQ(config_db_path(cfg), "/srv/ferry/sessions.db");
    cfg.db_path = "/var/lib/ferry.db";
    EXPECT_EQ(config_db_path(cfg), "/var/lib/ferry.db");
}

TEST(Config, CandidatePortsStartWithPreferredAndDropDuplicates) {
    ServiceConfig cfg;
    cfg.preferred_port = 8081;
    cfg.fallback_ports = {8080, 8081, 8082, 0, 8082};
    const std::vector<u16> ports = config_candidate_ports(cfg);
    ASSERT_EQ(ports.size(), 3u);
    EXPECT_EQ(ports[0], 8081);
    EXPECT_EQ(ports[1], 8080);
    EXPECT_EQ(ports[2], 8082);
}

TEST(Config, ParsePortList) {
    std::vector<u16> ports;
    ASSERT_TRUE(parse_port_list("9000,9001,9002", &ports));
    ASSERT_EQ(ports.size(), 3u);
    EXPECT_EQ(ports[2], 9002);

    EXPECT_FALSE(parse_port_list("9000,abc", &ports));
    EXPECT_FALSE(parse_port_list("70000", &ports));
    EXPECT_FALSE(parse_port_list("0", &ports));
    EXPECT_FALSE(parse_port_list("9000,,9001", &ports));
}

TEST(Config, ValidateRejectsInconsistentValues) {
    ServiceConfig cfg;
    cfg.data_root.clear();
    EXPECT_EQ(config_validate(cfg).code, StatusCode::Invalid);

    cfg = ServiceConfig{};
    cfg.session_ttl_ms = 0;
    EXPECT_EQ(config_validate(cfg).aux, 3u);

    cfg = ServiceConfig{};
    cfg.chunk_buffer_bytes = 16;
    EXPECT_EQ(config_validate(cfg).aux, 5u);

    cfg = ServiceConfig{};
    cfg.allowed_extensions.clear();
    EXPECT_EQ(config_validate(cfg).aux, 6u);
}

TEST_F(ConfigEnvTest, EnvironmentOverridesDefaults) {
    ::setenv("FERRY_DATA_ROOT", "/data/ferry", 1);
    ::setenv("FERRY_PORT", "9090", 1);
    ::setenv("FERRY_FALLBACK_PORTS", "9091,9092", 1);
    ::setenv("FERRY_PIN", "4321", 1);
    ::setenv("FERRY_SESSION_TTL_HOURS", "2", 1);
    ::setenv("FERRY_SWEEP_MINUTES", "15", 1);
    ::setenv("FERRY_LOG_LEVEL", "debug", 1);

    ServiceConfig cfg;
    ASSERT_TRUE(is_ok(config_apply_env(&cfg)));
    EXPECT_EQ(cfg.data_root, "/data/ferry");
    EXPECT_EQ(cfg.preferred_port, 9090);
    ASSERT_EQ(cfg.fallback_ports.size(), 2u);
    EXPECT_EQ(cfg.fallback_ports[0], 9091);
    EXPECT_TRUE(cfg.pin_required);
    EXPECT_EQ(cfg.pin, "4321");
    EXPECT_EQ(cfg.session_ttl_ms, 2 * kMillisPerHour);
    EXPECT_EQ(cfg.sweep_interval_ms, 15 * kMillisPerMinute);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST_F(ConfigEnvTest, UnsetVariablesLeaveConfigUntouched) {
    ServiceConfig cfg;
    cfg.data_root = "/keep";
    ASSERT_TRUE(is_ok(config_apply_env(&cfg)));
    EXPECT_EQ(cfg.data_root, "/keep");
    EXPECT_EQ(cfg.preferred_port, kDefaultPort);
}

TEST_F(ConfigEnvTest, RejectsMalformedNumbers) {
    ::setenv("FERRY_PORT", "80a", 1);
    ServiceConfig cfg;
    EXPECT_EQ(config_apply_env(&cfg).code, StatusCode::Invalid);

    clear();
    ::setenv("FERRY_SESSION_TTL_HOURS", "0", 1);
    EXPECT_EQ(config_apply_env(&cfg).code, StatusCode::Invalid);

    clear();
    ::setenv("FERRY_LOG_LEVEL", "loud", 1);
    EXPECT_EQ(config_apply_env(&cfg).code, StatusCode::Invalid);
}

TEST(Log, LevelNames) {
    LogLevel l = LogLevel::Info;
    EXPECT_TRUE(log_level_from_name("warn", &l));
    EXPECT_EQ(l, LogLevel::Warn);
    EXPECT_TRUE(log_level_from_name("off", &l));
    EXPECT_EQ(l, LogLevel::Off);
    EXPECT_FALSE(log_level_from_name("verbose", &l));
}
