#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "config.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace kaddht;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "test_kaddht_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write_file(const std::string& content) {
        std::ofstream file(path_);
        file << content;
    }

    std::string path_;
};

TEST_F(ConfigTest, Defaults) {
    DhtConfig config;
    EXPECT_EQ(config.closer_peer_count, K_VALUE);
    EXPECT_EQ(config.max_record_age, std::chrono::hours(36));
    EXPECT_EQ(config.provider_addr_ttl, std::chrono::minutes(30));
    EXPECT_EQ(config.provider_validity, std::chrono::hours(24));
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST_F(ConfigTest, FromJsonOverridesKnownKeys) {
    nlohmann::json json = {
        {"closer_peer_count", 8},
        {"max_record_age_seconds", 60},
        {"provider_addr_ttl_seconds", 120},
        {"log_level", "debug"},
        {"log_colors", false}
    };
    DhtConfig config = dht_config_from_json(json);
    EXPECT_EQ(config.closer_peer_count, 8u);
    EXPECT_EQ(config.max_record_age, std::chrono::seconds(60));
    EXPECT_EQ(config.provider_addr_ttl, std::chrono::seconds(120));
    EXPECT_EQ(config.provider_validity, std::chrono::hours(24));
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_FALSE(config.log_colors);
    EXPECT_TRUE(config.log_timestamps);
}

TEST_F(ConfigTest, InvalidValuesFallBackToDefaults) {
    nlohmann::json json = {
        {"closer_peer_count", -3},
        {"max_record_age_seconds", "forever"},
        {"provider_validity_seconds", 0},
        {"log_level", "loud"},
        {"log_timestamps", "yes"}
    };
    DhtConfig config = dht_config_from_json(json);
    DhtConfig defaults;
    EXPECT_EQ(config.closer_peer_count, defaults.closer_peer_count);
    EXPECT_EQ(config.max_record_age, defaults.max_record_age);
    EXPECT_EQ(config.provider_validity, defaults.provider_validity);
    EXPECT_EQ(config.log_level, defaults.log_level);
    EXPECT_EQ(config.log_timestamps, defaults.log_timestamps);

    EXPECT_EQ(dht_config_from_json(nlohmann::json::array()).closer_peer_count, defaults.closer_peer_count);
}

TEST_F(ConfigTest, DurationsBeyondClockRangeFallBackToDefaults) {
    nlohmann::json json = {
        {"max_record_age_seconds", 10000000000LL},
        {"provider_addr_ttl_seconds", 10000000000LL},
        {"provider_validity_seconds", MAX_CONFIG_DURATION.count() + 1},
        {"provider_cleanup_interval_seconds", MAX_CONFIG_DURATION.count()}
    };
    DhtConfig config = dht_config_from_json(json);
    DhtConfig defaults;
    EXPECT_EQ(config.max_record_age, defaults.max_record_age);
    EXPECT_EQ(config.provider_addr_ttl, defaults.provider_addr_ttl);
    EXPECT_EQ(config.provider_validity, defaults.provider_validity);
    EXPECT_EQ(config.provider_cleanup_interval, MAX_CONFIG_DURATION);

    Record fresh("/v/k", "1|v");
    auto now = std::chrono::system_clock::now();
    fresh.time_received = format_rfc3339(now - std::chrono::seconds(1));
    EXPECT_FALSE(is_record_stale(fresh, now, config.max_record_age));
    EXPECT_FALSE(is_record_stale(fresh, now, MAX_CONFIG_DURATION));
}

TEST_F(ConfigTest, DefaultsMatchProtocolConstants) {
    DhtConfig config;
    EXPECT_EQ(config.max_record_age, MAX_RECORD_AGE);
    EXPECT_EQ(config.provider_addr_ttl, PROVIDER_ADDR_TTL);
    EXPECT_EQ(config.provider_validity, PROVIDE_VALIDITY);
    EXPECT_EQ(config.provider_cleanup_interval, PROVIDER_CLEANUP_INTERVAL);
}

TEST_F(ConfigTest, JsonRoundTrip) {
    DhtConfig config;
    config.closer_peer_count = 5;
    config.provider_cleanup_interval = std::chrono::seconds(90);
    config.log_level = LogLevel::WARN;

    nlohmann::json json = dht_config_to_json(config);
    EXPECT_EQ(json["log_level"], "warn");

    DhtConfig restored = dht_config_from_json(json);
    EXPECT_EQ(restored.closer_peer_count, 5u);
    EXPECT_EQ(restored.provider_cleanup_interval, std::chrono::seconds(90));
    EXPECT_EQ(restored.log_level, LogLevel::WARN);
}

TEST_F(ConfigTest, LoadCreatesMissingFileWithDefaults) {
    DhtConfig config;
    config.closer_peer_count = 3;
    ASSERT_TRUE(load_dht_config(path_, config));
    EXPECT_EQ(config.closer_peer_count, K_VALUE);

    std::ifstream file(path_);
    EXPECT_TRUE(file.is_open());
}

TEST_F(ConfigTest, SaveThenLoad) {
    DhtConfig config;
    config.max_record_age = std::chrono::seconds(3600);
    ASSERT_TRUE(save_dht_config(path_, config));

    DhtConfig loaded;
    ASSERT_TRUE(load_dht_config(path_, loaded));
    EXPECT_EQ(loaded.max_record_age, std::chrono::seconds(3600));
}

TEST_F(ConfigTest, LoadRejectsEmptyAndCorruptFiles) {
    DhtConfig config;
    write_file("");
    EXPECT_FALSE(load_dht_config(path_, config));

    write_file("{ not json");
    EXPECT_FALSE(load_dht_config(path_, config));
}

TEST_F(ConfigTest, LogLevelNames) {
    LogLevel level;
    EXPECT_TRUE(parse_log_level("ERROR", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_STREQ(log_level_to_string(LogLevel::INFO), "info");
}

TEST_F(ConfigTest, ApplyLoggingConfigSetsLevel) {
    DhtConfig config;
    config.log_level = LogLevel::ERROR;
    apply_logging_config(config);
    EXPECT_EQ(Logger::getInstance().get_log_level(), LogLevel::ERROR);
    EXPECT_FALSE(Logger::getInstance().is_enabled(LogLevel::WARN));

    Logger::getInstance().set_log_level(LogLevel::INFO);
}
