#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"

TEST(SchedulerConfigTest, defaults)
{
    SchedulerConfig config = SchedulerConfig::from_json_string("{}");

    EXPECT_EQ(config.pstate_compute, 0);
    EXPECT_EQ(config.pstate_sleep, 1);
    EXPECT_DOUBLE_EQ(config.idle_time_to_sleep, 1800);
    EXPECT_DOUBLE_EQ(config.wake_cooldown, 600);
    EXPECT_TRUE(config.allow_wake);
    EXPECT_TRUE(config.power_management);
    EXPECT_EQ(config.backfill_window, -1);
    EXPECT_EQ(config.reservation_depth, -1);
    EXPECT_FALSE(config.energy_monitoring);
    EXPECT_TRUE(config.record_file.empty());
}

TEST(SchedulerConfigTest, options_override_defaults)
{
    SchedulerConfig config = SchedulerConfig::from_json_string(
        "{\"pstate_compute\": 2, \"pstate_sleep\": 13, \"idle_time_to_sleep\": 30.5,"
        " \"allow_wake\": false, \"reservation_depth\": 1, \"energy_monitoring\": true,"
        " \"record_interval\": 10, \"record_file\": \"/tmp/out.csv\"}");

    EXPECT_EQ(config.pstate_compute, 2);
    EXPECT_EQ(config.pstate_sleep, 13);
    EXPECT_DOUBLE_EQ(config.idle_time_to_sleep, 30.5);
    EXPECT_FALSE(config.allow_wake);
    EXPECT_EQ(config.reservation_depth, 1);
    EXPECT_TRUE(config.energy_monitoring);
    EXPECT_DOUBLE_EQ(config.record_interval, 10);
    EXPECT_EQ(config.record_file, "/tmp/out.csv");
}

TEST(SchedulerConfigTest, invalid_options)
{
    EXPECT_THROW(SchedulerConfig::from_json_string("[1, 2]"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{not json"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"idle_time_to_sleep\": \"long\"}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"pstate_sleep\": 1.5}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"allow_wake\": 1}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"switch_on_delay\": -1}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"pstate_compute\": 1, \"pstate_sleep\": 1}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"backfill_window\": 0}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"reservation_depth\": -2}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"record_interval\": 0}"), ConfigError);
    EXPECT_THROW(SchedulerConfig::from_json_string("{\"record_file\": 3}"), ConfigError);
}
