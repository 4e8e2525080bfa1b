// config_test.cpp - environment loading and validation

#include <gtest/gtest.h>

#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("LISTEN_PORT");
        unsetenv("DYNAMIC_WEIGHTS_ENABLED");
        unsetenv("BREAKEVEN_BAND_PCT");
        unsetenv("TIER_MEDIUM_MIN_TRADES");
    }

    Config config;
};

TEST_F(ConfigTest, DefaultsValidate) {
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.breakeven_band_pct, 0.5);
    EXPECT_EQ(config.tier_low_min_trades, 10);
    EXPECT_EQ(config.tier_medium_min_trades, 30);
    EXPECT_EQ(config.tier_high_min_trades, 100);
    EXPECT_DOUBLE_EQ(config.calibration_bin_width, 10.0);
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    setenv("LISTEN_PORT", "9090", 1);
    setenv("DYNAMIC_WEIGHTS_ENABLED", "false", 1);
    setenv("BREAKEVEN_BAND_PCT", "0.25", 1);

    config.load_from_env();

    EXPECT_EQ(config.listen_port, 9090);
    EXPECT_FALSE(config.dynamic_weights_enabled);
    EXPECT_DOUBLE_EQ(config.breakeven_band_pct, 0.25);
}

TEST_F(ConfigTest, UnorderedTiersRejected) {
    setenv("TIER_MEDIUM_MIN_TRADES", "5", 1);
    config.load_from_env();

    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, WeightClampMustStraddleOne) {
    config.min_signal_weight = 1.5;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config.min_signal_weight = 0.3;
    config.max_signal_weight = 0.9;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, BadBinWidthRejected) {
    config.calibration_bin_width = 0.0;
    EXPECT_THROW(config.validate(), std::runtime_error);
}
