#include <gtest/gtest.h>

#include "ma_trend_signal.hpp"
#include "signal_factory.hpp"
#include "sma_cross_signal.hpp"
#include "static_signal.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace signals;
using namespace testing_helpers;

TEST(SignalProviderTest, MaTrendFollowsSustainedTrends) {
    MaTrendSignal provider(13, 21, 55);
    const auto rising = provider.calculate(risingCandles(100, 100.0, 1.0));
    ASSERT_EQ(rising.size(), 100u);
    EXPECT_EQ(rising[10], 0);
    EXPECT_EQ(rising[70], 1);
    EXPECT_EQ(rising[99], 1);

    const auto falling = provider.calculate(risingCandles(100, 300.0, -1.0));
    EXPECT_EQ(falling[99], -1);
}

TEST(SignalProviderTest, SmaCrossWaitsForSlowWindow) {
    SmaCrossSignal provider(3, 5);
    const auto rising = provider.calculate(risingCandles(20, 100.0, 1.0));
    ASSERT_EQ(rising.size(), 20u);
    EXPECT_EQ(rising[3], 0);
    EXPECT_EQ(rising[4], 1);

    const auto falling_long_only = provider.calculate(risingCandles(20, 100.0, -1.0));
    EXPECT_EQ(falling_long_only[10], 0);

    SmaCrossSignal with_shorts(3, 5, true);
    EXPECT_EQ(with_shorts.calculate(risingCandles(20, 100.0, -1.0))[10], -1);

    EXPECT_THROW(SmaCrossSignal(5, 3), std::invalid_argument);
}

TEST(SignalProviderTest, StaticSignalValidatesValues) {
    StaticSignal provider({0, 1, -1}, "fixed");
    EXPECT_EQ(provider.getName(), "fixed");
    EXPECT_EQ(provider.calculate({}), core::SignalSeries({0, 1, -1}));
    EXPECT_THROW(StaticSignal({0, 2}), std::invalid_argument);
}

TEST(SignalFactoryTest, BuildsProvidersFromConfig) {
    auto trend = SignalFactory::create({{"type", "ma_trend"}, {"p1", 5}, {"p2", 8}, {"p3", 20}});
    EXPECT_EQ(trend->getName(), "ma_trend");

    auto cross = SignalFactory::create({{"type", "sma_cross"}, {"fast", 5}, {"slow", 20}, {"name", "cross_5_20"}});
    EXPECT_EQ(cross->getName(), "cross_5_20");

    auto fixed = SignalFactory::create({{"type", "static"}, {"signals", {0, 1, 1, 0}}});
    EXPECT_EQ(fixed->calculate({}), core::SignalSeries({0, 1, 1, 0}));
}

TEST(SignalFactoryTest, RejectsBadConfig) {
    EXPECT_THROW(SignalFactory::create({{"type", "neural_net"}}), core::ConfigException);
    EXPECT_THROW(SignalFactory::create({{"fast", 5}}), core::ConfigException);
    EXPECT_THROW(SignalFactory::create({{"type", "sma_cross"}, {"fast", 30}, {"slow", 10}}), core::ConfigException);
    EXPECT_THROW(SignalFactory::create({{"type", "static"}}), core::ConfigException);
    EXPECT_THROW(SignalFactory::create({{"type", "static"}, {"signals", {0, 3}}}), core::ConfigException);
    EXPECT_THROW(SignalFactory::create({{"type", "ma_trend"}, {"p1", "slow"}}), core::ConfigException);
}
