#include <gtest/gtest.h>

#include "backtest_config.hpp"
#include "cost_ledger.hpp"
#include "sizing_policy.hpp"
#include "stop_loss_policy.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using namespace backtester;

namespace {

    SizingContext contextWith(double capital, double price, std::optional<double> atr = std::nullopt) {
        SizingContext context;
        context.capital = capital;
        context.initial_capital = 100000.0;
        context.price = price;
        context.atr = atr;
        return context;
    }

    Position longPosition(double entry_price) {
        Position position;
        position.direction = core::Direction::Long;
        position.entry_price = entry_price;
        position.first_entry_price = entry_price;
        position.watermark = entry_price;
        position.size = 100;
        return position;
    }

} // anonymous namespace

// --- Sizing ---

TEST(SizingPolicyTest, FixedIsCappedByAvailableCapital) {
    FixedSizing sizing(0.2);
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(100000.0, 50.0)), 20000.0);
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(15000.0, 50.0)), 15000.0);
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(-10.0, 50.0)), 0.0);
}

TEST(SizingPolicyTest, PercentOfEquityFollowsCurrentCapital) {
    PercentOfEquitySizing sizing(0.25);
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(80000.0, 50.0)), 20000.0);
}

TEST(SizingPolicyTest, KellyApproxIsClampedToMaxFraction) {
    // 0.55 - 0.45 / 1.5 = 0.25
    KellyApproxSizing loose(0.5);
    EXPECT_NEAR(loose.allocation(contextWith(100000.0, 50.0)), 25000.0, 1e-6);
    KellyApproxSizing tight(0.1);
    EXPECT_NEAR(tight.allocation(contextWith(100000.0, 50.0)), 10000.0, 1e-6);
}

TEST(SizingPolicyTest, VolatilityAdjustedFallsBackWithoutAtr) {
    VolatilityAdjustedSizing sizing(0.2);
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(100000.0, 50.0)), 20000.0);
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(100000.0, 50.0, 0.0)), 20000.0);
    // price / ATR above 1 keeps the cap
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(100000.0, 50.0, 2.0)), 20000.0);
    // ATR larger than price scales the position down
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(100000.0, 50.0, 100.0)), 10000.0);
}

TEST(SizingPolicyTest, PyramidAddOnsShrinkGeometrically) {
    PyramidSizing sizing(0.2, 0.5);
    EXPECT_TRUE(sizing.allowsPyramiding());
    EXPECT_DOUBLE_EQ(sizing.allocation(contextWith(100000.0, 50.0)), 20000.0);
    EXPECT_DOUBLE_EQ(sizing.addOnAllocation(20000.0, 1), 10000.0);
    EXPECT_DOUBLE_EQ(sizing.addOnAllocation(20000.0, 2), 5000.0);
    EXPECT_FALSE(FixedSizing(0.2).allowsPyramiding());
}

TEST(SizingPolicyTest, SharesAreFlooredToWholeLots) {
    EXPECT_EQ(sharesForAllocation(20000.0, 99.0, 100), 200);
    EXPECT_EQ(sharesForAllocation(20000.0, 101.0, 100), 100);
    EXPECT_EQ(sharesForAllocation(5000.0, 101.0, 100), 0);
    EXPECT_EQ(sharesForAllocation(20000.0, 0.0, 100), 0);
    EXPECT_EQ(sharesForAllocation(-1.0, 10.0, 100), 0);
}

TEST(SizingPolicyTest, FactoryBuildsConfiguredPolicy) {
    BacktestConfig config;
    config.position_sizing = PositionSizing::VolatilityAdjusted;
    EXPECT_EQ(makeSizingPolicy(config)->getName(), "volatility");
    config.position_sizing = PositionSizing::Pyramid;
    EXPECT_EQ(makeSizingPolicy(config)->getName(), "pyramid");
}

// --- Stops ---

TEST(StopLossPolicyTest, FixedStopMirrorsForShorts) {
    FixedStopLoss stop(0.05);
    Position position = longPosition(100.0);
    EXPECT_DOUBLE_EQ(*stop.stopPrice(position, std::nullopt), 95.0);
    position.direction = core::Direction::Short;
    EXPECT_DOUBLE_EQ(*stop.stopPrice(position, std::nullopt), 105.0);
    EXPECT_FALSE(FixedStopLoss(0.0).stopPrice(position, std::nullopt).has_value());
}

TEST(StopLossPolicyTest, TrailingStopFollowsWatermark) {
    TrailingStopLoss stop(0.1, 0.05);
    Position position = longPosition(100.0);
    position.watermark = 120.0;
    EXPECT_DOUBLE_EQ(*stop.stopPrice(position, std::nullopt), 108.0);

    TrailingStopLoss fallback(std::nullopt, 0.05);
    EXPECT_DOUBLE_EQ(*fallback.stopPrice(position, std::nullopt), 95.0);
}

TEST(StopLossPolicyTest, AtrStopNeedsPositiveAtr) {
    AtrStopLoss stop(2.0);
    Position position = longPosition(100.0);
    EXPECT_FALSE(stop.stopPrice(position, std::nullopt).has_value());
    EXPECT_FALSE(stop.stopPrice(position, 0.0).has_value());
    EXPECT_DOUBLE_EQ(*stop.stopPrice(position, 1.5), 97.0);
}

TEST(StopLossPolicyTest, CompositePicksMostProtectiveStop) {
    BacktestConfig config;
    config.stop_loss_fraction = 0.05;
    config.trailing_stop_fraction = 0.1;
    config.use_atr_stop = true;
    config.atr_stop_multiplier = 2.0;
    const auto policy = makeStopLossPolicy(config);

    Position position = longPosition(100.0);
    position.watermark = 120.0;
    // fixed 95, trailing 108, ATR 98
    EXPECT_DOUBLE_EQ(*policy->stopPrice(position, 1.0), 108.0);

    position.direction = core::Direction::Short;
    position.watermark = 90.0;
    // fixed 105, trailing 99, ATR 102
    EXPECT_DOUBLE_EQ(*policy->stopPrice(position, 1.0), 99.0);
}

TEST(StopLossPolicyTest, CompositeOmitsDisabledComponents) {
    BacktestConfig config;
    config.use_atr_stop = false;
    const auto policy = makeStopLossPolicy(config);
    const auto* composite = dynamic_cast<const CompositeStopLoss*>(policy.get());
    ASSERT_NE(composite, nullptr);
    EXPECT_EQ(composite->componentCount(), 1u);
}

TEST(StopLossPolicyTest, WatermarkKeepsMostFavourableExtreme) {
    Position position = longPosition(100.0);
    updateWatermark(position, 108.0, 97.0);
    updateWatermark(position, 104.0, 90.0);
    EXPECT_DOUBLE_EQ(position.watermark, 108.0);

    position.direction = core::Direction::Short;
    position.watermark = 100.0;
    updateWatermark(position, 112.0, 95.0);
    updateWatermark(position, 101.0, 96.0);
    EXPECT_DOUBLE_EQ(position.watermark, 95.0);
}

TEST(StopLossPolicyTest, BreachUsesBarRange) {
    Position position = longPosition(100.0);
    EXPECT_TRUE(stopBreached(position, 95.0, 101.0, 94.9));
    EXPECT_FALSE(stopBreached(position, 95.0, 101.0, 95.1));
    position.direction = core::Direction::Short;
    EXPECT_TRUE(stopBreached(position, 105.0, 105.0, 99.0));
    EXPECT_FALSE(stopBreached(position, 105.0, 104.0, 99.0));
}

// --- Cost ledger ---

TEST(CostLedgerTest, SlippageMovesAgainstTheOrder) {
    CostLedger ledger(0.001, 0.0003);
    EXPECT_DOUBLE_EQ(ledger.applySlippage(100.0, 1), 100.0 * (1.0 + 0.001));
    EXPECT_DOUBLE_EQ(ledger.applySlippage(100.0, -1), 100.0 * (1.0 - 0.001));
    EXPECT_DOUBLE_EQ(ledger.commissionFor(100.0, 200), 100.0 * 200.0 * 0.0003);
}

TEST(CostLedgerTest, AnalysisSplitsCostsByTransactionType) {
    CostLedger ledger(0.001, 0.0003);
    const auto day = core::utils::makeDate(2024, 1, 2);
    ledger.record(day, TransactionKind::Open, 100.1, 100, 3.0, 10.0);
    ledger.record(day, TransactionKind::Close, 109.9, 100, 3.0, 11.0);
    ledger.record(day, TransactionKind::Open, 50.0, 100, 2.0, 4.0);

    EXPECT_DOUBLE_EQ(ledger.totalCommission(), 8.0);
    EXPECT_DOUBLE_EQ(ledger.totalSlippage(), 25.0);

    const auto analysis = ledger.analysis();
    EXPECT_DOUBLE_EQ(analysis.total_cost, 33.0);
    EXPECT_DOUBLE_EQ(analysis.avg_commission_per_transaction, 8.0 / 3.0);
    EXPECT_DOUBLE_EQ(analysis.cost_by_type.at("open").commission, 5.0);
    EXPECT_DOUBLE_EQ(analysis.cost_by_type.at("close").slippage, 11.0);
    EXPECT_NEAR(analysis.commission_pct + analysis.slippage_pct, 1.0, 1e-12);

    ledger.reset();
    EXPECT_TRUE(ledger.transactions().empty());
    EXPECT_DOUBLE_EQ(ledger.analysis().total_cost, 0.0);
}

TEST(CostLedgerTest, NegativeCostsAreRejected) {
    CostLedger ledger(0.001, 0.0003);
    const auto day = core::utils::makeDate(2024, 1, 2);
    EXPECT_THROW(ledger.record(day, TransactionKind::Open, 100.0, 100, -1.0, 0.0), std::invalid_argument);
    EXPECT_THROW(ledger.record(day, TransactionKind::Close, 100.0, 100, 1.0, -0.5), std::invalid_argument);
    EXPECT_TRUE(ledger.transactions().empty());
    EXPECT_DOUBLE_EQ(ledger.totalCommission(), 0.0);
}

// --- Configuration ---

TEST(BacktestConfigTest, MissingKeysKeepDefaults) {
    const auto config = BacktestConfig::fromJson(nlohmann::json::object());
    EXPECT_DOUBLE_EQ(config.initial_capital, 100000.0);
    EXPECT_EQ(config.position_sizing, PositionSizing::Fixed);
    EXPECT_EQ(config.stop_loss_type, StopLossType::Composite);
    EXPECT_FALSE(config.trailing_stop_fraction.has_value());
    EXPECT_EQ(config.shares_per_lot, 100);
}

TEST(BacktestConfigTest, ParsesPolicyIdentifiersAndValues) {
    const auto config = BacktestConfig::fromJson({
        {"initial_capital", 50000.0},
        {"position_sizing", "Kelly_Approx"},
        {"trailing_stop_fraction", 0.08},
        {"time_stop_bars", 0},
        {"shares_per_lot", 1}
    });
    EXPECT_DOUBLE_EQ(config.initial_capital, 50000.0);
    EXPECT_EQ(config.position_sizing, PositionSizing::KellyApprox);
    ASSERT_TRUE(config.trailing_stop_fraction.has_value());
    EXPECT_DOUBLE_EQ(*config.trailing_stop_fraction, 0.08);
    EXPECT_EQ(config.time_stop_bars, 0);

    const auto round_trip = BacktestConfig::fromJson(toJson(config));
    EXPECT_EQ(round_trip.position_sizing, PositionSizing::KellyApprox);
    EXPECT_DOUBLE_EQ(*round_trip.trailing_stop_fraction, 0.08);
}

TEST(BacktestConfigTest, RejectsUnknownPoliciesAndBadValues) {
    EXPECT_THROW(BacktestConfig::fromJson({{"position_sizing", "martingale"}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"stop_loss_type", "hope"}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"initial_capital", -1.0}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"max_position_fraction", 1.5}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"atr_period", "fourteen"}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson(nlohmann::json::array()), core::ConfigException);
}
