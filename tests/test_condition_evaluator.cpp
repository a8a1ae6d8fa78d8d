#include <gtest/gtest.h>
#include "core/condition_evaluator.hpp"
#include "core/exceptions.hpp"
#include "test_helpers.hpp"

using namespace arbguard;
using arbguard::test_support::make_observation;
using arbguard::test_support::make_snapshot;

class ConditionEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker = std::make_unique<PersistenceTracker>(config.persistence_window);
        evaluator = std::make_unique<ConditionEvaluator>(config, *tracker);
    }

    void Rebuild() {
        tracker = std::make_unique<PersistenceTracker>(config.persistence_window);
        evaluator = std::make_unique<ConditionEvaluator>(config, *tracker);
    }

    // History ending at `height` with the given prices at every step
    static ObservationHistory History(Height first, Height last,
                                      const std::array<std::uint64_t, kSourceCount>& prices) {
        ObservationHistory history;
        for (Height h = first; h <= last; ++h) {
            history.push_back(make_observation(h, prices));
        }
        return history;
    }

    ValidationConfig config;
    std::unique_ptr<PersistenceTracker> tracker;
    std::unique_ptr<ConditionEvaluator> evaluator;
};

TEST_F(ConditionEvaluatorTest, ShortHistoryRejectsWithoutTouchingTracker) {
    ObservationHistory history = History(1, 1, {3000, 3200, 2950});

    EvaluationReport report = evaluator->assess(history);
    EXPECT_FALSE(report.is_accepted);
    EXPECT_EQ(report.reason, RejectionReason::INSUFFICIENT_HISTORY);
    EXPECT_EQ(tracker->size(), 0u);

    EXPECT_FALSE(evaluator->evaluate(ObservationHistory{}));
    EXPECT_EQ(tracker->size(), 0u);
}

TEST_F(ConditionEvaluatorTest, PriceGapComputedAgainstMinimum) {
    auto observation = make_observation(1, {3000, 3200, 2950});
    EXPECT_EQ(ConditionEvaluator::price_gap_bps(observation), 847u);

    auto tight = make_observation(1, {3000, 3005, 2998});
    EXPECT_EQ(ConditionEvaluator::price_gap_bps(tight), 23u);
}

TEST_F(ConditionEvaluatorTest, SmallGapNeverAcceptsRegardlessOfHistory) {
    for (Height last = 2; last <= 12; ++last) {
        ObservationHistory history = History(1, last, {3000, 3005, 2998});
        EvaluationReport report = evaluator->assess(history);
        EXPECT_FALSE(report.is_accepted);
        EXPECT_EQ(report.reason, RejectionReason::PRICE_GAP);
    }
    EXPECT_EQ(tracker->size(), 0u);
}

TEST_F(ConditionEvaluatorTest, GapExactlyAtThresholdPasses) {
    // (10050 - 10000) * 10000 / 10000 == 50
    ObservationHistory history = History(1, 2, {10000, 10050, 10010});
    EvaluationReport report = evaluator->assess(history);
    EXPECT_EQ(report.price_gap_bps, 50u);
    EXPECT_NE(report.reason, RejectionReason::PRICE_GAP);
}

TEST_F(ConditionEvaluatorTest, ZeroPriceRejects) {
    ObservationHistory history = History(1, 2, {3000, 3200, 2950});
    history.back().sources[1].price = Amount(0);

    EvaluationReport report = evaluator->assess(history);
    EXPECT_FALSE(report.is_accepted);
    EXPECT_EQ(report.reason, RejectionReason::PRICE_GAP);
}

TEST_F(ConditionEvaluatorTest, LowLiquidityRejects) {
    ObservationHistory history = History(1, 2, {3000, 3200, 2950});
    history.back().sources[2].total_liquidity = types::from_units(999);

    EvaluationReport report = evaluator->assess(history);
    EXPECT_FALSE(report.is_accepted);
    EXPECT_EQ(report.reason, RejectionReason::LIQUIDITY);
    EXPECT_EQ(tracker->size(), 0u);
}

TEST_F(ConditionEvaluatorTest, PairProfitUsesLowerPriceAndLowerLiquidity) {
    auto a = make_snapshot("dex_a", 3200, 1000000);
    auto b = make_snapshot("dex_b", 2950, 600000);

    EXPECT_EQ(ConditionEvaluator::pair_profit(a, b), Amount("5084745762711864406779"));
    EXPECT_EQ(ConditionEvaluator::pair_profit(b, a), ConditionEvaluator::pair_profit(a, b));

    auto observation = make_observation(1, {3000, 3200, 2950});
    EXPECT_EQ(ConditionEvaluator::max_pair_profit(observation), Amount("8474576271186440677966"));
}

TEST_F(ConditionEvaluatorTest, GasCostAboveProfitRejects) {
    // 10^16 * 200000 * 2000 = 4 * 10^24, above the ~8474 unit estimate
    ObservationHistory history;
    history.push_back(make_observation(1, {3000, 3200, 2950}, 10000000000000000ULL));
    history.push_back(make_observation(2, {3000, 3200, 2950}, 10000000000000000ULL));

    EvaluationReport report = evaluator->assess(history);
    EXPECT_FALSE(report.is_accepted);
    EXPECT_EQ(report.reason, RejectionReason::PROFITABILITY);
    EXPECT_EQ(report.gas_cost_estimate, Amount("4000000000000000000000000"));
}

TEST_F(ConditionEvaluatorTest, ProfitFloorRejects) {
    config.min_profit_floor = types::from_units(10000);
    Rebuild();

    EvaluationReport report = evaluator->assess(History(1, 2, {3000, 3200, 2950}));
    EXPECT_FALSE(report.is_accepted);
    EXPECT_EQ(report.reason, RejectionReason::PROFITABILITY);
}

TEST_F(ConditionEvaluatorTest, ReserveRatioFormula) {
    auto snapshot = make_snapshot("dex_a", 3000, 1000000, 500, 1000);
    ASSERT_TRUE(ConditionEvaluator::reserve_ratio(snapshot).has_value());
    EXPECT_EQ(*ConditionEvaluator::reserve_ratio(snapshot), Amount(500));

    snapshot.reserve_quote = types::parse_fixed("0.5");
    EXPECT_FALSE(ConditionEvaluator::reserve_ratio(snapshot).has_value());
}

TEST_F(ConditionEvaluatorTest, ReserveImbalanceRejects) {
    ObservationHistory low = History(1, 2, {3000, 3200, 2950});
    low.back().sources[0].reserve_base = Amount(5);
    EXPECT_EQ(evaluator->assess(low).reason, RejectionReason::BALANCE);

    ObservationHistory high = History(1, 2, {3000, 3200, 2950});
    high.back().sources[1].reserve_base = Amount(20000);
    EXPECT_EQ(evaluator->assess(high).reason, RejectionReason::BALANCE);

    ObservationHistory empty_quote = History(1, 2, {3000, 3200, 2950});
    empty_quote.back().sources[2].reserve_quote = Amount(0);
    EXPECT_EQ(evaluator->assess(empty_quote).reason, RejectionReason::BALANCE);

    EXPECT_EQ(tracker->size(), 0u);
}

TEST_F(ConditionEvaluatorTest, ReserveRatioBoundsAreInclusive) {
    ObservationHistory history = History(1, 2, {3000, 3200, 2950});
    history.back().sources[0].reserve_base = Amount(10);
    history.back().sources[1].reserve_base = Amount(10000);

    EvaluationReport report = evaluator->assess(history);
    EXPECT_EQ(report.reason, RejectionReason::PERSISTENCE);
}

TEST_F(ConditionEvaluatorTest, PersistenceMaturesAfterWindow) {
    const std::array<std::uint64_t, kSourceCount> prices = {3000, 3200, 2950};

    EvaluationReport first = evaluator->assess(History(1, 2, prices));
    EXPECT_FALSE(first.is_accepted);
    EXPECT_EQ(first.reason, RejectionReason::PERSISTENCE);
    ASSERT_TRUE(first.pair_identity.has_value());
    EXPECT_EQ(*first.pair_identity, PairIdentity("dex_c", "dex_b"));
    EXPECT_EQ(*tracker->first_seen(*first.pair_identity), 2u);

    EXPECT_FALSE(evaluator->evaluate(History(1, 3, prices)));

    EvaluationReport third = evaluator->assess(History(1, 4, prices));
    EXPECT_TRUE(third.is_accepted);
    EXPECT_EQ(third.reason, RejectionReason::NONE);
    EXPECT_EQ(third.buy_source, "dex_c");
    EXPECT_EQ(third.sell_source, "dex_b");
    EXPECT_EQ(third.price_gap_bps, 847u);
    EXPECT_EQ(third.max_profit_estimate, Amount("8474576271186440677966"));
}

TEST_F(ConditionEvaluatorTest, EvaluatingSameHistoryTwiceIsNotIdempotent) {
    ObservationHistory history = History(1, 2, {3000, 3200, 2950});

    EXPECT_FALSE(evaluator->evaluate(history));
    EXPECT_EQ(tracker->size(), 1u);
    EXPECT_FALSE(evaluator->evaluate(history));
    EXPECT_EQ(tracker->size(), 1u);
    EXPECT_EQ(*tracker->first_seen(PairIdentity("dex_b", "dex_c")), 2u);
}

TEST_F(ConditionEvaluatorTest, WideningGapDoesNotResetClock) {
    EXPECT_FALSE(evaluator->evaluate(History(1, 2, {3000, 3200, 2950})));
    EXPECT_FALSE(evaluator->evaluate(History(1, 3, {3000, 3600, 2950})));
    EXPECT_TRUE(evaluator->evaluate(History(1, 4, {3000, 3900, 2900})));
}

TEST_F(ConditionEvaluatorTest, NewExtremePairStartsItsOwnClock) {
    EXPECT_FALSE(evaluator->evaluate(History(1, 2, {3000, 3200, 2950})));
    // dex_a now lowest, dex_b highest
    EXPECT_FALSE(evaluator->evaluate(History(1, 3, {2900, 3200, 2950})));
    EXPECT_FALSE(evaluator->evaluate(History(1, 4, {2900, 3200, 2950})));
    EXPECT_TRUE(evaluator->evaluate(History(1, 5, {2900, 3200, 2950})));
    EXPECT_EQ(tracker->size(), 2u);
}

TEST_F(ConditionEvaluatorTest, ConfigurableWindowRequiresLongerHistory) {
    config.persistence_window = 3;
    Rebuild();

    EvaluationReport report = evaluator->assess(History(1, 2, {3000, 3200, 2950}));
    EXPECT_EQ(report.reason, RejectionReason::INSUFFICIENT_HISTORY);

    EXPECT_FALSE(evaluator->evaluate(History(1, 3, {3000, 3200, 2950})));
    EXPECT_FALSE(evaluator->evaluate(History(1, 5, {3000, 3200, 2950})));
    EXPECT_TRUE(evaluator->evaluate(History(1, 6, {3000, 3200, 2950})));
}

TEST_F(ConditionEvaluatorTest, OverflowRejectsAndLeavesTrackerUntouched) {
    ObservationHistory history = History(1, 2, {3000, 3200, 2950});
    for (auto& source : history.back().sources) {
        source.total_liquidity = Amount(1) << 200;
        source.price = source.price << 80;
    }

    EvaluationReport report = evaluator->assess(history);
    EXPECT_FALSE(report.is_accepted);
    EXPECT_EQ(report.reason, RejectionReason::ARITHMETIC_OVERFLOW);
    EXPECT_EQ(tracker->size(), 0u);
}

TEST_F(ConditionEvaluatorTest, OnlyLatestObservationIsEvaluated) {
    ObservationHistory history = History(1, 1, {3000, 3005, 2998});
    history.push_back(make_observation(2, {3000, 3200, 2950}));

    EXPECT_EQ(evaluator->assess(history).reason, RejectionReason::PERSISTENCE);
}

TEST(PairIdentityTest, ExtremesTieBreakTowardLowerIndex) {
    auto observation = arbguard::test_support::make_observation(1, {3000, 3000, 3000});
    auto [low, high] = ConditionEvaluator::extreme_indices(observation);
    EXPECT_EQ(low, 0u);
    EXPECT_EQ(high, 0u);
    EXPECT_EQ(ConditionEvaluator::pair_identity(observation), PairIdentity("dex_a", "dex_b"));
}
