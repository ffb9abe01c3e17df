#include <gtest/gtest.h>

#include <cmath>

#include "core/errors.h"
#include "fixtures/synthetic_series.hpp"
#include "opt/breakout.h"
#include "opt/detection.h"

namespace {

// 97..103 around a close of 100 on the first candle.
RangeResult first_candle_range(const PriceSeries& series) {
  return make_range(0, series.time(0), 100.0, 2.0, 1.5);
}

BreakoutResult valid_breakout(size_t idx, Direction d) {
  return {0, T0 + static_cast<Timestamp>(idx) * STEP, d, 1.0, true, idx, idx};
}

BreakoutResult no_breakout() {
  return {0, T0, Direction::None, 0.0, false};
}

}  // namespace

TEST(Breakout, BullishCloseAboveThreshold) {
  auto series = series_from_closes({100, 101, 103.6, 110});
  auto b = evaluate_breakout(series, first_candle_range(series), 4, {0.5, 3});

  EXPECT_EQ(b.direction, Direction::Bullish);
  EXPECT_TRUE(b.is_valid);
  EXPECT_EQ(b.range_idx, 4u);
  ASSERT_TRUE(b.breakout_idx.has_value());
  EXPECT_EQ(*b.breakout_idx, 2u);
  EXPECT_EQ(b.candles_to_breakout, 2u);
  EXPECT_EQ(b.timestamp, series.time(2));
  EXPECT_NEAR(b.breakout_percentage, 0.6 / 103.0 * 100.0, 1e-9);
}

TEST(Breakout, BearishCloseBelowThreshold) {
  auto series = series_from_closes({100, 96, 90});
  auto b = evaluate_breakout(series, first_candle_range(series), 0, {0.5, 3});

  EXPECT_EQ(b.direction, Direction::Bearish);
  EXPECT_TRUE(b.is_valid);
  EXPECT_EQ(b.candles_to_breakout, 1u);
  EXPECT_NEAR(b.breakout_percentage, -1.0 / 97.0 * 100.0, 1e-9);
  EXPECT_LT(b.breakout_percentage, 0.0);
}

TEST(Breakout, CloseBetweenLimitAndThresholdIsNotABreakout) {
  auto series = series_from_closes({100, 103.5, 96.6, 101});
  auto b = evaluate_breakout(series, first_candle_range(series), 0, {0.5, 5});
  EXPECT_EQ(b.direction, Direction::None);
}

TEST(Breakout, OnlyScansUpToMaxCandles) {
  auto series = series_from_closes({100, 101, 103.6, 110});
  auto range = first_candle_range(series);

  auto b = evaluate_breakout(series, range, 0, {0.5, 1});
  EXPECT_EQ(b.direction, Direction::None);
  EXPECT_FALSE(b.is_valid);
  EXPECT_DOUBLE_EQ(b.breakout_percentage, 0.0);
  EXPECT_FALSE(b.breakout_idx.has_value());
  EXPECT_EQ(b.timestamp, range.timestamp);
}

TEST(Breakout, StopsAtEndOfSeries) {
  auto series = series_from_closes({100, 101, 102});
  auto b = evaluate_breakout(series, first_candle_range(series), 0, {0.5, 7});
  EXPECT_EQ(b.direction, Direction::None);

  auto last = make_range(2, series.time(2), 102.0, 1.0, 1.0);
  EXPECT_EQ(evaluate_breakout(series, last, 0, {0.1, 7}).direction,
            Direction::None);
}

TEST(Breakout, NonPositiveLowerLimitNeverBreaksDown) {
  auto series = series_from_closes({2, 1, 0.5, 5});
  auto range = make_range(0, series.time(0), 2.0, 2.0, 1.0);  // 0..4
  ASSERT_EQ(range.lower_limit, 0.0);

  auto b = evaluate_breakout(series, range, 0, {0.5, 3});
  EXPECT_EQ(b.direction, Direction::Bullish);
  EXPECT_EQ(b.candles_to_breakout, 3u);
  EXPECT_TRUE(std::isfinite(b.breakout_percentage));
  EXPECT_NEAR(b.breakout_percentage, 25.0, 1e-9);

  auto wide = make_range(0, series.time(0), 2.0, 2.0, 1.5);  // -1..5
  auto none = evaluate_breakout(series, wide, 0, {0.5, 3});
  EXPECT_EQ(none.direction, Direction::None);
  EXPECT_DOUBLE_EQ(none.breakout_percentage, 0.0);
}

TEST(Breakout, OneResultPerRange) {
  auto series = random_walk(300);
  auto ranges = compute_ranges(series, {20, 40, 60, 299}, {14, 1.0});
  auto results = evaluate_breakouts(series, ranges, {0.3, 5});

  ASSERT_EQ(results.size(), ranges.size());
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i].range_idx, i);
    EXPECT_EQ(results[i].is_valid, results[i].direction != Direction::None);
  }
  EXPECT_FALSE(results.back().is_valid);
}

TEST(Breakout, DirectionNames) {
  for (auto d : {Direction::None, Direction::Bullish, Direction::Bearish})
    EXPECT_EQ(direction_from_string(to_string(d)), d);
  EXPECT_EQ(to_string(Direction::Bullish), "bullish");
  EXPECT_EQ(direction_from_string("sideways"), Direction::None);
}

TEST(Breakout, ContinuationRuleLooksAhead) {
  auto series = series_from_closes({100, 101, 103.6, 105, 106, 102});

  auto up = valid_breakout(2, Direction::Bullish);
  EXPECT_TRUE(continuation_rule(2)(series, up));   // 106 > 103.6
  EXPECT_FALSE(continuation_rule(3)(series, up));  // 102 < 103.6
  EXPECT_FALSE(continuation_rule(50)(series, up)); // clamped to last close

  auto down = valid_breakout(2, Direction::Bearish);
  EXPECT_TRUE(continuation_rule(3)(series, down));

  EXPECT_FALSE(continuation_rule(2)(series, no_breakout()));
}

TEST(Breakout, ScoreWeighsValidityAndProfit) {
  auto series = random_walk(20);
  std::vector<BreakoutResult> results{
      valid_breakout(3, Direction::Bullish),
      valid_breakout(5, Direction::Bearish),
      no_breakout(),
      no_breakout(),
  };

  BreakoutScoring always{0.4, 0.6, [](const auto&, const auto&) { return true; }};
  auto s = score_breakouts(series, results, always);
  EXPECT_EQ(s.n_total, 4u);
  EXPECT_EQ(s.n_valid, 2u);
  EXPECT_EQ(s.n_profitable, 2u);
  EXPECT_DOUBLE_EQ(s.valid_ratio, 0.5);
  EXPECT_DOUBLE_EQ(s.profit_ratio, 1.0);
  EXPECT_DOUBLE_EQ(s.score, 0.8);

  BreakoutScoring validity_only{1.0, 0.0, always.profitable};
  EXPECT_DOUBLE_EQ(score_breakouts(series, results, validity_only).score, 0.5);

  BreakoutScoring never{0.4, 0.6, [](const auto&, const auto&) { return false; }};
  EXPECT_DOUBLE_EQ(score_breakouts(series, results, never).score, 0.2);
}

TEST(Breakout, NoValidBreakoutsScoresZero) {
  auto series = random_walk(20);
  auto s = score_breakouts(series, {no_breakout(), no_breakout()},
                           BreakoutScoring::from(BreakoutConfig{}));
  EXPECT_DOUBLE_EQ(s.score, 0.0);
  EXPECT_DOUBLE_EQ(s.profit_ratio, 0.0);
}

TEST(Breakout, NothingToScoreIsInsufficient) {
  auto series = random_walk(20);
  EXPECT_THROW(
      score_breakouts(series, {}, BreakoutScoring::from(BreakoutConfig{})),
      InsufficientWindowError);
}

TEST(Breakout, InjectedRuleDrivesTheSearch) {
  auto series = random_walk(1000, 9);
  auto keys = key_candle_indices(detect_key_candles(series, {80, 40, 30}));
  auto ranges = compute_ranges(series, keys, {14, 1.0});
  ASSERT_FALSE(ranges.empty());

  // With profit never counted, the loosest threshold maximizes validity.
  BreakoutScoring validity{0.4, 0.6, [](const auto&, const auto&) { return false; }};
  auto outcome = optimize_breakout(series, ranges, BreakoutConfig{}, validity, 4);

  EXPECT_EQ(outcome.total_combinations, 50u);
  EXPECT_DOUBLE_EQ(outcome.winner.get("breakout_threshold_percentage"), 0.1);
  EXPECT_EQ(outcome.payload.results.size(), ranges.size());
  for (const auto& c : outcome.candidates)
    EXPECT_LE(*c.score, outcome.score);
}
