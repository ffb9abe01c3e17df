#include <gtest/gtest.h>

#include "core/errors.h"
#include "fixtures/synthetic_series.hpp"
#include "ind/atr.h"

namespace {

PriceSeries hand_series() {
  return PriceSeries{{
      make_candle(0, 10.0, 10.5, 9.5, 10.0),
      make_candle(1, 10.0, 12.0, 9.0, 11.0),   // tr 3
      make_candle(2, 11.0, 11.5, 10.5, 11.0),  // tr 1
      make_candle(3, 11.0, 14.0, 11.0, 13.0),  // tr 3
      make_candle(4, 13.0, 13.0, 10.0, 10.0),  // tr 3
  }};
}

}  // namespace

TEST(ATR, TrueRangeUsesPreviousClose) {
  auto c = make_candle(0, 10.0, 11.0, 10.5, 10.8);
  EXPECT_DOUBLE_EQ(true_range(9.0, c), 2.0);
  EXPECT_DOUBLE_EQ(true_range(12.5, c), 2.0);
  EXPECT_DOUBLE_EQ(true_range(10.7, c), 0.5);
}

TEST(ATR, SimpleMovingAverageOfTrueRange) {
  auto series = hand_series();
  ATR atr{series, 2};

  EXPECT_FALSE(atr.at(0).has_value());
  EXPECT_FALSE(atr.at(1).has_value());
  EXPECT_DOUBLE_EQ(*atr.at(2), 2.0);
  EXPECT_DOUBLE_EQ(*atr.at(3), 2.0);
  EXPECT_DOUBLE_EQ(*atr.at(4), 3.0);
  EXPECT_FALSE(atr.at(5).has_value());
}

TEST(ATR, UndefinedWindowThrowsOnValue) {
  auto series = hand_series();
  ATR atr{series, 3};

  EXPECT_THROW(atr.value(2), InsufficientWindowError);
  EXPECT_NO_THROW(atr.value(3));
}

TEST(ATR, OutputLengthIsSeriesLengthMinusPeriod) {
  auto series = random_walk(200);
  for (int period : {1, 5, 14, 28}) {
    ATR atr{series, period};
    size_t n = 0;
    for (const auto& p : atr.points()) {
      EXPECT_TRUE(std::isfinite(p.value));
      EXPECT_EQ(p.timestamp, series.time(p.idx));
      n++;
    }
    EXPECT_EQ(n, series.size() - period) << "period " << period;
    EXPECT_EQ(atr.size(), n);
  }
}

TEST(ATR, PeriodLongerThanSeriesYieldsNothing) {
  auto series = hand_series();
  ATR atr{series, 10};

  EXPECT_EQ(atr.size(), 0u);
  EXPECT_TRUE(atr.points().empty());
}

TEST(ATR, RecomputationIsBitIdentical) {
  auto series = random_walk(300, 7);
  ATR first{series, 14};
  ATR second{series, 14};

  std::vector<double> a, b;
  for (const auto& p : first.points())
    a.push_back(p.value);
  for (const auto& p : second.points())
    b.push_back(p.value);
  // restartable: walking the same view twice gives the same values
  std::vector<double> again;
  for (const auto& p : first.points())
    again.push_back(p.value);

  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i], b[i]);
    EXPECT_EQ(a[i], again[i]);
  }
}

TEST(ATR, PointsOutliveTheIndicator) {
  auto series = random_walk(60, 3);
  ATR reference{series, 14};

  std::vector<AtrPoint> points;
  for (const auto& p : ATR{series, 14}.points())
    points.push_back(p);

  auto view = ATR{series, 5}.points();
  size_t n_short = 0;
  for (const auto& p : view) {
    EXPECT_EQ(p.value, mean_true_range(series, p.idx, 5));
    n_short++;
  }
  EXPECT_EQ(n_short, 55u);

  ASSERT_EQ(points.size(), 46u);
  for (const auto& p : points) {
    EXPECT_EQ(p.value, reference.value(p.idx));
    EXPECT_EQ(p.timestamp, series.time(p.idx));
  }
}

TEST(ATR, RejectsNonPositivePeriod) {
  auto series = hand_series();
  EXPECT_THROW((ATR{series, 0}), std::invalid_argument);
  EXPECT_THROW((ATR{series, -3}), std::invalid_argument);
}
