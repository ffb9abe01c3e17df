#pragma once

#include "ind/price_series.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <ranges>

inline double true_range(double prev_close, const Candle& c) {
  double high_low = c.high - c.low;
  double high_pc = std::abs(c.high - prev_close);
  double low_pc = std::abs(c.low - prev_close);
  return std::max({high_low, high_pc, low_pc});
}

// Mean true range of candles (idx - period, idx]; requires idx >= period.
double mean_true_range(const PriceSeries& series, size_t idx, int period);

struct AtrPoint {
  size_t idx;
  Timestamp timestamp;
  double value;
};

/**
 * @brief Simple-moving-average ATR over a price series.
 *
 * True range is undefined for the first candle, so the ATR at index i is the
 * arithmetic mean of the true ranges of candles (i - period, i], and it is
 * defined only for i >= period. Values are computed on demand from the
 * series; nothing is cached, so repeated evaluation is bit-identical.
 */
class ATR {
  const PriceSeries& series;
  int period;

 public:
  ATR(const PriceSeries& series, int period);

  size_t first_defined() const { return static_cast<size_t>(period); }

  bool defined(size_t idx) const {
    return idx >= first_defined() && idx < series.size();
  }

  // nullopt where the window is not yet filled.
  std::optional<double> at(size_t idx) const;

  // Throws InsufficientWindowError where the window is not yet filled.
  double value(size_t idx) const;

  // Number of defined points: series size - period, or 0.
  size_t size() const {
    return series.size() > first_defined() ? series.size() - first_defined()
                                           : 0;
  }

  // Lazy, restartable view over the defined (timestamp, atr) points. The
  // view refers to the series only, so it may outlive this ATR.
  auto points() const {
    auto first = std::min(first_defined(), series.size());
    return std::views::iota(first, series.size()) |
           std::views::transform([&s = series, p = period](size_t i) {
             return AtrPoint{i, s.time(i), mean_true_range(s, i, p)};
           });
  }
};
