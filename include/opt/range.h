#pragma once

#include "ind/price_series.h"
#include "opt/grid_search.h"
#include "util/config.h"

#include <stop_token>
#include <vector>

struct RangeParams {
  int atr_period = 14;
  double atr_multiplier = 1.5;

  static RangeParams from(const Combination& comb);
  void validate() const;
};

struct RangeResult {
  size_t idx;            // key candle
  size_t detection_idx;  // anchoring DetectionResult
  Timestamp timestamp;
  double reference_price;
  double upper_limit;
  double lower_limit;
  double atr_value;

  bool contains(double price) const {
    return price >= lower_limit && price <= upper_limit;
  }
};

RangeResult make_range(size_t idx,
                       Timestamp timestamp,
                       double reference_price,
                       double atr_value,
                       double atr_multiplier);

// One range per key candle with a defined ATR; the others are skipped.
std::vector<RangeResult> compute_ranges(const PriceSeries& series,
                                        const std::vector<size_t>& key_candles,
                                        const RangeParams& params);

// Fraction of the following `horizon` closes inside the range, nullopt when
// the key candle is the last one in the series.
std::optional<double> range_coverage(const PriceSeries& series,
                                     const RangeResult& range,
                                     size_t horizon);

struct RangeScore {
  double score;
  double avg_coverage;
  size_t n_ranges;
  size_t n_measured;
  bool in_band;
};

RangeScore score_ranges(const PriceSeries& series,
                        const std::vector<RangeResult>& ranges,
                        const RangeConfig& cfg);

struct RangeRun {
  RangeParams params;
  RangeScore score{};
  std::vector<RangeResult> results;
};

GridSpace range_space(const RangeConfig& cfg);

GridOutcome<RangeRun> optimize_range(const PriceSeries& series,
                                     const std::vector<size_t>& key_candles,
                                     const RangeConfig& cfg,
                                     size_t n_threads = 1,
                                     std::stop_token cancel = {});
