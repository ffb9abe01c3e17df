#pragma once

#include "ind/price_series.h"
#include "opt/grid_search.h"
#include "util/config.h"

#include <optional>
#include <stop_token>
#include <vector>

struct DetectionParams {
  double volume_percentile_threshold = 80.0;  // 0-100
  double body_percentage_threshold = 30.0;    // 0-100
  int lookback_candles = 50;

  static DetectionParams from(const Combination& comb);
  void validate() const;
};

struct DetectionResult {
  size_t idx;
  Timestamp timestamp;
  bool is_key_candle;
  double volume;
  double body_percentage;                   // 0-100
  std::optional<double> volume_percentile;  // 0-100, unset before lookback
};

// |close - open| / (high - low) as a percentage, 0 for a flat candle.
double body_percentage(const Candle& c);

// Percentage of the `lookback` candles ending at idx (inclusive) whose volume
// is <= the volume at idx. nullopt until the window is filled.
std::optional<double> volume_percentile(const PriceSeries& series,
                                        size_t idx,
                                        int lookback);

// One result per candle, in series order.
std::vector<DetectionResult> detect_key_candles(const PriceSeries& series,
                                                const DetectionParams& params);

std::vector<size_t> key_candle_indices(
    const std::vector<DetectionResult>& results);

struct DetectionScore {
  double score;
  double key_fraction;  // key candles / candles with a defined percentile
  size_t n_key;
  size_t n_valid;
  bool in_band;
};

DetectionScore score_detection(const std::vector<DetectionResult>& results,
                               const DetectionConfig& cfg);

struct DetectionRun {
  DetectionParams params;
  DetectionScore score{};
  std::vector<DetectionResult> results;
};

GridSpace detection_space(const DetectionConfig& cfg);

GridOutcome<DetectionRun> optimize_detection(const PriceSeries& series,
                                             const DetectionConfig& cfg,
                                             size_t n_threads = 1,
                                             std::stop_token cancel = {});
