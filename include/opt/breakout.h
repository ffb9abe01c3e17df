#pragma once

#include "ind/price_series.h"
#include "opt/grid_search.h"
#include "opt/range.h"
#include "util/config.h"

#include <functional>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

struct BreakoutParams {
  double breakout_threshold_percentage = 0.5;
  int max_candles_to_return = 3;

  static BreakoutParams from(const Combination& comb);
  void validate() const;
};

enum class Direction {
  None,
  Bullish,
  Bearish,
};

std::string_view to_string(Direction d);
Direction direction_from_string(std::string_view s);

struct BreakoutResult {
  size_t range_idx;  // evaluated RangeResult
  Timestamp timestamp;  // breakout candle, or the key candle when none
  Direction direction;
  double breakout_percentage;  // signed, from the nearer limit
  bool is_valid;
  std::optional<size_t> breakout_idx;
  size_t candles_to_breakout = 0;
};

// Scans up to max_candles_to_return candles after the key candle for the
// first close beyond either threshold. A side whose limit is <= 0 (an ATR
// band wider than the price) never breaks.
BreakoutResult evaluate_breakout(const PriceSeries& series,
                                 const RangeResult& range,
                                 size_t range_idx,
                                 const BreakoutParams& params);

std::vector<BreakoutResult> evaluate_breakouts(
    const PriceSeries& series,
    const std::vector<RangeResult>& ranges,
    const BreakoutParams& params);

// Decides whether a valid breakout went on to pay off.
using ProfitabilityRule =
    std::function<bool(const PriceSeries&, const BreakoutResult&)>;

// Close `horizon` candles after the breakout candle, clamped to the last
// candle, lies beyond the breakout close in the breakout direction.
ProfitabilityRule continuation_rule(size_t horizon);

struct BreakoutScore {
  double score;
  double valid_ratio;   // valid / total
  double profit_ratio;  // profitable / valid
  size_t n_total;
  size_t n_valid;
  size_t n_profitable;
};

struct BreakoutScoring {
  double valid_weight = 0.4;
  double profit_weight = 0.6;
  ProfitabilityRule profitable;

  static BreakoutScoring from(const BreakoutConfig& cfg);
};

BreakoutScore score_breakouts(const PriceSeries& series,
                              const std::vector<BreakoutResult>& breakouts,
                              const BreakoutScoring& scoring);

struct BreakoutRun {
  BreakoutParams params;
  BreakoutScore score{};
  std::vector<BreakoutResult> results;
};

GridSpace breakout_space(const BreakoutConfig& cfg);

GridOutcome<BreakoutRun> optimize_breakout(
    const PriceSeries& series,
    const std::vector<RangeResult>& ranges,
    const BreakoutConfig& cfg,
    const BreakoutScoring& scoring,
    size_t n_threads = 1,
    std::stop_token cancel = {});
