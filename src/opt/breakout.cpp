#include "opt/breakout.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <stdexcept>

BreakoutParams BreakoutParams::from(const Combination& comb) {
  BreakoutParams p{
      .breakout_threshold_percentage = comb.get("breakout_threshold_percentage"),
      .max_candles_to_return = comb.get_int("max_candles_to_return"),
  };
  p.validate();
  return p;
}

void BreakoutParams::validate() const {
  if (!(breakout_threshold_percentage > 0))
    throw std::invalid_argument(
        std::format("[breakout] threshold must be positive, got {}",
                    breakout_threshold_percentage));
  if (max_candles_to_return < 1)
    throw std::invalid_argument(
        std::format("[breakout] max_candles_to_return must be positive, got {}",
                    max_candles_to_return));
}

std::string_view to_string(Direction d) {
  switch (d) {
    case Direction::Bullish:
      return "bullish";
    case Direction::Bearish:
      return "bearish";
    default:
      return "none";
  }
}

Direction direction_from_string(std::string_view s) {
  if (s == "bullish")
    return Direction::Bullish;
  if (s == "bearish")
    return Direction::Bearish;
  return Direction::None;
}

BreakoutResult evaluate_breakout(const PriceSeries& series,
                                 const RangeResult& range,
                                 size_t range_idx,
                                 const BreakoutParams& params) {
  auto k = params.breakout_threshold_percentage / 100.0;
  auto upper = range.upper_limit * (1 + k);
  auto lower = range.lower_limit * (1 - k);

  auto end = std::min(series.size(),
                      range.idx + 1 + static_cast<size_t>(
                                          params.max_candles_to_return));

  for (size_t j = range.idx + 1; j < end; ++j) {
    auto close = series.close(j);

    // A non-positive limit has no percentage to break out by.
    if (range.upper_limit > 0 && close > upper)
      return {
          range_idx,
          series.time(j),
          Direction::Bullish,
          (close - range.upper_limit) / range.upper_limit * 100,
          true,
          j,
          j - range.idx,
      };

    if (range.lower_limit > 0 && close < lower)
      return {
          range_idx,
          series.time(j),
          Direction::Bearish,
          (close - range.lower_limit) / range.lower_limit * 100,
          true,
          j,
          j - range.idx,
      };
  }

  return {range_idx, range.timestamp, Direction::None, 0.0, false};
}

std::vector<BreakoutResult> evaluate_breakouts(
    const PriceSeries& series,
    const std::vector<RangeResult>& ranges,
    const BreakoutParams& params) {
  params.validate();

  std::vector<BreakoutResult> out;
  out.reserve(ranges.size());
  for (size_t i = 0; i < ranges.size(); ++i)
    out.push_back(evaluate_breakout(series, ranges[i], i, params));
  return out;
}

ProfitabilityRule continuation_rule(size_t horizon) {
  return [horizon](const PriceSeries& series, const BreakoutResult& b) {
    if (!b.is_valid || !b.breakout_idx || series.empty())
      return false;

    auto entry = series.close(*b.breakout_idx);
    auto exit_idx = std::min(*b.breakout_idx + horizon, series.size() - 1);
    auto exit = series.close(exit_idx);

    return b.direction == Direction::Bullish ? exit > entry : exit < entry;
  };
}

BreakoutScoring BreakoutScoring::from(const BreakoutConfig& cfg) {
  return {cfg.valid_weight, cfg.profit_weight,
          continuation_rule(cfg.profit_horizon)};
}

BreakoutScore score_breakouts(const PriceSeries& series,
                              const std::vector<BreakoutResult>& breakouts,
                              const BreakoutScoring& scoring) {
  if (breakouts.empty())
    throw InsufficientWindowError{"[breakout] no ranges to evaluate"};

  size_t n_valid = 0, n_profitable = 0;
  for (const auto& b : breakouts) {
    if (!b.is_valid)
      continue;
    n_valid++;
    if (scoring.profitable && scoring.profitable(series, b))
      n_profitable++;
  }

  auto valid_ratio = static_cast<double>(n_valid) / breakouts.size();
  auto profit_ratio =
      n_valid > 0 ? static_cast<double>(n_profitable) / n_valid : 0.0;

  return {
      scoring.valid_weight * valid_ratio + scoring.profit_weight * profit_ratio,
      valid_ratio,
      profit_ratio,
      breakouts.size(),
      n_valid,
      n_profitable,
  };
}

GridSpace breakout_space(const BreakoutConfig& cfg) {
  std::vector<double> max_candles(cfg.max_candles_to_return.begin(),
                                  cfg.max_candles_to_return.end());
  return GridSpace{
      {
          {"breakout_threshold_percentage", cfg.breakout_thresholds},
          {"max_candles_to_return", std::move(max_candles)},
      },
      cfg.max_combinations ? std::optional{cfg.max_combinations}
                           : std::nullopt,
  };
}

GridOutcome<BreakoutRun> optimize_breakout(
    const PriceSeries& series,
    const std::vector<RangeResult>& ranges,
    const BreakoutConfig& cfg,
    const BreakoutScoring& scoring,
    size_t n_threads,
    std::stop_token cancel) {
  GridSearch<BreakoutRun> search{"breakout", breakout_space(cfg), n_threads};

  auto outcome = search.run(
      [&](const Combination& comb) {
        BreakoutRun run;
        run.params = BreakoutParams::from(comb);
        run.results = evaluate_breakouts(series, ranges, run.params);
        run.score = score_breakouts(series, run.results, scoring);
        return Evaluation<BreakoutRun>{run.score.score, std::move(run)};
      },
      std::move(cancel));

  const auto& s = outcome.payload.score;
  spdlog::info("[breakout] {} valid of {} ({:.2f}%), {} profitable", s.n_valid,
               s.n_total, s.valid_ratio * 100, s.n_profitable);
  return outcome;
}
