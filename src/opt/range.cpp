#include "opt/range.h"
#include "core/errors.h"
#include "ind/atr.h"
#include "util/math.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <stdexcept>

RangeParams RangeParams::from(const Combination& comb) {
  RangeParams p{
      .atr_period = comb.get_int("atr_period"),
      .atr_multiplier = comb.get("atr_multiplier"),
  };
  p.validate();
  return p;
}

void RangeParams::validate() const {
  if (atr_period < 1)
    throw std::invalid_argument(std::format(
        "[range] atr_period must be positive, got {}", atr_period));
  if (!(atr_multiplier > 0))
    throw std::invalid_argument(std::format(
        "[range] atr_multiplier must be positive, got {}", atr_multiplier));
}

RangeResult make_range(size_t idx,
                       Timestamp timestamp,
                       double reference_price,
                       double atr_value,
                       double atr_multiplier) {
  auto margin = atr_value * atr_multiplier;
  return {
      idx,
      idx,
      timestamp,
      reference_price,
      reference_price + margin,
      reference_price - margin,
      atr_value,
  };
}

std::vector<RangeResult> compute_ranges(const PriceSeries& series,
                                        const std::vector<size_t>& key_candles,
                                        const RangeParams& params) {
  params.validate();
  ATR atr{series, params.atr_period};

  std::vector<RangeResult> out;
  out.reserve(key_candles.size());

  size_t skipped = 0;
  for (auto idx : key_candles) {
    auto atr_value = atr.at(idx);
    if (!atr_value) {
      skipped++;
      continue;
    }
    out.push_back(make_range(idx, series.time(idx), series.close(idx),
                             *atr_value, params.atr_multiplier));
  }

  if (skipped > 0)
    spdlog::debug("[range] atr({}) undefined for {} of {} key candles",
                  params.atr_period, skipped, key_candles.size());
  return out;
}

std::optional<double> range_coverage(const PriceSeries& series,
                                     const RangeResult& range,
                                     size_t horizon) {
  auto end = std::min(series.size(), range.idx + 1 + horizon);
  if (range.idx + 1 >= end)
    return std::nullopt;

  size_t inside = 0;
  for (size_t j = range.idx + 1; j < end; ++j)
    if (range.contains(series.close(j)))
      inside++;

  return static_cast<double>(inside) / (end - range.idx - 1);
}

RangeScore score_ranges(const PriceSeries& series,
                        const std::vector<RangeResult>& ranges,
                        const RangeConfig& cfg) {
  double total = 0.0;
  size_t measured = 0;
  for (const auto& r : ranges) {
    auto coverage = range_coverage(series, r, cfg.coverage_horizon);
    if (!coverage)
      continue;
    total += *coverage;
    measured++;
  }

  if (measured == 0)
    throw InsufficientWindowError{std::format(
        "[range] none of {} ranges has candles to measure coverage",
        ranges.size())};

  auto avg = total / measured;
  return {
      closeness_score(avg, cfg.target_coverage),
      avg,
      ranges.size(),
      measured,
      in_band(avg, cfg.band_lo, cfg.band_hi),
  };
}

GridSpace range_space(const RangeConfig& cfg) {
  std::vector<double> periods(cfg.atr_periods.begin(), cfg.atr_periods.end());
  return GridSpace{
      {
          {"atr_period", std::move(periods)},
          {"atr_multiplier", cfg.atr_multipliers},
      },
      cfg.max_combinations ? std::optional{cfg.max_combinations}
                           : std::nullopt,
  };
}

GridOutcome<RangeRun> optimize_range(const PriceSeries& series,
                                     const std::vector<size_t>& key_candles,
                                     const RangeConfig& cfg,
                                     size_t n_threads,
                                     std::stop_token cancel) {
  GridSearch<RangeRun> search{"range", range_space(cfg), n_threads};

  auto outcome = search.run(
      [&](const Combination& comb) {
        RangeRun run;
        run.params = RangeParams::from(comb);
        run.results = compute_ranges(series, key_candles, run.params);
        run.score = score_ranges(series, run.results, cfg);
        return Evaluation<RangeRun>{run.score.score, std::move(run)};
      },
      std::move(cancel));

  const auto& s = outcome.payload.score;
  spdlog::info("[range] {} ranges from {} key candles, coverage {:.2f}%{}",
               s.n_ranges, key_candles.size(), s.avg_coverage * 100,
               s.in_band ? "" : ", outside target band");
  return outcome;
}
