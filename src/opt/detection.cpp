#include "opt/detection.h"
#include "core/errors.h"
#include "util/math.h"

#include <spdlog/spdlog.h>
#include <format>
#include <stdexcept>

DetectionParams DetectionParams::from(const Combination& comb) {
  DetectionParams p{
      .volume_percentile_threshold = comb.get("volume_percentile_threshold"),
      .body_percentage_threshold = comb.get("body_percentage_threshold"),
      .lookback_candles = comb.get_int("lookback_candles"),
  };
  p.validate();
  return p;
}

void DetectionParams::validate() const {
  if (volume_percentile_threshold < 0 || volume_percentile_threshold > 100)
    throw std::invalid_argument(
        std::format("[detection] volume_percentile_threshold {} not in 0-100",
                    volume_percentile_threshold));
  if (body_percentage_threshold < 0 || body_percentage_threshold > 100)
    throw std::invalid_argument(
        std::format("[detection] body_percentage_threshold {} not in 0-100",
                    body_percentage_threshold));
  if (lookback_candles < 1)
    throw std::invalid_argument(std::format(
        "[detection] lookback_candles must be positive, got {}",
        lookback_candles));
}

double body_percentage(const Candle& c) {
  auto range = c.range();
  if (range == 0.0)
    return 0.0;
  return c.body() / range * 100.0;
}

std::optional<double> volume_percentile(const PriceSeries& series,
                                        size_t idx,
                                        int lookback) {
  auto window = static_cast<size_t>(lookback);
  if (idx + 1 < window || idx >= series.size())
    return std::nullopt;

  auto current = series.volume(idx);
  size_t below_or_equal = 0;
  for (size_t j = idx + 1 - window; j <= idx; ++j)
    if (series.volume(j) <= current)
      below_or_equal++;

  return static_cast<double>(below_or_equal) / window * 100.0;
}

std::vector<DetectionResult> detect_key_candles(const PriceSeries& series,
                                                const DetectionParams& params) {
  params.validate();

  std::vector<DetectionResult> out;
  out.reserve(series.size());

  for (size_t i = 0; i < series.size(); ++i) {
    auto body_pct = body_percentage(series[i]);
    auto vol_pct = volume_percentile(series, i, params.lookback_candles);

    bool is_key = vol_pct && *vol_pct >= params.volume_percentile_threshold &&
                  body_pct <= params.body_percentage_threshold;

    out.push_back({i, series.time(i), is_key, series.volume(i), body_pct,
                   vol_pct});
  }
  return out;
}

std::vector<size_t> key_candle_indices(
    const std::vector<DetectionResult>& results) {
  std::vector<size_t> out;
  for (const auto& r : results)
    if (r.is_key_candle)
      out.push_back(r.idx);
  return out;
}

DetectionScore score_detection(const std::vector<DetectionResult>& results,
                               const DetectionConfig& cfg) {
  size_t n_key = 0, n_valid = 0;
  for (const auto& r : results) {
    if (!r.volume_percentile)
      continue;
    n_valid++;
    if (r.is_key_candle)
      n_key++;
  }

  if (n_valid == 0)
    throw InsufficientWindowError{std::format(
        "[detection] no candle has a full lookback window ({} candles)",
        results.size())};

  auto fraction = static_cast<double>(n_key) / n_valid;
  return {
      closeness_score(fraction, cfg.target_fraction),
      fraction,
      n_key,
      n_valid,
      in_band(fraction, cfg.band_lo, cfg.band_hi),
  };
}

GridSpace detection_space(const DetectionConfig& cfg) {
  std::vector<double> lookbacks(cfg.lookback_candles.begin(),
                                cfg.lookback_candles.end());
  return GridSpace{
      {
          {"volume_percentile_threshold", cfg.volume_percentile_thresholds},
          {"body_percentage_threshold", cfg.body_percentage_thresholds},
          {"lookback_candles", std::move(lookbacks)},
      },
      cfg.max_combinations ? std::optional{cfg.max_combinations}
                           : std::nullopt,
  };
}

GridOutcome<DetectionRun> optimize_detection(const PriceSeries& series,
                                             const DetectionConfig& cfg,
                                             size_t n_threads,
                                             std::stop_token cancel) {
  GridSearch<DetectionRun> search{"detection", detection_space(cfg),
                                  n_threads};

  auto outcome = search.run(
      [&](const Combination& comb) {
        DetectionRun run;
        run.params = DetectionParams::from(comb);
        run.results = detect_key_candles(series, run.params);
        run.score = score_detection(run.results, cfg);
        return Evaluation<DetectionRun>{run.score.score, std::move(run)};
      },
      std::move(cancel));

  const auto& s = outcome.payload.score;
  spdlog::info("[detection] {} key candles of {} ({:.2f}%){}", s.n_key,
               s.n_valid, s.key_fraction * 100,
               s.in_band ? "" : ", outside target band");
  return outcome;
}
