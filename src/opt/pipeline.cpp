#include "opt/pipeline.h"
#include "core/errors.h"
#include "util/times.h"

#include <spdlog/spdlog.h>

namespace {

template <typename Run>
StageSummary stage_summary(const GridOutcome<Run>& outcome) {
  StageSummary s;
  s.stage = outcome.stage;
  s.params = outcome.winner.to_map();
  s.score = outcome.score;
  s.n_combinations = outcome.total_combinations;
  s.n_failed = outcome.n_failed;
  return s;
}

}  // namespace

Pipeline::Pipeline(const PriceSeries& series,
                   const Config& cfg,
                   ResultStore& store)
    : series{series},
      cfg{cfg},
      store{store},
      scoring{BreakoutScoring::from(cfg.breakout_config)} {}

PipelineResult Pipeline::run(std::stop_token cancel) {
  if (series.empty())
    throw DataIntegrityError{0, "[pipeline] empty price series"};

  Timer timer;
  PipelineResult out;
  auto& summary = out.summary;
  summary.symbol = cfg.run_config.symbol;
  summary.started_at = now_utc_string();
  summary.n_candles = series.size();
  summary.first_candle = timestamp_to_string(series.first_time());
  summary.last_candle = timestamp_to_string(series.last_time());

  spdlog::info("[pipeline] {}: {} candles, {} .. {}", summary.symbol,
               summary.n_candles, summary.first_candle, summary.last_candle);

  auto n_threads = cfg.n_concurrency;

  auto detection =
      optimize_detection(series, cfg.detection_config, n_threads, cancel);
  summary.stages.push_back(persist_detection(detection, out));

  auto key_candles = key_candle_indices(out.detection.results);
  auto range = optimize_range(series, key_candles, cfg.range_config,
                              n_threads, cancel);
  summary.stages.push_back(persist_range(range, out));

  auto breakout = optimize_breakout(series, out.range.results,
                                    cfg.breakout_config, scoring, n_threads,
                                    cancel);
  summary.stages.push_back(persist_breakout(breakout, out));

  out.signals = collect_signals(series, out.range.results,
                                out.breakout.results);
  summary.n_signals = out.signals.size();
  for (const auto& s : out.signals)
    if (s.is_valid)
      summary.n_valid_signals++;

  summary.finished_at = now_utc_string();
  spdlog::info("[pipeline] completed in {:.1f} ms, {} signals ({} valid)",
               timer.diff_ms(), summary.n_signals, summary.n_valid_signals);
  return out;
}

StageSummary Pipeline::persist_detection(
    const GridOutcome<DetectionRun>& outcome,
    PipelineResult& out) {
  out.detection = outcome.payload;
  const auto& run = out.detection;

  auto s = stage_summary(outcome);
  s.params_id = store.insert_detection_params(cfg.run_config.symbol,
                                              run.params, outcome.score);
  out.detection_params_id = s.params_id;
  out.detection_ids = store.insert_detection_data(s.params_id, run.results);

  s.metric_name = "key_fraction";
  s.metric = run.score.key_fraction;
  s.in_band = run.score.in_band;
  s.n_rows = out.detection_ids.size();

  spdlog::info("[store] detection params {} with {} rows", s.params_id,
               s.n_rows);
  return s;
}

StageSummary Pipeline::persist_range(const GridOutcome<RangeRun>& outcome,
                                     PipelineResult& out) {
  out.range = outcome.payload;
  const auto& run = out.range;

  std::vector<RowId> detection_ids;
  detection_ids.reserve(run.results.size());
  for (const auto& r : run.results) {
    if (r.detection_idx >= out.detection_ids.size())
      throw LineageViolationError{"detection_data",
                                  static_cast<RowId>(r.detection_idx)};
    detection_ids.push_back(out.detection_ids[r.detection_idx]);
  }

  auto s = stage_summary(outcome);
  s.params_id = store.insert_range_params(out.detection_params_id, run.params,
                                          outcome.score);
  out.range_params_id = s.params_id;
  out.range_ids = store.insert_range_data(s.params_id, detection_ids,
                                          run.results);

  s.metric_name = "avg_coverage";
  s.metric = run.score.avg_coverage;
  s.in_band = run.score.in_band;
  s.n_rows = out.range_ids.size();

  spdlog::info("[store] range params {} with {} rows", s.params_id, s.n_rows);
  return s;
}

StageSummary Pipeline::persist_breakout(
    const GridOutcome<BreakoutRun>& outcome,
    PipelineResult& out) {
  out.breakout = outcome.payload;
  const auto& run = out.breakout;

  std::vector<RowId> range_ids;
  range_ids.reserve(run.results.size());
  for (const auto& b : run.results) {
    if (b.range_idx >= out.range_ids.size())
      throw LineageViolationError{"range_data",
                                  static_cast<RowId>(b.range_idx)};
    range_ids.push_back(out.range_ids[b.range_idx]);
  }

  auto s = stage_summary(outcome);
  s.params_id = store.insert_breakout_params(out.range_params_id, run.params,
                                             outcome.score);
  out.breakout_ids =
      store.insert_breakout_data(s.params_id, range_ids, run.results);

  s.metric_name = "valid_ratio";
  s.metric = run.score.valid_ratio;
  s.n_rows = out.breakout_ids.size();

  spdlog::info("[store] breakout params {} with {} rows", s.params_id,
               s.n_rows);
  return s;
}
