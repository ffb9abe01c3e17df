#pragma once

#include "core/result_store.h"
#include "ind/price_series.h"
#include "opt/breakout.h"
#include "opt/detection.h"
#include "opt/range.h"
#include "opt/signals.h"
#include "util/config.h"

#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

struct StageSummary {
  std::string stage;
  RowId params_id = 0;
  std::map<std::string, double> params;
  double score = 0.0;
  std::string metric_name;
  double metric = 0.0;
  std::optional<bool> in_band;
  size_t n_combinations = 0;
  size_t n_failed = 0;
  size_t n_rows = 0;
};

struct RunSummary {
  std::string symbol;
  std::string started_at;
  std::string finished_at;

  size_t n_candles = 0;
  std::string first_candle;
  std::string last_candle;

  std::vector<StageSummary> stages;

  size_t n_signals = 0;
  size_t n_valid_signals = 0;
};

struct PipelineResult {
  RunSummary summary;

  DetectionRun detection;
  RangeRun range;
  BreakoutRun breakout;

  RowId detection_params_id = 0;
  RowId range_params_id = 0;

  // Store ids, parallel to the result vectors above
  std::vector<RowId> detection_ids;
  std::vector<RowId> range_ids;
  std::vector<RowId> breakout_ids;

  std::vector<Signal> signals;
};

/**
 * @brief Detection -> range -> breakout optimization over one series.
 *
 * Each stage's grid search must select a winner before the next stage
 * starts, since the next stage evaluates against the winner's results. The
 * winner of a stage, with its full result set, is written to the store at
 * the end of that stage and nothing is written for losing combinations. A
 * fatal error halts the run at the failing stage; earlier stages stay
 * persisted.
 */
class Pipeline {
  const PriceSeries& series;
  const Config& cfg;
  ResultStore& store;
  BreakoutScoring scoring;

 public:
  Pipeline(const PriceSeries& series, const Config& cfg, ResultStore& store);

  void set_profitability_rule(ProfitabilityRule rule) {
    scoring.profitable = std::move(rule);
  }

  PipelineResult run(std::stop_token cancel = {});

 private:
  StageSummary persist_detection(const GridOutcome<DetectionRun>& outcome,
                                 PipelineResult& out);
  StageSummary persist_range(const GridOutcome<RangeRun>& outcome,
                             PipelineResult& out);
  StageSummary persist_breakout(const GridOutcome<BreakoutRun>& outcome,
                                PipelineResult& out);
};
