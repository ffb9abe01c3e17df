#pragma once

#include "opt/breakout.h"
#include "opt/detection.h"
#include "opt/range.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using RowId = std::int64_t;

// Params rows of one run are chained: range params name the detection
// params they were optimized against, breakout params the range params.
// Data rows carry the symbol of their params row.

struct DetectionParamsRow {
  RowId id = 0;
  std::string symbol;
  DetectionParams params;
  double performance_score = 0.0;
  std::string created_at;
};

struct DetectionDataRow {
  RowId id = 0;
  RowId param_id = 0;
  std::string symbol;
  DetectionResult result{};
};

struct RangeParamsRow {
  RowId id = 0;
  RowId detection_params_id = 0;
  std::string symbol;
  RangeParams params;
  double performance_score = 0.0;
  std::string created_at;
};

struct RangeDataRow {
  RowId id = 0;
  RowId param_id = 0;
  RowId detection_id = 0;
  std::string symbol;
  RangeResult result{};
};

struct BreakoutParamsRow {
  RowId id = 0;
  RowId range_params_id = 0;
  std::string symbol;
  BreakoutParams params;
  double performance_score = 0.0;
  std::string created_at;
};

struct BreakoutDataRow {
  RowId id = 0;
  RowId param_id = 0;
  RowId range_id = 0;
  std::string symbol;
  BreakoutResult result{};
};

/**
 * @brief Append-only store of winning parameter sets and their results.
 *
 * Every insert returns a generated id. Data rows reference their owning
 * params row and, for range and breakout data, the upstream result row.
 * Lineage stays within one run: a range row may only reference a key
 * candle row owned by the detection params its range params were built on,
 * and a breakout row only a range row owned by its breakout params' range
 * params. Any other reference throws LineageViolationError. Rows are never
 * updated.
 */
class ResultStore {
 public:
  virtual ~ResultStore() = default;

  virtual RowId insert_detection_params(const std::string& symbol,
                                        const DetectionParams& params,
                                        double score) = 0;
  virtual std::vector<RowId> insert_detection_data(
      RowId param_id,
      const std::vector<DetectionResult>& results) = 0;

  virtual RowId insert_range_params(RowId detection_params_id,
                                    const RangeParams& params,
                                    double score) = 0;
  // detection_ids[i] is the upstream row of results[i]
  virtual std::vector<RowId> insert_range_data(
      RowId param_id,
      const std::vector<RowId>& detection_ids,
      const std::vector<RangeResult>& results) = 0;

  virtual RowId insert_breakout_params(RowId range_params_id,
                                       const BreakoutParams& params,
                                       double score) = 0;
  virtual std::vector<RowId> insert_breakout_data(
      RowId param_id,
      const std::vector<RowId>& range_ids,
      const std::vector<BreakoutResult>& results) = 0;

  virtual std::optional<DetectionParamsRow> detection_params(RowId id) const = 0;
  virtual std::optional<RangeParamsRow> range_params(RowId id) const = 0;
  virtual std::optional<BreakoutParamsRow> breakout_params(RowId id) const = 0;

  virtual std::optional<DetectionDataRow> detection_data(RowId id) const = 0;
  virtual std::optional<RangeDataRow> range_data(RowId id) const = 0;
  virtual std::optional<BreakoutDataRow> breakout_data(RowId id) const = 0;

  virtual std::vector<DetectionDataRow> detection_data_by_param(
      RowId param_id) const = 0;
  virtual std::vector<RangeDataRow> range_data_by_param(
      RowId param_id) const = 0;
  virtual std::vector<RangeDataRow> range_data_by_detection(
      RowId detection_id) const = 0;
  virtual std::vector<BreakoutDataRow> breakout_data_by_param(
      RowId param_id) const = 0;
  virtual std::vector<BreakoutDataRow> breakout_data_by_range(
      RowId range_id) const = 0;

  RowId insert_detection_data(RowId param_id, const DetectionResult& result) {
    return insert_detection_data(param_id, std::vector{result}).front();
  }
  RowId insert_range_data(RowId param_id,
                          RowId detection_id,
                          const RangeResult& result) {
    return insert_range_data(param_id, std::vector{detection_id},
                             std::vector{result})
        .front();
  }
  RowId insert_breakout_data(RowId param_id,
                             RowId range_id,
                             const BreakoutResult& result) {
    return insert_breakout_data(param_id, std::vector{range_id},
                                std::vector{result})
        .front();
  }
};
