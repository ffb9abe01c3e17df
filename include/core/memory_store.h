#pragma once

#include "core/result_store.h"

#include <mutex>
#include <string>
#include <vector>

struct StoreTables {
  std::vector<DetectionParamsRow> detection_params;
  std::vector<DetectionDataRow> detection_data;
  std::vector<RangeParamsRow> range_params;
  std::vector<RangeDataRow> range_data;
  std::vector<BreakoutParamsRow> breakout_params;
  std::vector<BreakoutDataRow> breakout_data;
};

// In-memory ResultStore; ids are 1-based positions in each table.
class MemoryStore : public ResultStore {
  StoreTables tables;
  mutable std::mutex mtx;

 public:
  MemoryStore() = default;
  explicit MemoryStore(StoreTables&& tables);

  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  MemoryStore(MemoryStore&& other) noexcept {
    std::lock_guard lk{other.mtx};
    tables = std::move(other.tables);
  }

  // Binary snapshot of all tables.
  static MemoryStore load(const std::string& path);
  void save(const std::string& path) const;

  StoreTables snapshot() const;

  using ResultStore::insert_breakout_data;
  using ResultStore::insert_detection_data;
  using ResultStore::insert_range_data;

  RowId insert_detection_params(const std::string& symbol,
                                const DetectionParams& params,
                                double score) override;
  std::vector<RowId> insert_detection_data(
      RowId param_id,
      const std::vector<DetectionResult>& results) override;

  RowId insert_range_params(RowId detection_params_id,
                            const RangeParams& params,
                            double score) override;
  std::vector<RowId> insert_range_data(
      RowId param_id,
      const std::vector<RowId>& detection_ids,
      const std::vector<RangeResult>& results) override;

  RowId insert_breakout_params(RowId range_params_id,
                               const BreakoutParams& params,
                               double score) override;
  std::vector<RowId> insert_breakout_data(
      RowId param_id,
      const std::vector<RowId>& range_ids,
      const std::vector<BreakoutResult>& results) override;

  std::optional<DetectionParamsRow> detection_params(RowId id) const override;
  std::optional<RangeParamsRow> range_params(RowId id) const override;
  std::optional<BreakoutParamsRow> breakout_params(RowId id) const override;

  std::optional<DetectionDataRow> detection_data(RowId id) const override;
  std::optional<RangeDataRow> range_data(RowId id) const override;
  std::optional<BreakoutDataRow> breakout_data(RowId id) const override;

  std::vector<DetectionDataRow> detection_data_by_param(
      RowId param_id) const override;
  std::vector<RangeDataRow> range_data_by_param(RowId param_id) const override;
  std::vector<RangeDataRow> range_data_by_detection(
      RowId detection_id) const override;
  std::vector<BreakoutDataRow> breakout_data_by_param(
      RowId param_id) const override;
  std::vector<BreakoutDataRow> breakout_data_by_range(
      RowId range_id) const override;
};
