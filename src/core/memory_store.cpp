#include "core/memory_store.h"
#include "core/errors.h"
#include "core/serialization.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <format>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

template <typename Row>
bool exists(const std::vector<Row>& table, RowId id) {
  return id >= 1 && static_cast<size_t>(id) <= table.size();
}

template <typename Row>
std::optional<Row> find(const std::vector<Row>& table, RowId id) {
  if (!exists(table, id))
    return std::nullopt;
  return table[id - 1];
}

template <typename Row, typename Pred>
std::vector<Row> select(const std::vector<Row>& table, Pred pred) {
  std::vector<Row> out;
  for (const auto& row : table)
    if (pred(row))
      out.push_back(row);
  return out;
}

template <typename Row>
RowId next_id(const std::vector<Row>& table) {
  return static_cast<RowId>(table.size()) + 1;
}

void check_sizes(const char* table, size_t n_ids, size_t n_results) {
  if (n_ids != n_results)
    throw std::invalid_argument(
        std::format("[store] {}: {} upstream ids for {} results", table, n_ids,
                    n_results));
}

}  // namespace

MemoryStore::MemoryStore(StoreTables&& t) : tables{std::move(t)} {}

MemoryStore MemoryStore::load(const std::string& path) {
  if (!fs::exists(path)) {
    spdlog::info("[store] {} not found, starting empty", path);
    return MemoryStore{};
  }

  auto t = read_store(path);
  spdlog::info("[store] loaded {}: {} detection, {} range, {} breakout "
               "param sets",
               path, t.detection_params.size(), t.range_params.size(),
               t.breakout_params.size());
  return MemoryStore{std::move(t)};
}

void MemoryStore::save(const std::string& path) const {
  write_store(path, snapshot());
  spdlog::info("[store] saved {}", path);
}

StoreTables MemoryStore::snapshot() const {
  std::lock_guard lk{mtx};
  return tables;
}

RowId MemoryStore::insert_detection_params(const std::string& symbol,
                                           const DetectionParams& params,
                                           double score) {
  std::lock_guard lk{mtx};
  auto id = next_id(tables.detection_params);
  tables.detection_params.push_back(
      {id, symbol, params, score, now_utc_string()});
  return id;
}

std::vector<RowId> MemoryStore::insert_detection_data(
    RowId param_id,
    const std::vector<DetectionResult>& results) {
  std::lock_guard lk{mtx};
  if (!exists(tables.detection_params, param_id))
    throw LineageViolationError{"detection_params", param_id};
  const auto& owner = tables.detection_params[param_id - 1];

  std::vector<RowId> ids;
  ids.reserve(results.size());
  for (const auto& r : results) {
    auto id = next_id(tables.detection_data);
    tables.detection_data.push_back({id, param_id, owner.symbol, r});
    ids.push_back(id);
  }
  return ids;
}

RowId MemoryStore::insert_range_params(RowId detection_params_id,
                                       const RangeParams& params,
                                       double score) {
  std::lock_guard lk{mtx};
  if (!exists(tables.detection_params, detection_params_id))
    throw LineageViolationError{"detection_params", detection_params_id};
  const auto& upstream = tables.detection_params[detection_params_id - 1];

  auto id = next_id(tables.range_params);
  tables.range_params.push_back({id, detection_params_id, upstream.symbol,
                                 params, score, now_utc_string()});
  return id;
}

std::vector<RowId> MemoryStore::insert_range_data(
    RowId param_id,
    const std::vector<RowId>& detection_ids,
    const std::vector<RangeResult>& results) {
  check_sizes("range_data", detection_ids.size(), results.size());

  std::lock_guard lk{mtx};
  if (!exists(tables.range_params, param_id))
    throw LineageViolationError{"range_params", param_id};
  const auto& owner = tables.range_params[param_id - 1];

  for (size_t i = 0; i < detection_ids.size(); ++i) {
    auto detection_id = detection_ids[i];
    if (!exists(tables.detection_data, detection_id))
      throw LineageViolationError{"detection_data", detection_id};

    const auto& upstream = tables.detection_data[detection_id - 1];
    if (upstream.param_id != owner.detection_params_id)
      throw LineageViolationError{
          "detection_data", detection_id,
          std::format("belongs to detection params {}, range params {} was "
                      "built on {}",
                      upstream.param_id, param_id,
                      owner.detection_params_id)};
    if (!upstream.result.is_key_candle)
      throw LineageViolationError{"detection_data", detection_id,
                                  "is not a key candle"};
    if (upstream.result.idx != results[i].idx)
      throw LineageViolationError{
          "detection_data", detection_id,
          std::format("is candle {}, range is anchored at {}",
                      upstream.result.idx, results[i].idx)};
  }

  std::vector<RowId> ids;
  ids.reserve(results.size());
  for (size_t i = 0; i < results.size(); ++i) {
    auto id = next_id(tables.range_data);
    tables.range_data.push_back(
        {id, param_id, detection_ids[i], owner.symbol, results[i]});
    ids.push_back(id);
  }
  return ids;
}

RowId MemoryStore::insert_breakout_params(RowId range_params_id,
                                          const BreakoutParams& params,
                                          double score) {
  std::lock_guard lk{mtx};
  if (!exists(tables.range_params, range_params_id))
    throw LineageViolationError{"range_params", range_params_id};
  const auto& upstream = tables.range_params[range_params_id - 1];

  auto id = next_id(tables.breakout_params);
  tables.breakout_params.push_back({id, range_params_id, upstream.symbol,
                                    params, score, now_utc_string()});
  return id;
}

std::vector<RowId> MemoryStore::insert_breakout_data(
    RowId param_id,
    const std::vector<RowId>& range_ids,
    const std::vector<BreakoutResult>& results) {
  check_sizes("breakout_data", range_ids.size(), results.size());

  std::lock_guard lk{mtx};
  if (!exists(tables.breakout_params, param_id))
    throw LineageViolationError{"breakout_params", param_id};
  const auto& owner = tables.breakout_params[param_id - 1];

  for (auto range_id : range_ids) {
    if (!exists(tables.range_data, range_id))
      throw LineageViolationError{"range_data", range_id};

    const auto& upstream = tables.range_data[range_id - 1];
    if (upstream.param_id != owner.range_params_id)
      throw LineageViolationError{
          "range_data", range_id,
          std::format("belongs to range params {}, breakout params {} was "
                      "built on {}",
                      upstream.param_id, param_id, owner.range_params_id)};
  }

  std::vector<RowId> ids;
  ids.reserve(results.size());
  for (size_t i = 0; i < results.size(); ++i) {
    auto id = next_id(tables.breakout_data);
    tables.breakout_data.push_back(
        {id, param_id, range_ids[i], owner.symbol, results[i]});
    ids.push_back(id);
  }
  return ids;
}

std::optional<DetectionParamsRow> MemoryStore::detection_params(
    RowId id) const {
  std::lock_guard lk{mtx};
  return find(tables.detection_params, id);
}

std::optional<RangeParamsRow> MemoryStore::range_params(RowId id) const {
  std::lock_guard lk{mtx};
  return find(tables.range_params, id);
}

std::optional<BreakoutParamsRow> MemoryStore::breakout_params(RowId id) const {
  std::lock_guard lk{mtx};
  return find(tables.breakout_params, id);
}

std::optional<DetectionDataRow> MemoryStore::detection_data(RowId id) const {
  std::lock_guard lk{mtx};
  return find(tables.detection_data, id);
}

std::optional<RangeDataRow> MemoryStore::range_data(RowId id) const {
  std::lock_guard lk{mtx};
  return find(tables.range_data, id);
}

std::optional<BreakoutDataRow> MemoryStore::breakout_data(RowId id) const {
  std::lock_guard lk{mtx};
  return find(tables.breakout_data, id);
}

std::vector<DetectionDataRow> MemoryStore::detection_data_by_param(
    RowId param_id) const {
  std::lock_guard lk{mtx};
  return select(tables.detection_data,
                [&](const auto& row) { return row.param_id == param_id; });
}

std::vector<RangeDataRow> MemoryStore::range_data_by_param(
    RowId param_id) const {
  std::lock_guard lk{mtx};
  return select(tables.range_data,
                [&](const auto& row) { return row.param_id == param_id; });
}

std::vector<RangeDataRow> MemoryStore::range_data_by_detection(
    RowId detection_id) const {
  std::lock_guard lk{mtx};
  return select(tables.range_data, [&](const auto& row) {
    return row.detection_id == detection_id;
  });
}

std::vector<BreakoutDataRow> MemoryStore::breakout_data_by_param(
    RowId param_id) const {
  std::lock_guard lk{mtx};
  return select(tables.breakout_data,
                [&](const auto& row) { return row.param_id == param_id; });
}

std::vector<BreakoutDataRow> MemoryStore::breakout_data_by_range(
    RowId range_id) const {
  std::lock_guard lk{mtx};
  return select(tables.breakout_data,
                [&](const auto& row) { return row.range_id == range_id; });
}
