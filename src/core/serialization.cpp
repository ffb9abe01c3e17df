#include "core/serialization.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <sstream>
#include <stdexcept>

#include <cereal/archives/binary.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

namespace fs = std::filesystem;

namespace cereal {
template <class Archive>
void serialize(Archive& ar, DetectionParams& p) {
  ar(p.volume_percentile_threshold, p.body_percentage_threshold,
     p.lookback_candles);
}

template <class Archive>
void serialize(Archive& ar, RangeParams& p) {
  ar(p.atr_period, p.atr_multiplier);
}

template <class Archive>
void serialize(Archive& ar, BreakoutParams& p) {
  ar(p.breakout_threshold_percentage, p.max_candles_to_return);
}

template <class Archive>
void serialize(Archive& ar, DetectionResult& r) {
  ar(r.idx, r.timestamp, r.is_key_candle, r.volume, r.body_percentage,
     r.volume_percentile);
}

template <class Archive>
void serialize(Archive& ar, RangeResult& r) {
  ar(r.idx, r.detection_idx, r.timestamp, r.reference_price, r.upper_limit,
     r.lower_limit, r.atr_value);
}

template <class Archive>
void serialize(Archive& ar, BreakoutResult& r) {
  ar(r.range_idx, r.timestamp, r.direction, r.breakout_percentage, r.is_valid,
     r.breakout_idx, r.candles_to_breakout);
}

template <class Archive>
void serialize(Archive& ar, DetectionParamsRow& r) {
  ar(r.id, r.symbol, r.params, r.performance_score, r.created_at);
}

template <class Archive>
void serialize(Archive& ar, RangeParamsRow& r) {
  ar(r.id, r.detection_params_id, r.symbol, r.params, r.performance_score, r.created_at);
}

template <class Archive>
void serialize(Archive& ar, BreakoutParamsRow& r) {
  ar(r.id, r.range_params_id, r.symbol, r.params, r.performance_score, r.created_at);
}

template <class Archive>
void serialize(Archive& ar, DetectionDataRow& r) {
  ar(r.id, r.param_id, r.symbol, r.result);
}

template <class Archive>
void serialize(Archive& ar, RangeDataRow& r) {
  ar(r.id, r.param_id, r.detection_id, r.symbol, r.result);
}

template <class Archive>
void serialize(Archive& ar, BreakoutDataRow& r) {
  ar(r.id, r.param_id, r.range_id, r.symbol, r.result);
}

template <class Archive>
void serialize(Archive& ar, StoreTables& t) {
  ar(t.detection_params, t.detection_data, t.range_params, t.range_data,
     t.breakout_params, t.breakout_data);
}
}  // namespace cereal

void write_store(const std::string& filename, const StoreTables& tables) {
  if (auto dir = fs::path{filename}.parent_path(); !dir.empty())
    fs::create_directories(dir);

  std::ofstream ofs(filename, std::ios::binary);
  if (!ofs)
    throw std::runtime_error(
        std::format("[store] cannot open {} for writing", filename));
  cereal::BinaryOutputArchive oarchive(ofs);
  oarchive(tables);
}

StoreTables read_store(const std::string& filename) {
  StoreTables tables;
  std::ifstream ifs(filename, std::ios::binary);
  if (!ifs)
    throw std::runtime_error(std::format("[store] cannot open {}", filename));
  cereal::BinaryInputArchive iarchive(ifs);
  iarchive(tables);
  return tables;
}

std::vector<Candle> parse_candles_json(const std::string& str) {
  constexpr auto opts = glz::opts{
      .error_on_unknown_keys = false,
  };

  std::vector<Candle> candles;
  auto ec = glz::read<opts>(candles, str);
  if (ec)
    throw DataIntegrityError{
        0, std::format("[data] candle json error: {}",
                       glz::format_error(ec, str))};
  return candles;
}

std::vector<Candle> read_candles_json(const std::string& filename) {
  std::ifstream ifs(filename);
  if (!ifs)
    throw DataIntegrityError{0,
                             std::format("[data] cannot open {}", filename)};

  std::stringstream buffer;
  buffer << ifs.rdbuf();
  auto candles = parse_candles_json(buffer.str());
  spdlog::info("[data] read {} candles from {}", candles.size(), filename);
  return candles;
}

namespace {

template <typename T>
void write_json(const std::string& filename, const T& t) {
  if (auto dir = fs::path{filename}.parent_path(); !dir.empty())
    fs::create_directories(dir);

  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(t, buffer);
  if (ec)
    throw std::runtime_error(
        std::format("[json] cannot serialize {}", filename));

  std::ofstream ofs(filename);
  if (!ofs)
    throw std::runtime_error(
        std::format("[json] cannot open {} for writing", filename));
  ofs << buffer << '\n';
}

}  // namespace

std::string summary_to_json(const RunSummary& summary) {
  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(summary, buffer);
  if (ec)
    throw std::runtime_error("[json] cannot serialize run summary");
  return buffer;
}

void write_summary_json(const std::string& filename,
                        const RunSummary& summary) {
  write_json(filename, summary);
  spdlog::info("[json] run summary written to {}", filename);
}

void write_signals_json(const std::string& filename,
                        const std::vector<Signal>& signals) {
  write_json(filename, signals);
  spdlog::info("[json] {} signals written to {}", signals.size(), filename);
}
