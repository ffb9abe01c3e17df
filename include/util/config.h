#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct DetectionConfig {
  static constexpr const char* name = "detection_config";
  static constexpr bool debug = true;

  std::vector<double> volume_percentile_thresholds = {70, 75, 80, 85, 90, 95};
  std::vector<double> body_percentage_thresholds = {20, 26, 32, 38, 44, 50};
  std::vector<int> lookback_candles = {20, 30, 50, 70, 100};

  // Fraction of candles flagged as key
  double target_fraction = 0.10;
  double band_lo = 0.05;
  double band_hi = 0.15;

  size_t max_combinations = 50;  // 0 = no cap
};

struct RangeConfig {
  static constexpr const char* name = "range_config";
  static constexpr bool debug = true;

  std::vector<int> atr_periods = {5, 7, 10, 14, 21, 28};
  std::vector<double> atr_multipliers = {0.5,  0.78, 1.06, 1.33, 1.61,
                                         1.89, 2.17, 2.44, 2.72, 3.0};

  // Candles after the key candle checked for closes inside the range
  size_t coverage_horizon = 10;

  double target_coverage = 0.70;
  double band_lo = 0.60;
  double band_hi = 0.80;

  size_t max_combinations = 50;
};

struct BreakoutConfig {
  static constexpr const char* name = "breakout_config";
  static constexpr bool debug = true;

  std::vector<double> breakout_thresholds = {0.1,  0.31, 0.52, 0.73, 0.94,
                                             1.16, 1.37, 1.58, 1.79, 2.0};
  std::vector<int> max_candles_to_return = {1, 2, 3, 5, 7};

  double valid_weight = 0.4;
  double profit_weight = 0.6;

  // Default profitability rule: close this many candles after the breakout
  size_t profit_horizon = 5;

  size_t max_combinations = 50;
};

struct RunConfig {
  static constexpr const char* name = "run_config";
  static constexpr bool debug = true;

  std::string symbol = "BTCUSDC";
  std::string store_path = "data/store.bin";
  std::string summary_path = "data/summary.json";
  std::string signals_path = "data/signals.json";
};

struct Config {
  bool debug_en = false;
  size_t n_concurrency = 1;

  std::string bars_path;
  std::string config_dir = "config";

  RunConfig run_config;
  DetectionConfig detection_config;
  RangeConfig range_config;
  BreakoutConfig breakout_config;

  void read_args(int argc, char* argv[]);
  void update();
};
