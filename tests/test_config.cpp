#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "opt/breakout.h"
#include "opt/detection.h"
#include "opt/range.h"
#include "util/config.h"

namespace fs = std::filesystem;

TEST(Config, Defaults) {
  Config cfg;
  EXPECT_EQ(cfg.n_concurrency, 1u);
  EXPECT_EQ(cfg.config_dir, "config");
  EXPECT_DOUBLE_EQ(cfg.detection_config.target_fraction, 0.10);
  EXPECT_DOUBLE_EQ(cfg.range_config.target_coverage, 0.70);
  EXPECT_EQ(cfg.range_config.coverage_horizon, 10u);
  EXPECT_DOUBLE_EQ(cfg.breakout_config.valid_weight, 0.4);
  EXPECT_DOUBLE_EQ(cfg.breakout_config.profit_weight, 0.6);
  EXPECT_EQ(cfg.breakout_config.profit_horizon, 5u);
}

TEST(Config, DefaultSpacesAreCapped) {
  Config cfg;

  auto detection = detection_space(cfg.detection_config);
  EXPECT_EQ(detection.total(), 180u);
  EXPECT_EQ(detection.retained(), 50u);

  auto range = range_space(cfg.range_config);
  EXPECT_EQ(range.total(), 60u);
  EXPECT_EQ(range.retained(), 50u);

  auto breakout = breakout_space(cfg.breakout_config);
  EXPECT_EQ(breakout.total(), 50u);
  EXPECT_EQ(breakout.retained(), 50u);

  cfg.detection_config.max_combinations = 0;
  EXPECT_EQ(detection_space(cfg.detection_config).retained(), 180u);
}

TEST(Config, ReadsStageFilesFromConfigDir) {
  auto dir = fs::temp_directory_path() / "keyrange_config_test";
  fs::remove_all(dir);
  fs::create_directories(dir);

  std::ofstream{dir / "detection.json"}
      << R"({"volume_percentile_thresholds":[90,95],"max_combinations":0})";
  std::ofstream{dir / "run.json"} << R"({"symbol":"ETHUSDC"})";

  Config cfg;
  cfg.config_dir = dir.string();
  cfg.update();

  EXPECT_EQ(cfg.run_config.symbol, "ETHUSDC");
  EXPECT_EQ(cfg.run_config.store_path, "data/store.bin");
  EXPECT_EQ(cfg.detection_config.volume_percentile_thresholds,
            (std::vector<double>{90, 95}));
  EXPECT_EQ(cfg.detection_config.max_combinations, 0u);
  EXPECT_EQ(cfg.detection_config.lookback_candles.size(), 5u);

  // No file for these: defaults
  EXPECT_EQ(cfg.range_config.atr_periods.size(), 6u);
  EXPECT_EQ(cfg.breakout_config.max_candles_to_return.size(), 5u);

  fs::remove_all(dir);
}

namespace {

// argparse wants a mutable argv.
struct Argv {
  std::vector<std::string> args;
  std::vector<char*> ptrs;

  explicit Argv(std::vector<std::string> a) : args{std::move(a)} {
    for (auto& arg : args)
      ptrs.push_back(arg.data());
  }

  int argc() const { return static_cast<int>(ptrs.size()); }
  char** argv() { return ptrs.data(); }
};

}  // namespace

TEST(Config, CommandLineOverridesRunConfig) {
  auto dir = fs::temp_directory_path() / "keyrange_args_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  std::ofstream{dir / "run.json"}
      << R"({"symbol":"FROMFILE","signals_path":"file/signals.json"})";

  Argv args{{"keyrange", "bars.json", "-c", dir.string(), "-s", "ETHUSDC",
             "--store", "out/store.bin", "--summary", "out/summary.json",
             "--nthreads", "3"}};
  Config cfg;
  cfg.read_args(args.argc(), args.argv());

  EXPECT_EQ(cfg.bars_path, "bars.json");
  EXPECT_EQ(cfg.config_dir, dir.string());
  EXPECT_FALSE(cfg.debug_en);
  EXPECT_EQ(cfg.n_concurrency, 3u);
  EXPECT_EQ(cfg.run_config.symbol, "ETHUSDC");
  EXPECT_EQ(cfg.run_config.store_path, "out/store.bin");
  EXPECT_EQ(cfg.run_config.summary_path, "out/summary.json");
  EXPECT_EQ(cfg.run_config.signals_path, "file/signals.json");

  fs::remove_all(dir);
}

TEST(Config, CommandLineDefaults) {
  auto dir = fs::temp_directory_path() / "keyrange_no_such_config";
  fs::remove_all(dir);

  Argv args{{"keyrange", "data/bars.json", "--config", dir.string(),
             "--nthreads", "0"}};
  Config cfg;
  cfg.read_args(args.argc(), args.argv());

  EXPECT_EQ(cfg.bars_path, "data/bars.json");
  EXPECT_EQ(cfg.n_concurrency, 1u);
  EXPECT_EQ(cfg.run_config.symbol, "BTCUSDC");
  EXPECT_EQ(cfg.run_config.store_path, "data/store.bin");
  EXPECT_EQ(cfg.detection_config.max_combinations, 50u);
}
