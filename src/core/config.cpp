#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

template <typename T>
T read(const fs::path& path, bool log_config) {
  T t{};

  if (!fs::exists(path)) {
    spdlog::info("[config] {} not found, using defaults", path.string());
  } else {
    auto ec = glz::read_file_json(t, path.string(), std::string{});
    if (ec) {
      spdlog::error("[config] {} error {}, using defaults", path.string(),
                    glz::format_error(ec));
      t = T{};
    }
  }

  if (T::debug && log_config) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer.c_str());
  }

  return t;
}

void Config::update() {
  if (debug_en)
    fs::remove("logs/configs.log");

  fs::path dir{config_dir};
  run_config = read<RunConfig>(dir / "run.json", debug_en);
  detection_config = read<DetectionConfig>(dir / "detection.json", debug_en);
  range_config = read<RangeConfig>(dir / "range.json", debug_en);
  breakout_config = read<BreakoutConfig>(dir / "breakout.json", debug_en);
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("keyrange");

  program.add_argument("bars").help("JSON file of OHLCV candles");

  program.add_argument("-c", "--config")
      .help("Directory holding the stage config files")
      .default_value(std::string{"config"});

  program.add_argument("-s", "--symbol")
      .help("Symbol recorded in the run summary")
      .default_value(std::string{});

  program.add_argument("--store")
      .help("Result store file")
      .default_value(std::string{});

  program.add_argument("--summary")
      .help("Run summary output file")
      .default_value(std::string{});

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  auto def_nthreads = static_cast<size_t>(std::thread::hardware_concurrency());
  program.add_argument("--nthreads")
      .help("Max number of concurrent threads")
      .default_value(def_nthreads)
      .scan<'d', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    std::exit(EXIT_FAILURE);
  }

  bars_path = program.get<std::string>("bars");
  config_dir = program.get<std::string>("--config");
  debug_en = program.get<bool>("--debug");
  n_concurrency = std::max<size_t>(program.get<size_t>("--nthreads"), 1);

  update();

  if (auto symbol = program.get<std::string>("--symbol"); !symbol.empty())
    run_config.symbol = symbol;
  if (auto store = program.get<std::string>("--store"); !store.empty())
    run_config.store_path = store;
  if (auto summary = program.get<std::string>("--summary"); !summary.empty())
    run_config.summary_path = summary;
}
