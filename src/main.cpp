#include "core/errors.h"
#include "core/memory_store.h"
#include "core/serialization.h"
#include "mt/interrupt.h"
#include "opt/pipeline.h"
#include "util/config.h"
#include "util/times.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <format>
#include <iostream>
#include <optional>

namespace fs = std::filesystem;

inline void init_logging(const Config& config) {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%H%M%S}.log", pwd,
                              std::chrono::floor<seconds>(SysClock::now()));
  auto link_name = pwd + "/logs/output.log";

  fs::remove(link_name);
  fs::create_symlink(log_name, link_name);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (path.empty() || fs::exists(path))
      continue;
    if (fs::create_directories(path))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

inline void print_summary(const RunSummary& summary) {
  std::cout << std::format("{}: {} candles, {} .. {}\n", summary.symbol,
                           summary.n_candles, summary.first_candle,
                           summary.last_candle);
  for (const auto& s : summary.stages) {
    std::cout << std::format("  {:<10} score {:.4f}  {} {:.4f}", s.stage,
                             s.score, s.metric_name, s.metric);
    if (s.in_band)
      std::cout << (*s.in_band ? "  (in band)" : "  (outside band)");
    std::cout << std::format("  params #{} {} rows\n", s.params_id, s.n_rows);
    for (const auto& [name, value] : s.params)
      std::cout << std::format("      {} = {}\n", name, value);
  }
  std::cout << std::format("  signals: {} ({} valid)\n", summary.n_signals,
                           summary.n_valid_signals);
}

int main(int argc, char* argv[]) {
  Interrupt interrupt;

  Config config;
  ensure_directories_exist({"logs"});
  config.read_args(argc, argv);
  init_logging(config);

  std::optional<MemoryStore> store;

  // Stages completed before a failure keep their rows.
  auto fail = [&](int code, const std::exception& ex) {
    spdlog::error("{}", ex.what());
    std::cerr << ex.what() << '\n';
    try {
      if (store)
        store->save(config.run_config.store_path);
    } catch (const std::exception& save_ex) {
      spdlog::error("{}", save_ex.what());
      std::cerr << save_ex.what() << '\n';
    }
    return code;
  };

  try {
    PriceSeries series{read_candles_json(config.bars_path)};
    store.emplace(MemoryStore::load(config.run_config.store_path));

    Pipeline pipeline{series, config, *store};
    auto result = pipeline.run(interrupt.token());

    store->save(config.run_config.store_path);
    write_summary_json(config.run_config.summary_path, result.summary);
    write_signals_json(config.run_config.signals_path, result.signals);

    print_summary(result.summary);
  } catch (const std::exception& ex) {
    return fail(exit_code(ex), ex);
  }

  spdlog::info("[exit] main");
  return 0;
}
