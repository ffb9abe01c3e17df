#pragma once

#include "core/errors.h"
#include "mt/thread_pool.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

struct Axis {
  std::string name;
  std::vector<double> values;
};

/**
 * @brief One point of a grid: a value per axis, in axis order.
 *
 * `index` is the position of the point in enumeration order, which is the
 * tie-break key when two points score the same.
 */
struct Combination {
  size_t index = 0;
  std::vector<std::string> names;
  std::vector<double> values;

  double get(std::string_view name) const;
  int get_int(std::string_view name) const {
    return static_cast<int>(std::lround(get(name)));
  }

  std::map<std::string, double> to_map() const;
  std::string to_string() const;
};

/**
 * @brief Cartesian product of named axes, optionally capped.
 *
 * Enumeration is mixed-radix: the first axis is outermost and the last axis
 * varies fastest. With a cap, only the first `max_combinations` points of
 * that order are retained.
 */
class GridSpace {
  std::vector<Axis> axes;
  std::optional<size_t> max_combinations;

 public:
  explicit GridSpace(std::vector<Axis> axes,
                     std::optional<size_t> max_combinations = std::nullopt);

  size_t total() const;
  size_t retained() const;

  Combination at(size_t index) const;
  std::vector<Combination> enumerate() const;
};

template <typename Payload>
struct Evaluation {
  double score;
  Payload payload;
};

struct CandidateScore {
  Combination combination;
  std::optional<double> score;
  std::string error;

  bool failed() const { return !score.has_value(); }
};

template <typename Payload>
struct GridOutcome {
  std::string stage;
  Combination winner;
  double score = 0.0;
  Payload payload;

  size_t total_combinations = 0;
  size_t n_failed = 0;
  std::vector<CandidateScore> candidates;  // enumeration order
};

/**
 * @brief Exhaustive parameter sweep shared by every optimizer stage.
 *
 * Each retained combination is evaluated once on a bounded worker pool. An
 * evaluation that throws, or returns a non-finite score, marks only that
 * combination as failed. The winner is the strictly highest score, ties
 * going to the earliest combination in enumeration order, independent of
 * the order in which workers complete. If nothing succeeds the search
 * throws NoViableParametersError; a stop request throws
 * OptimizationCancelled once in-flight evaluations have finished.
 *
 * The evaluation function is called concurrently and must only read shared
 * state.
 */
template <typename Payload>
class GridSearch {
  std::string stage;
  GridSpace space;
  size_t n_threads;

 public:
  using EvalFn = std::function<Evaluation<Payload>(const Combination&)>;

  GridSearch(std::string stage, GridSpace space, size_t n_threads = 1)
      : stage{std::move(stage)},
        space{std::move(space)},
        n_threads{n_threads == 0 ? 1 : n_threads} {}

  GridOutcome<Payload> run(const EvalFn& eval,
                           std::stop_token cancel = {}) const;
};

template <typename Payload>
GridOutcome<Payload> GridSearch<Payload>::run(const EvalFn& eval,
                                              std::stop_token cancel) const {
  Timer timer;
  auto combinations = space.enumerate();
  auto n = combinations.size();

  spdlog::info("[grid] {}: {} combinations, {} retained, {} threads", stage,
               space.total(), n, std::min(n_threads, std::max<size_t>(n, 1)));

  std::vector<CandidateScore> candidates(n);
  std::vector<char> evaluated(n, 0);

  std::mutex best_mtx;
  std::optional<size_t> best_idx;
  double best_score = 0.0;
  std::optional<Payload> best_payload;

  auto task = [&](size_t i) {
    const auto& comb = combinations[i];
    auto& slot = candidates[i];
    slot.combination = comb;
    evaluated[i] = 1;

    try {
      auto result = eval(comb);
      if (!std::isfinite(result.score)) {
        slot.error = "non-finite score";
        return;
      }
      slot.score = result.score;

      std::lock_guard lk{best_mtx};
      if (!best_idx || result.score > best_score ||
          (result.score == best_score && i < *best_idx)) {
        best_idx = i;
        best_score = result.score;
        best_payload = std::move(result.payload);
      }
    } catch (const std::exception& ex) {
      slot.error = ex.what();
    }
  };

  {
    std::vector<size_t> indices(n);
    for (size_t i = 0; i < n; ++i)
      indices[i] = i;

    thread_pool<size_t> pool{std::min(n_threads, std::max<size_t>(n, 1)),
                             task, std::move(indices), cancel};
    pool.wait();
  }

  if (cancel.stop_requested()) {
    size_t done = 0;
    for (auto e : evaluated)
      done += e;
    spdlog::warn("[grid] {}: cancelled after {} of {} combinations", stage,
                 done, n);
    throw OptimizationCancelled{stage};
  }

  GridOutcome<Payload> out;
  out.stage = stage;
  out.total_combinations = n;

  std::vector<CombinationFailure> failures;
  for (size_t i = 0; i < n; ++i) {
    const auto& c = candidates[i];
    if (!c.failed())
      continue;
    spdlog::debug("[grid] {}: #{} {} failed: {}", stage, i,
                  c.combination.to_string(), c.error);
    failures.push_back({i, c.combination.to_string(), c.error});
  }
  out.n_failed = failures.size();

  if (!best_idx)
    throw NoViableParametersError{stage, std::move(failures)};

  out.winner = combinations[*best_idx];
  out.score = best_score;
  out.payload = std::move(*best_payload);
  out.candidates = std::move(candidates);

  spdlog::info("[grid] {}: winner #{} {} score {:.4f} ({} failed, {:.1f} ms)",
               stage, out.winner.index, out.winner.to_string(), out.score,
               out.n_failed, timer.diff_ms());
  return out;
}
