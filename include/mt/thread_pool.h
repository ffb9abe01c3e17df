#pragma once

#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <latch>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @brief Fixed-size pool draining a FIFO queue of work items.
 *
 * Items are handed to `func` in insertion order. A stop request on the
 * supplied token is honoured between items: a worker finishes the item it
 * holds and takes no new one, leaving the rest of the queue unprocessed.
 * `func` must not throw.
 */
template <typename T>
  requires std::is_move_assignable_v<T> && std::is_move_constructible_v<T>
class thread_pool {
  const size_t n_threads = 1;
  std::latch latch;

  using Func = std::function<void(T&&)>;
  const Func func;

  std::deque<T> vals;
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool closed = false;
  bool started = false;
  std::stop_token cancel;

  std::vector<std::jthread> threads;

  std::optional<T> pop() {
    std::unique_lock lk{mtx};
    cv.wait(lk, [this] { return closed || (!vals.empty() && started); });
    if (vals.empty() || cancel.stop_requested())
      return std::nullopt;
    auto t = std::move(vals.front());
    vals.pop_front();
    return t;
  }

  void worker_loop() {
    while (true) {
      auto t_opt = pop();
      if (!t_opt)
        break;
      func(std::move(*t_opt));
    }
    latch.count_down();
  }

 public:
  thread_pool(size_t n_threads,
              Func func,
              std::vector<T> vec,
              std::stop_token cancel = {})
      : n_threads{n_threads == 0 ? 1 : n_threads},
        latch{static_cast<std::ptrdiff_t>(this->n_threads)},
        func{std::move(func)},
        vals{std::make_move_iterator(vec.begin()),
             std::make_move_iterator(vec.end())},
        cancel{std::move(cancel)}  //
  {
    threads.reserve(this->n_threads);
    for (size_t i = 0; i < this->n_threads; i++)
      threads.emplace_back(&thread_pool::worker_loop, this);
    {
      std::lock_guard lk{mtx};
      started = true;
    }
    cv.notify_all();
  }

  ~thread_pool() { wait(); }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;
  thread_pool(thread_pool&&) = delete;
  thread_pool& operator=(thread_pool&&) = delete;

  template <typename... Args>
    requires std::constructible_from<T, Args...>
  void emplace(Args&&... args) {
    {
      std::lock_guard lk{mtx};
      if (closed)
        throw std::runtime_error("added work to closed thread_pool");
      vals.emplace_back(std::forward<Args>(args)...);
    }
    cv.notify_one();
  }

  // Closes the queue and blocks until every worker has exited.
  void wait() {
    {
      std::lock_guard lk{mtx};
      closed = true;
    }
    cv.notify_all();
    latch.wait();
  }

  // Items never handed to a worker.
  size_t remaining() const {
    std::lock_guard lk{mtx};
    return vals.size();
  }
};
