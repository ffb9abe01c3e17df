#pragma once

#include <atomic>
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <stdexcept>
#include <stop_token>
#include <thread>

/**
 * Turns SIGINT into a stop request. Must be created before any other thread
 * so the signal mask is inherited and only the watcher thread receives it.
 */
class Interrupt {
  std::stop_source source;
  std::thread td;
  std::atomic<bool> done{false};

  void handler() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);

    int signum;
    while (true) {
      if (sigwait(&set, &signum) == 0 && signum == SIGINT) {
        if (!done)
          std::cerr << "\n[interrupt] finishing in-flight evaluations\n";
        source.request_stop();
        break;
      }
    }
  }

  static void block_signals_for_all_threads() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0)
      throw std::runtime_error("Failed to block signals");
  }

 public:
  Interrupt() {
    block_signals_for_all_threads();
    td = std::thread(&Interrupt::handler, this);
  }

  ~Interrupt() {
    done = true;
    if (td.joinable()) {
      // wake the watcher so it can exit
      pthread_kill(td.native_handle(), SIGINT);
      td.join();
    }
  }

  Interrupt(const Interrupt&) = delete;
  Interrupt& operator=(const Interrupt&) = delete;
  Interrupt(Interrupt&&) = delete;
  Interrupt& operator=(Interrupt&&) = delete;

  std::stop_token token() const { return source.get_token(); }
};
