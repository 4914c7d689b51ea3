#pragma once

#include <chronicle/anchor/flush_engine.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace chronicle::anchor {

/// Drives `flush_engine::flush` from one background thread at
/// `offset` seconds past every multiple of `period`. Ticks missed while a
/// flush was running are dropped.
class scheduler final {
 public:
  scheduler(flush_engine& engine,
            clock_fn_t clock,
            std::chrono::seconds period,
            std::chrono::seconds offset);
  ~scheduler();

  scheduler(const scheduler&) = delete;
  scheduler& operator=(const scheduler&) = delete;

  void start();

  /// Wake the thread and join it. A flush already running completes first.
  void stop();

  /// First tick strictly after `now`.
  static chronicle::schema::timestamp_seconds_t next_tick(
      chronicle::schema::timestamp_seconds_t now,
      std::chrono::seconds period,
      std::chrono::seconds offset);

 private:
  void run();

  flush_engine& engine_;
  clock_fn_t clock_;
  std::chrono::seconds period_;
  std::chrono::seconds offset_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{};
  std::thread thread_;
};

}  // namespace chronicle::anchor
