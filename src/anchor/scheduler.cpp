#include <spdlog/spdlog.h>
#include <chronicle/anchor/scheduler.hpp>

#include <utility>

namespace chronicle::anchor {

scheduler::scheduler(flush_engine& engine,
                     clock_fn_t clock,
                     const std::chrono::seconds period,
                     const std::chrono::seconds offset)
    : engine_{engine},
      clock_{std::move(clock)},
      period_{period},
      offset_{offset} {}

scheduler::~scheduler() {
  stop();
}

void scheduler::start() {
  auto lock = std::scoped_lock{mutex_};
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread{[this] { run(); }};
  spdlog::info("Scheduler started, period {}s offset {}s", period_.count(),
               offset_.count());
}

void scheduler::stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    spdlog::info("Scheduler stopped");
  }
}

chronicle::schema::timestamp_seconds_t scheduler::next_tick(
    const chronicle::schema::timestamp_seconds_t now,
    const std::chrono::seconds period,
    const std::chrono::seconds offset) {
  auto length = period.count();
  auto shifted = now - offset.count();
  auto remainder = shifted % length;
  if (remainder < 0) {
    remainder += length;
  }
  return shifted - remainder + length + offset.count();
}

void scheduler::run() {
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    auto now = clock_();
    auto tick = next_tick(now, period_, offset_);
    spdlog::debug("Next flush in {}s", tick - now);
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds{tick - now};
    if (wake_.wait_until(lock, deadline, [this] { return stopping_; })) {
      break;
    }
    lock.unlock();
    auto result = engine_.flush();
    if (result.code != 0 && !result.skipped) {
      spdlog::error("Scheduled flush failed: {}", result.log);
    }
    lock.lock();
  }
}

}  // namespace chronicle::anchor
