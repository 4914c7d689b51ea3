#pragma once

#include <chronicle/anchor/context.hpp>
#include <chronicle/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace chronicle::testing {

inline chronicle::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = chronicle::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock the tests move by hand.
class manual_clock final {
 public:
  explicit manual_clock(const chronicle::schema::timestamp_seconds_t start)
      : now_{start} {}

  chronicle::schema::timestamp_seconds_t now() const { return now_; }
  void set(const chronicle::schema::timestamp_seconds_t value) { now_ = value; }
  void advance(const int64_t seconds) { now_ += seconds; }

  chronicle::anchor::clock_fn_t fn() {
    return [this] { return now_.load(); };
  }

 private:
  std::atomic<chronicle::schema::timestamp_seconds_t> now_;
};

}  // namespace chronicle::testing
