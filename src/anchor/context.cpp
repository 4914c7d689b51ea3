#include <chronicle/anchor/context.hpp>

namespace chronicle::anchor {

chronicle::schema::timestamp_seconds_t system_clock_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace chronicle::anchor
