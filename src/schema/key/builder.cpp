#include <chronicle/schema/key/builder.hpp>

#include <iterator>

using namespace chronicle::schema::key;

builder& builder::write(const std::string_view& prefix) {
  data.insert(std::end(data), std::begin(prefix), std::end(prefix));
  return *this;
}

builder& builder::write(const chronicle::schema::bytes_view_t& bytes) {
  data.insert(std::end(data), std::begin(bytes), std::end(bytes));
  return *this;
}

builder& builder::write(const chronicle::schema::hash32_t& hash) {
  data.insert(std::end(data), std::begin(hash), std::end(hash));
  return *this;
}

builder& builder::write(const uint8_t tag) {
  data.push_back(tag);
  return *this;
}

builder& builder::write(const uint64_t value) {
  for (auto shift = 56; shift >= 0; shift -= 8) {
    data.push_back(static_cast<uint8_t>(value >> shift));
  }
  return *this;
}

builder& builder::write_timestamp(
    const chronicle::schema::timestamp_seconds_t seconds) {
  return write(static_cast<uint64_t>(seconds) ^ (uint64_t{1} << 63));
}
