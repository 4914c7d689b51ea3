#include <chronicle/schema/primitives.hpp>

#include <algorithm>
#include <iterator>

namespace chronicle::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};

int nibble_of(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  auto lower = static_cast<char>(c | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return lower - 'a' + 10;
  }
  return -1;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes) {
  auto hash = hash32_t{};
  if (bytes.size() != hash.size()) {
    return std::nullopt;
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_parse_hash32(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  auto hash = hash32_t{};
  if (hex.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (auto i = size_t{0}; i < hash.size(); ++i) {
    auto high = nibble_of(hex[2 * i]);
    auto low = nibble_of(hex[(2 * i) + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0F]);
  }
  return out;
}

}  // namespace chronicle::schema
