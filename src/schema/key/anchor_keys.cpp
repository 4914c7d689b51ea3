#include <chronicle/schema/key/anchor_keys.hpp>
#include <chronicle/schema/key/builder.hpp>

#include <algorithm>

namespace chronicle::schema::key {

namespace {

bool has_prefix(const chronicle::schema::bytes_view_t& key,
                const std::string_view prefix) {
  return chronicle::schema::make_string_view(key).starts_with(prefix);
}

}  // namespace

chronicle::schema::bytes_t make_digest_key(
    const chronicle::schema::digest_t& digest) {
  return builder{}.write(kDigestKeyPrefix).write(digest).data;
}

chronicle::schema::bytes_t make_pending_key(
    const chronicle::schema::sequence_t sequence) {
  return builder{}.write(kPendingKeyPrefix).write(sequence).data;
}

chronicle::schema::bytes_t make_collection_prefix(
    const chronicle::schema::timestamp_seconds_t collection) {
  return builder{}
      .write(kCollectionKeyPrefix)
      .write_timestamp(collection)
      .data;
}

chronicle::schema::bytes_t make_collection_key(
    const chronicle::schema::timestamp_seconds_t collection,
    const chronicle::schema::sequence_t sequence) {
  return builder{}
      .write(kCollectionKeyPrefix)
      .write_timestamp(collection)
      .write(sequence)
      .data;
}

chronicle::schema::bytes_t make_batch_key(
    const chronicle::schema::root_t& root) {
  return builder{}.write(kBatchKeyPrefix).write(root).data;
}

chronicle::schema::bytes_t make_batch_state_prefix(
    const chronicle::schema::batch_state_t state) {
  return builder{}
      .write(kBatchStateKeyPrefix)
      .write(static_cast<uint8_t>(state))
      .data;
}

chronicle::schema::bytes_t make_batch_state_key(
    const chronicle::schema::batch_state_t state,
    const chronicle::schema::timestamp_seconds_t closed_at,
    const chronicle::schema::root_t& root) {
  return builder{}
      .write(kBatchStateKeyPrefix)
      .write(static_cast<uint8_t>(state))
      .write_timestamp(closed_at)
      .write(root)
      .data;
}

std::optional<chronicle::schema::root_t> parse_batch_state_key(
    const chronicle::schema::bytes_view_t& key) {
  // prefix | state | closed_at | root
  constexpr auto kSize = kBatchStateKeyPrefix.size() + 1 + 8 + 32;
  if (key.size() != kSize || !has_prefix(key, kBatchStateKeyPrefix)) {
    return std::nullopt;
  }
  return chronicle::schema::try_make_hash32(key.last(32));
}

std::optional<chronicle::schema::hash32_t> parse_hash_suffix(
    const chronicle::schema::bytes_view_t& key,
    const std::string_view prefix) {
  if (key.size() != prefix.size() + 32 || !has_prefix(key, prefix)) {
    return std::nullopt;
  }
  return chronicle::schema::try_make_hash32(key.last(32));
}

}  // namespace chronicle::schema::key
