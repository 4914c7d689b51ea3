#pragma once

#include <chronicle/schema/batch_state.hpp>
#include <chronicle/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Canonical key prefixes and key codecs for digests, batches and their
// secondary indices.
namespace chronicle::schema::key {

inline constexpr std::string_view kDigestKeyPrefix{"SYS|DIGEST|"};
inline constexpr std::string_view kPendingKeyPrefix{"SYS|PENDING|"};
inline constexpr std::string_view kCollectionKeyPrefix{"SYS|COLLECTION|"};
inline constexpr std::string_view kBatchKeyPrefix{"SYS|BATCH|"};
inline constexpr std::string_view kBatchStateKeyPrefix{"SYS|BATCH_STATE|"};
inline constexpr std::string_view kNextSequenceKey{"SYS|META|NEXT_SEQUENCE"};
inline constexpr std::string_view kLastAnchorKey{"SYS|META|LAST_ANCHOR"};
inline constexpr std::string_view kSystemPrefix{"SYS|"};

inline constexpr std::array<std::string_view, 7> kAnchorKeyspaces{
    kDigestKeyPrefix,   kPendingKeyPrefix, kCollectionKeyPrefix,
    kBatchKeyPrefix,    kBatchStateKeyPrefix, kNextSequenceKey,
    kLastAnchorKey};

chronicle::schema::bytes_t make_digest_key(
    const chronicle::schema::digest_t& digest);

chronicle::schema::bytes_t make_pending_key(
    chronicle::schema::sequence_t sequence);

/// Prefix of every collection row for the window starting at `collection`.
chronicle::schema::bytes_t make_collection_prefix(
    chronicle::schema::timestamp_seconds_t collection);

chronicle::schema::bytes_t make_collection_key(
    chronicle::schema::timestamp_seconds_t collection,
    chronicle::schema::sequence_t sequence);

chronicle::schema::bytes_t make_batch_key(const chronicle::schema::root_t& root);

chronicle::schema::bytes_t make_batch_state_prefix(
    chronicle::schema::batch_state_t state);

chronicle::schema::bytes_t make_batch_state_key(
    chronicle::schema::batch_state_t state,
    chronicle::schema::timestamp_seconds_t closed_at,
    const chronicle::schema::root_t& root);

/// Extract the root from a state index key, std::nullopt if malformed.
std::optional<chronicle::schema::root_t> parse_batch_state_key(
    const chronicle::schema::bytes_view_t& key);

/// Extract the 32-byte suffix following `prefix`, std::nullopt if malformed.
std::optional<chronicle::schema::hash32_t> parse_hash_suffix(
    const chronicle::schema::bytes_view_t& key,
    std::string_view prefix);

}  // namespace chronicle::schema::key
