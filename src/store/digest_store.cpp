#include <spdlog/spdlog.h>
#include <chronicle/common/critical.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/encoding/scale/records.hpp>
#include <chronicle/schema/key/anchor_keys.hpp>
#include <chronicle/store/digest_store.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

using namespace chronicle::schema;

namespace {

constexpr auto kCodespace = std::string_view{"chronicle.digest"};

using storage_status = chronicle::storage::storage_status;

error_code to_error(const storage_status status) {
  return status == storage_status::unavailable ? error_code::storage_unavailable
                                               : error_code::ok;
}

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

namespace chronicle::store {

digest_store::digest_store(chronicle::storage::rocksdb_storage_t& storage,
                           const std::chrono::seconds collection_period)
    : storage_{storage}, collection_period_{collection_period.count()} {
  if (collection_period_ <= 0) {
    chronicle::common::critical("collection period must be positive, got {}s",
                                collection_period_);
  }
  if (reload_sequence() != error_code::ok) {
    chronicle::common::critical("failed to load digest sequence");
  }
  spdlog::debug("Digest store ready, next sequence {}", next_sequence_);
}

put_result_t digest_store::put(const digest_t& digest,
                               const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto result = put_result_t{};
  result.codespace = std::string{kCodespace};

  auto existing = std::optional<digest_record_t>{};
  auto code = lookup(digest, existing);
  if (code != error_code::ok) {
    result.code = to_code(code);
    result.log = "failed to read digest";
    return result;
  }
  if (existing.has_value()) {
    result.already_existed = true;
    result.batch = existing->batch;
    result.collection = existing->collection;
    result.sequence = existing->sequence;
    return result;
  }

  auto record = digest_record_t{.digest = digest,
                                .sequence = next_sequence_,
                                .submitted_at = now,
                                .collection = collection_of(now),
                                .batch = std::nullopt};
  auto writes = chronicle::storage::write_set{};
  stage_record(record, writes);
  auto encoder = chronicle::schema::encoding::scale_encoder_t{};
  writes.put(make_bytes(chronicle::schema::key::kNextSequenceKey),
             encoder.encode(uint64_t{next_sequence_ + 1}));

  auto status = storage_.commit(writes);
  if (status != storage_status::ok) {
    result.code = to_code(error_code::storage_unavailable);
    result.log = "failed to persist digest";
    return result;
  }
  ++next_sequence_;

  result.collection = record.collection;
  result.sequence = record.sequence;
  spdlog::debug("Stored digest {} at sequence {}", to_hex(digest),
                record.sequence);
  return result;
}

error_code digest_store::pending_since(
    const timestamp_seconds_t cutoff,
    std::vector<digest_record_t>& pending) const {
  auto rows = std::vector<chronicle::storage::key_value_entry_t>{};
  auto prefix = make_bytes(chronicle::schema::key::kPendingKeyPrefix);
  auto status = storage_.list_by_prefix(view(prefix), rows);
  if (status != storage_status::ok) {
    return to_error(status);
  }
  for (const auto& [key, value] : rows) {
    auto record =
        chronicle::schema::encoding::scale::decode_digest_record(view(value));
    if (!record.has_value()) {
      spdlog::error("Undecodable pending digest row");
      return error_code::integrity_error;
    }
    if (record->batch.has_value()) {
      spdlog::error("Pending index holds batched digest {}",
                    to_hex(record->digest));
      return error_code::integrity_error;
    }
    if (record->submitted_at <= cutoff) {
      pending.push_back(std::move(record.value()));
    }
  }
  return error_code::ok;
}

error_code digest_store::assign_batch(const root_t& root,
                                      const std::vector<digest_t>& digests) {
  auto raw = bytes_t{};
  auto batch_key = chronicle::schema::key::make_batch_key(root);
  auto status = storage_.get(view(batch_key), raw);
  if (status == storage_status::not_found) {
    spdlog::error("Refusing to assign digests to unknown batch {}",
                  to_hex(root));
    return error_code::batch_missing;
  }
  if (status != storage_status::ok) {
    return to_error(status);
  }

  auto writes = chronicle::storage::write_set{};
  auto code = stage_assignment(root, digests, writes);
  if (code != error_code::ok) {
    return code;
  }
  return to_error(storage_.commit(writes));
}

error_code digest_store::stage_assignment(
    const root_t& root,
    const std::vector<digest_t>& digests,
    chronicle::storage::write_set& writes) const {
  auto seen = std::set<digest_t>{};
  for (const auto& digest : digests) {
    if (!seen.insert(digest).second) {
      spdlog::error("Digest {} listed twice for batch {}", to_hex(digest),
                    to_hex(root));
      return error_code::integrity_error;
    }
    auto record = std::optional<digest_record_t>{};
    auto code = lookup(digest, record);
    if (code != error_code::ok) {
      return code;
    }
    if (!record.has_value()) {
      spdlog::error("Cannot assign unknown digest {}", to_hex(digest));
      return error_code::integrity_error;
    }
    if (record->batch.has_value()) {
      spdlog::error("Digest {} already belongs to batch {}", to_hex(digest),
                    to_hex(record->batch.value()));
      return error_code::integrity_error;
    }
    writes.erase(chronicle::schema::key::make_pending_key(record->sequence));
    record->batch = root;
    writes.put(chronicle::schema::key::make_digest_key(digest),
               chronicle::schema::encoding::scale::encode_digest_record(
                   record.value()));
  }
  return error_code::ok;
}

error_code digest_store::lookup(const digest_t& digest,
                                std::optional<digest_record_t>& record) const {
  auto raw = bytes_t{};
  auto key = chronicle::schema::key::make_digest_key(digest);
  auto status = storage_.get(view(key), raw);
  if (status == storage_status::not_found) {
    record.reset();
    return error_code::ok;
  }
  if (status != storage_status::ok) {
    return to_error(status);
  }
  record = chronicle::schema::encoding::scale::decode_digest_record(view(raw));
  if (!record.has_value()) {
    spdlog::error("Undecodable record for digest {}", to_hex(digest));
    return error_code::integrity_error;
  }
  return error_code::ok;
}

error_code digest_store::collection(
    const timestamp_seconds_t collection,
    std::vector<digest_record_t>& records) const {
  auto rows = std::vector<chronicle::storage::key_value_entry_t>{};
  auto prefix = chronicle::schema::key::make_collection_prefix(collection);
  auto status = storage_.list_by_prefix(view(prefix), rows);
  if (status != storage_status::ok) {
    return to_error(status);
  }
  for (const auto& [key, value] : rows) {
    auto digest = try_make_hash32(view(value));
    if (!digest.has_value()) {
      return error_code::integrity_error;
    }
    auto record = std::optional<digest_record_t>{};
    auto code = lookup(digest.value(), record);
    if (code != error_code::ok) {
      return code;
    }
    if (!record.has_value()) {
      spdlog::error("Collection index names unknown digest {}",
                    to_hex(digest.value()));
      return error_code::integrity_error;
    }
    records.push_back(std::move(record.value()));
  }
  return error_code::ok;
}

error_code digest_store::purge(const digest_t& digest) {
  auto lock = std::scoped_lock{mutex_};
  auto record = std::optional<digest_record_t>{};
  auto code = lookup(digest, record);
  if (code != error_code::ok) {
    return code;
  }
  if (!record.has_value()) {
    return error_code::invalid_argument;
  }
  if (record->batch.has_value()) {
    spdlog::warn("Refusing to purge digest {} anchored in batch {}",
                 to_hex(digest), to_hex(record->batch.value()));
    return error_code::integrity_error;
  }

  auto writes = chronicle::storage::write_set{};
  writes.erase(chronicle::schema::key::make_digest_key(digest));
  writes.erase(chronicle::schema::key::make_pending_key(record->sequence));
  writes.erase(chronicle::schema::key::make_collection_key(record->collection,
                                                           record->sequence));
  code = to_error(storage_.commit(writes));
  if (code == error_code::ok) {
    spdlog::info("Purged pending digest {}", to_hex(digest));
  }
  return code;
}

error_code digest_store::list_all(std::vector<digest_record_t>& records) const {
  auto rows = std::vector<chronicle::storage::key_value_entry_t>{};
  auto prefix = make_bytes(chronicle::schema::key::kDigestKeyPrefix);
  auto status = storage_.list_by_prefix(view(prefix), rows);
  if (status != storage_status::ok) {
    return to_error(status);
  }
  records.reserve(records.size() + rows.size());
  for (const auto& [key, value] : rows) {
    auto record =
        chronicle::schema::encoding::scale::decode_digest_record(view(value));
    if (!record.has_value()) {
      spdlog::error("Undecodable digest row");
      return error_code::integrity_error;
    }
    records.push_back(std::move(record.value()));
  }
  std::sort(std::begin(records), std::end(records),
            [](const digest_record_t& lhs, const digest_record_t& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return error_code::ok;
}

error_code digest_store::count_pending(uint64_t& count) const {
  auto rows = std::vector<chronicle::storage::key_value_entry_t>{};
  auto prefix = make_bytes(chronicle::schema::key::kPendingKeyPrefix);
  auto status = storage_.list_by_prefix(view(prefix), rows);
  if (status != storage_status::ok) {
    return to_error(status);
  }
  count = rows.size();
  return error_code::ok;
}

void digest_store::stage_import(const std::vector<digest_record_t>& records,
                                chronicle::storage::write_set& writes) const {
  auto next = sequence_t{0};
  for (const auto& record : records) {
    stage_record(record, writes);
    next = std::max(next, record.sequence + 1);
  }
  auto encoder = chronicle::schema::encoding::scale_encoder_t{};
  writes.put(make_bytes(chronicle::schema::key::kNextSequenceKey),
             encoder.encode(uint64_t{next}));
}

error_code digest_store::reload_sequence() {
  auto key = make_bytes(chronicle::schema::key::kNextSequenceKey);
  auto raw = bytes_t{};
  auto status = storage_.get(view(key), raw);
  if (status == storage_status::unavailable) {
    return error_code::storage_unavailable;
  }
  auto stored = uint64_t{};
  if (status == storage_status::ok) {
    auto encoder = chronicle::schema::encoding::scale_encoder_t{};
    auto decoded = encoder.try_decode<uint64_t>(view(raw));
    if (!decoded.has_value()) {
      spdlog::error("Undecodable digest sequence counter");
      return error_code::integrity_error;
    }
    stored = decoded.value();
  }
  auto lock = std::scoped_lock{mutex_};
  next_sequence_ = stored;
  return error_code::ok;
}

timestamp_seconds_t digest_store::collection_of(
    const timestamp_seconds_t timestamp) const {
  auto remainder = timestamp % collection_period_;
  if (remainder < 0) {
    remainder += collection_period_;
  }
  return timestamp - remainder;
}

void digest_store::stage_record(const digest_record_t& record,
                                chronicle::storage::write_set& writes) const {
  auto encoded = chronicle::schema::encoding::scale::encode_digest_record(record);
  if (!record.batch.has_value()) {
    writes.put(chronicle::schema::key::make_pending_key(record.sequence),
               encoded);
  }
  writes.put(chronicle::schema::key::make_collection_key(record.collection,
                                                         record.sequence),
             make_bytes(bytes_view_t{record.digest}));
  writes.put(chronicle::schema::key::make_digest_key(record.digest),
             std::move(encoded));
}

}  // namespace chronicle::store
