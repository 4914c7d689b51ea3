#include <spdlog/spdlog.h>
#include <chronicle/merkle/tree.hpp>
#include <chronicle/schema/encoding/scale/records.hpp>
#include <chronicle/schema/key/anchor_keys.hpp>
#include <chronicle/store/anchor_store.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

using namespace chronicle::schema;

namespace {

constexpr auto kCodespace = std::string_view{"chronicle.anchor"};

using storage_status = chronicle::storage::storage_status;

error_code to_error(const storage_status status) {
  return status == storage_status::unavailable ? error_code::storage_unavailable
                                               : error_code::ok;
}

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

operation_result_t fail(const error_code code, std::string log) {
  return make_operation_result(code, std::move(log), kCodespace);
}

void stage_batch_row(const batch_record_t& batch,
                     chronicle::storage::write_set& writes) {
  writes.put(chronicle::schema::key::make_batch_state_key(
                 batch.state, batch.closed_at, batch.root),
             bytes_t{});
  writes.put(chronicle::schema::key::make_batch_key(batch.root),
             chronicle::schema::encoding::scale::encode_batch_record(batch));
}

}  // namespace

namespace chronicle::store {

anchor_store::anchor_store(chronicle::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

create_batch_result_t anchor_store::create_batch(
    const std::vector<digest_t>& members,
    const timestamp_seconds_t closed_at) {
  auto lock = std::scoped_lock{mutex_};
  auto writes = chronicle::storage::write_set{};
  auto result = stage_batch(members, closed_at, writes);
  if (result.code != 0) {
    return result;
  }
  auto code = to_error(storage_.commit(writes));
  if (code != error_code::ok) {
    result.code = to_code(code);
    result.log = "failed to persist batch";
  }
  return result;
}

create_batch_result_t anchor_store::stage_batch(
    const std::vector<digest_t>& members,
    const timestamp_seconds_t closed_at,
    chronicle::storage::write_set& writes) const {
  auto result = create_batch_result_t{};
  result.codespace = std::string{kCodespace};

  auto unique = std::set<digest_t>(std::begin(members), std::end(members));
  if (members.empty() || unique.size() != members.size()) {
    result.code = to_code(error_code::invalid_argument);
    result.log = "batch members must be non-empty and distinct";
    return result;
  }

  auto root = chronicle::merkle::root(members);
  result.root = root.value();

  auto existing = std::optional<batch_record_t>{};
  auto code = get_batch(result.root, existing);
  if (code != error_code::ok) {
    result.code = to_code(code);
    result.log = "failed to check for existing batch";
    return result;
  }
  if (existing.has_value()) {
    spdlog::error(
        "Aggregate root {} already anchors a stored batch ({} members); "
        "rejecting new batch of {} members",
        to_hex(result.root), existing->members.size(), members.size());
    result.code = to_code(error_code::duplicate_root);
    result.log = "aggregate root already stored";
    return result;
  }

  stage_batch_row(batch_record_t{.root = result.root,
                                 .members = members,
                                 .state = batch_state_t::unsubmitted,
                                 .closed_at = closed_at},
                  writes);
  return result;
}

operation_result_t anchor_store::mark_submitted(const root_t& root,
                                                const std::string& tx_id) {
  if (tx_id.empty()) {
    return fail(error_code::invalid_argument, "empty transaction id");
  }
  return transition(
      root, batch_state_t::submitted,
      [&](batch_record_t& batch) {
        batch.tx_id = tx_id;
        batch.failure_reason.reset();
        ++batch.submit_attempts;
      },
      true);
}

operation_result_t anchor_store::mark_confirmed(
    const root_t& root,
    const int64_t height,
    const timestamp_seconds_t confirmed_at) {
  auto lock = std::scoped_lock{mutex_};
  auto existing = std::optional<batch_record_t>{};
  auto code = get_batch(root, existing);
  if (code != error_code::ok) {
    return fail(code, "failed to read batch");
  }
  if (existing.has_value() && existing->state == batch_state_t::confirmed) {
    if (existing->confirmed_height == height &&
        existing->confirmed_at == confirmed_at) {
      return operation_result_t{.codespace = std::string{kCodespace}};
    }
    spdlog::error(
        "Conflicting confirmation for batch {}: stored height {} time {}, "
        "reported height {} time {}",
        to_hex(root), existing->confirmed_height.value_or(-1),
        existing->confirmed_at.value_or(-1), height, confirmed_at);
    return fail(error_code::conflicting_confirmation,
                "batch already confirmed with different values");
  }
  return apply_transition(
      root, existing, batch_state_t::confirmed,
      [&](batch_record_t& batch) {
        batch.confirmed_height = height;
        batch.confirmed_at = confirmed_at;
      },
      false);
}

operation_result_t anchor_store::mark_failed(const root_t& root,
                                             const std::string& reason) {
  return transition(
      root, batch_state_t::failed,
      [&](batch_record_t& batch) {
        if (batch.state == batch_state_t::unsubmitted) {
          ++batch.submit_attempts;
        }
        batch.failure_reason = reason;
      },
      false);
}

operation_result_t anchor_store::mark_retry(const root_t& root) {
  return transition(
      root, batch_state_t::unsubmitted,
      [](batch_record_t& batch) { batch.tx_id.reset(); }, false);
}

error_code anchor_store::unconfirmed(std::vector<root_t>& roots) const {
  auto code = list_state(batch_state_t::submitted, roots);
  if (code != error_code::ok) {
    return code;
  }
  return list_state(batch_state_t::failed, roots);
}

error_code anchor_store::awaiting_submission(std::vector<root_t>& roots) const {
  auto queued = std::vector<root_t>{};
  auto code = list_state(batch_state_t::unsubmitted, queued);
  if (code == error_code::ok) {
    code = list_state(batch_state_t::failed, queued);
  }
  if (code != error_code::ok) {
    return code;
  }

  // Oldest first across both states.
  auto ordered = std::vector<std::pair<timestamp_seconds_t, root_t>>{};
  ordered.reserve(queued.size());
  for (const auto& root : queued) {
    auto batch = std::optional<batch_record_t>{};
    code = get_batch(root, batch);
    if (code != error_code::ok) {
      return code;
    }
    if (!batch.has_value()) {
      spdlog::error("State index names unknown batch {}", to_hex(root));
      return error_code::integrity_error;
    }
    ordered.emplace_back(batch->closed_at, root);
  }
  std::stable_sort(std::begin(ordered), std::end(ordered),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.first < rhs.first;
                   });
  for (const auto& [closed_at, root] : ordered) {
    roots.push_back(root);
  }
  return error_code::ok;
}

error_code anchor_store::get_batch(
    const root_t& root,
    std::optional<batch_record_t>& batch) const {
  auto raw = bytes_t{};
  auto key = chronicle::schema::key::make_batch_key(root);
  auto status = storage_.get(view(key), raw);
  if (status == storage_status::not_found) {
    batch.reset();
    return error_code::ok;
  }
  if (status != storage_status::ok) {
    return to_error(status);
  }
  batch = chronicle::schema::encoding::scale::decode_batch_record(view(raw));
  if (!batch.has_value()) {
    spdlog::error("Undecodable record for batch {}", to_hex(root));
    return error_code::integrity_error;
  }
  return error_code::ok;
}

error_code anchor_store::last_anchor(
    std::optional<batch_record_t>& batch) const {
  auto raw = bytes_t{};
  auto key = make_bytes(chronicle::schema::key::kLastAnchorKey);
  auto status = storage_.get(view(key), raw);
  if (status == storage_status::not_found) {
    batch.reset();
    return error_code::ok;
  }
  if (status != storage_status::ok) {
    return to_error(status);
  }
  auto root = try_make_hash32(view(raw));
  if (!root.has_value()) {
    return error_code::integrity_error;
  }
  auto code = get_batch(root.value(), batch);
  if (code == error_code::ok && !batch.has_value()) {
    spdlog::error("Last anchor names unknown batch {}", to_hex(root.value()));
    return error_code::integrity_error;
  }
  return code;
}

error_code anchor_store::list_all(std::vector<batch_record_t>& batches) const {
  auto rows = std::vector<chronicle::storage::key_value_entry_t>{};
  auto prefix = make_bytes(chronicle::schema::key::kBatchKeyPrefix);
  auto status = storage_.list_by_prefix(view(prefix), rows);
  if (status != storage_status::ok) {
    return to_error(status);
  }
  for (const auto& [key, value] : rows) {
    auto batch =
        chronicle::schema::encoding::scale::decode_batch_record(view(value));
    if (!batch.has_value()) {
      spdlog::error("Undecodable batch row");
      return error_code::integrity_error;
    }
    batches.push_back(std::move(batch.value()));
  }
  std::sort(std::begin(batches), std::end(batches),
            [](const batch_record_t& lhs, const batch_record_t& rhs) {
              return lhs.closed_at < rhs.closed_at;
            });
  return error_code::ok;
}

void anchor_store::stage_import(const std::vector<batch_record_t>& batches,
                                chronicle::storage::write_set& writes) const {
  const batch_record_t* latest = nullptr;
  for (const auto& batch : batches) {
    stage_batch_row(batch, writes);
    auto anchored = batch.state == batch_state_t::submitted ||
                    batch.state == batch_state_t::confirmed;
    if (anchored && (latest == nullptr || batch.closed_at >= latest->closed_at)) {
      latest = &batch;
    }
  }
  if (latest != nullptr) {
    writes.put(make_bytes(chronicle::schema::key::kLastAnchorKey),
               make_bytes(bytes_view_t{latest->root}));
  }
}

operation_result_t anchor_store::transition(const root_t& root,
                                            const batch_state_t target,
                                            const mutator_t& mutate,
                                            const bool record_last_anchor) {
  auto lock = std::scoped_lock{mutex_};
  auto existing = std::optional<batch_record_t>{};
  auto code = get_batch(root, existing);
  if (code != error_code::ok) {
    return fail(code, "failed to read batch");
  }
  return apply_transition(root, existing, target, mutate, record_last_anchor);
}

operation_result_t anchor_store::apply_transition(
    const root_t& root,
    std::optional<batch_record_t>& existing,
    const batch_state_t target,
    const mutator_t& mutate,
    const bool record_last_anchor) {
  if (!existing.has_value()) {
    return fail(error_code::batch_missing, "unknown batch");
  }
  auto from = existing->state;
  if (!is_valid_transition(from, target)) {
    spdlog::warn("Rejected batch {} transition {} -> {}", to_hex(root),
                 to_string(from), to_string(target));
    return fail(error_code::invalid_transition,
                std::string{"cannot move from "} + std::string{to_string(from)} +
                    " to " + std::string{to_string(target)});
  }

  auto writes = chronicle::storage::write_set{};
  writes.erase(chronicle::schema::key::make_batch_state_key(
      from, existing->closed_at, root));
  mutate(existing.value());
  existing->state = target;
  stage_batch_row(existing.value(), writes);
  if (record_last_anchor) {
    writes.put(make_bytes(chronicle::schema::key::kLastAnchorKey),
               make_bytes(bytes_view_t{root}));
  }

  auto code = to_error(storage_.commit(writes));
  if (code != error_code::ok) {
    return fail(code, "failed to persist batch transition");
  }
  spdlog::info("Batch {} {} -> {}", to_hex(root), to_string(from),
               to_string(target));
  return operation_result_t{.codespace = std::string{kCodespace}};
}

error_code anchor_store::list_state(const batch_state_t state,
                                    std::vector<root_t>& roots) const {
  auto rows = std::vector<chronicle::storage::key_value_entry_t>{};
  auto prefix = chronicle::schema::key::make_batch_state_prefix(state);
  auto status = storage_.list_by_prefix(view(prefix), rows);
  if (status != storage_status::ok) {
    return to_error(status);
  }
  for (const auto& [key, value] : rows) {
    auto root = chronicle::schema::key::parse_batch_state_key(view(key));
    if (!root.has_value()) {
      spdlog::error("Malformed batch state index key");
      return error_code::integrity_error;
    }
    roots.push_back(root.value());
  }
  return error_code::ok;
}

}  // namespace chronicle::store
