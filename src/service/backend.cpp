#include <spdlog/spdlog.h>
#include <chronicle/common/critical.hpp>
#include <chronicle/merkle/tree.hpp>
#include <chronicle/service/backend.hpp>

#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

using namespace chronicle::schema;

namespace {

constexpr auto kCodespace = std::string_view{"chronicle.backend"};

}  // namespace

namespace chronicle::service {

backend::backend(chronicle::storage::rocksdb_storage_t& storage,
                 chronicle::ledger::ledger_client ledger,
                 chronicle::anchor::clock_fn_t clock,
                 backend_options options)
    : options_{options},
      storage_{storage},
      digests_{storage, options.flush_period},
      anchors_{storage},
      context_{storage, digests_, anchors_, std::move(ledger), std::move(clock),
               options.flush_period},
      engine_{context_},
      reconciler_{context_} {
  if (options_.flush_offset.count() < 0 ||
      options_.flush_offset >= options_.flush_period) {
    chronicle::common::critical(
        "flush offset {}s must lie within the flush period of {}s",
        options_.flush_offset.count(), options_.flush_period.count());
  }
}

put_result_t backend::put(const digest_t& digest) {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  return digests_.put(digest, context_.clock());
}

lookup_result_t backend::lookup(const digest_t& digest) const {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  auto result = lookup_result_t{};
  result.codespace = std::string{kCodespace};
  result.digest = digest;

  auto record = std::optional<digest_record_t>{};
  auto code = digests_.lookup(digest, record);
  if (code != error_code::ok) {
    result.code = to_code(code);
    result.log = "failed reading digest";
    return result;
  }
  if (!record.has_value()) {
    return result;
  }
  result.found = true;
  result.submitted_at = record->submitted_at;
  result.collection = record->collection;
  result.batch = record->batch;
  if (!record->batch.has_value()) {
    return result;
  }

  auto batch = std::optional<batch_record_t>{};
  code = anchors_.get_batch(record->batch.value(), batch);
  if (code == error_code::ok && !batch.has_value()) {
    spdlog::error("Digest {} references missing batch {}", to_hex(digest),
                  to_hex(record->batch.value()));
    code = error_code::integrity_error;
  }
  if (code != error_code::ok) {
    result.code = to_code(code);
    result.log = "failed reading batch";
    return result;
  }
  result.state = batch->state;
  result.tx_id = batch->tx_id;
  result.confirmed_height = batch->confirmed_height;
  result.confirmed_at = batch->confirmed_at;

  auto index = chronicle::merkle::index_of(batch->members, digest);
  auto proof = index.has_value()
                   ? chronicle::merkle::proof(batch->members, index.value())
                   : std::nullopt;
  if (!proof.has_value()) {
    result.code = to_code(error_code::integrity_error);
    result.log = "digest is not a member of its batch";
    return result;
  }
  result.proof = std::move(proof.value());
  return result;
}

collection_result_t backend::collection(
    const timestamp_seconds_t timestamp) const {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  auto result = collection_result_t{};
  result.codespace = std::string{kCodespace};
  if (!options_.enable_collections) {
    result.code = to_code(error_code::unsupported);
    result.log = "collections are disabled";
    return result;
  }
  result.collection = digests_.collection_of(timestamp);
  auto code = digests_.collection(result.collection, result.digests);
  if (code != error_code::ok) {
    result.code = to_code(code);
    result.log = "failed reading collection";
    result.digests.clear();
  }
  return result;
}

last_anchor_result_t backend::last_anchor() const {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  auto result = last_anchor_result_t{};
  result.codespace = std::string{kCodespace};
  auto code = anchors_.last_anchor(result.batch);
  if (code != error_code::ok) {
    result.code = to_code(code);
    result.log = "failed reading last anchor";
    result.batch.reset();
  }
  return result;
}

flush_result_t backend::flush() {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  return engine_.flush();
}

fsck_report_t backend::fsck(const fsck_options& options) {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  return reconciler_.run(options);
}

operation_result_t backend::purge(const digest_t& digest) {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  auto code = error_code::ok;
  {
    auto lock = std::scoped_lock{context_.flush_mutex};
    code = digests_.purge(digest);
  }
  if (code == error_code::invalid_argument) {
    return make_operation_result(code, "unknown digest", kCodespace);
  }
  if (code == error_code::integrity_error) {
    return make_operation_result(code, "digest already anchored", kCodespace);
  }
  return make_operation_result(code, {}, kCodespace);
}

void backend::start() {
  if (closed_) {
    spdlog::warn("Ignoring start of a closed backend");
    return;
  }
  if (!scheduler_) {
    scheduler_ = std::make_unique<chronicle::anchor::scheduler>(
        engine_, context_.clock, options_.flush_period, options_.flush_offset);
  }
  scheduler_->start();
}

void backend::close() {
  if (closed_.exchange(true)) {
    return;
  }
  if (scheduler_) {
    scheduler_->stop();
  }
  auto lifecycle = std::unique_lock{lifecycle_mutex_};
  auto lock = std::scoped_lock{context_.flush_mutex};
  storage_.close();
  spdlog::info("Backend closed");
}

const backend_options& backend::options() const {
  return options_;
}

}  // namespace chronicle::service
