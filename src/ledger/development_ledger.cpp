#include <spdlog/spdlog.h>
#include <chronicle/blake3/hash.hpp>
#include <chronicle/common/critical.hpp>
#include <chronicle/ledger/development_ledger.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/key/builder.hpp>

#include <tuple>
#include <utility>
#include <vector>

using namespace chronicle::schema;

namespace {

// (root, height, submitted_at)
using transaction_tuple_t = std::tuple<root_t, int64_t, int64_t>;

using storage_status = chronicle::storage::storage_status;

bytes_t make_transaction_key(const std::string_view tx_id) {
  return chronicle::schema::key::builder{}
      .write(chronicle::ledger::kDevelopmentLedgerKeyPrefix)
      .write(tx_id)
      .data;
}

}  // namespace

namespace chronicle::ledger {

development_ledger::development_ledger(
    chronicle::storage::rocksdb_storage_t& storage,
    clock_fn_t clock,
    const int64_t confirm_after)
    : storage_{storage},
      clock_{std::move(clock)},
      confirm_after_{confirm_after} {
  auto rows = std::vector<chronicle::storage::key_value_entry_t>{};
  auto prefix = make_bytes(kDevelopmentLedgerKeyPrefix);
  if (storage_.list_by_prefix(bytes_view_t{prefix}, rows) !=
      storage_status::ok) {
    chronicle::common::critical("failed to load development ledger");
  }
  next_height_ = static_cast<int64_t>(rows.size()) + 1;
  spdlog::debug("Development ledger holds {} transactions", rows.size());
}

submit_result development_ledger::submit(const root_t& root) {
  auto lock = std::scoped_lock{mutex_};
  auto height = next_height_;

  auto preimage = chronicle::schema::key::builder{};
  preimage.write(root);
  preimage.write(static_cast<uint64_t>(height));
  auto tx_id = to_hex(chronicle::blake3::hash(bytes_view_t{preimage.data}));

  auto encoder = chronicle::schema::encoding::scale_encoder_t{};
  auto writes = chronicle::storage::write_set{};
  writes.put(make_transaction_key(tx_id),
             encoder.encode(transaction_tuple_t{root, height, clock_()}));
  if (storage_.commit(writes) != storage_status::ok) {
    return submit_result{.code = to_code(error_code::ledger_unavailable),
                         .log = "development ledger could not record "
                                "the transaction"};
  }
  ++next_height_;

  spdlog::info("Development ledger accepted {} as {} at height {}",
               to_hex(root), tx_id, height);
  return submit_result{.tx_id = std::move(tx_id)};
}

query_result development_ledger::query(const std::string& tx_id) const {
  auto raw = bytes_t{};
  auto key = make_transaction_key(tx_id);
  auto status = storage_.get(bytes_view_t{key}, raw);
  if (status == storage_status::not_found) {
    return query_result{.code = to_code(error_code::ledger_unavailable),
                        .log = "unknown transaction"};
  }
  if (status != storage_status::ok) {
    return query_result{.code = to_code(error_code::ledger_unavailable),
                        .log = "development ledger storage unavailable"};
  }
  auto encoder = chronicle::schema::encoding::scale_encoder_t{};
  auto transaction =
      encoder.try_decode<transaction_tuple_t>(bytes_view_t{raw});
  if (!transaction.has_value()) {
    spdlog::error("Undecodable development ledger transaction {}", tx_id);
    return query_result{.code = to_code(error_code::ledger_unavailable),
                        .log = "undecodable transaction"};
  }

  const auto& [root, height, submitted_at] = transaction.value();
  if (clock_() - submitted_at < confirm_after_) {
    return query_result{};
  }
  return query_result{.confirmed = true,
                      .height = height,
                      .timestamp = submitted_at + confirm_after_};
}

ledger_client development_ledger::client() {
  return ledger_client{
      .submit = [this](const root_t& root) { return submit(root); },
      .query = [this](const std::string& tx_id) { return query(tx_id); }};
}

}  // namespace chronicle::ledger
