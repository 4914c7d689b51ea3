#include <spdlog/spdlog.h>
#include <chronicle/merkle/tree.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/encoding/scale/records.hpp>
#include <chronicle/service/backend.hpp>

#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace chronicle::schema;

namespace {

constexpr auto kCodespace = std::string_view{"chronicle.backup"};
constexpr auto kDumpMagic = std::string_view{"chronicle-dump"};
constexpr auto kDumpVersion = uint16_t{1};

// (magic, version, encoded digest records, encoded batch records)
using dump_tuple_t = std::tuple<std::string,
                                uint16_t,
                                std::vector<bytes_t>,
                                std::vector<bytes_t>>;

std::string optional_text(const std::optional<std::string>& value) {
  return value.value_or("-");
}

std::string optional_number(const std::optional<int64_t>& value) {
  return value.has_value() ? std::to_string(value.value()) : "-";
}

void write_human(std::ostream& out,
                 const std::vector<digest_record_t>& digests,
                 const std::vector<batch_record_t>& batches) {
  for (const auto& digest : digests) {
    out << "digest " << to_hex(digest.digest) << " sequence "
        << digest.sequence << " submitted " << digest.submitted_at
        << " collection " << digest.collection << " batch "
        << (digest.batch.has_value() ? to_hex(digest.batch.value())
                                     : std::string{"pending"})
        << '\n';
  }
  for (const auto& batch : batches) {
    out << "batch " << to_hex(batch.root) << " state "
        << to_string(batch.state) << " closed " << batch.closed_at
        << " members " << batch.members.size() << " tx "
        << optional_text(batch.tx_id) << " height "
        << optional_number(batch.confirmed_height) << " confirmed "
        << optional_number(batch.confirmed_at) << " attempts "
        << batch.submit_attempts << '\n';
  }
}

/// Cross-check a decoded dump before anything is written.
operation_result_t validate(const std::vector<digest_record_t>& digests,
                            const std::vector<batch_record_t>& batches) {
  auto by_digest = std::map<digest_t, const digest_record_t*>{};
  auto sequences = std::set<sequence_t>{};
  for (const auto& digest : digests) {
    if (!by_digest.emplace(digest.digest, &digest).second ||
        !sequences.insert(digest.sequence).second) {
      return make_operation_result(
          error_code::integrity_error,
          "duplicate digest or sequence " + to_hex(digest.digest), kCodespace);
    }
  }

  auto members_of = std::map<root_t, std::set<digest_t>>{};
  for (const auto& batch : batches) {
    auto recomputed = chronicle::merkle::root(batch.members);
    if (!recomputed.has_value() || recomputed.value() != batch.root) {
      return make_operation_result(
          error_code::corrupt_batch,
          "root does not match members for " + to_hex(batch.root), kCodespace);
    }
    auto [members, inserted] = members_of.emplace(
        batch.root,
        std::set<digest_t>(std::begin(batch.members), std::end(batch.members)));
    if (!inserted) {
      return make_operation_result(error_code::duplicate_root,
                                   "batch listed twice " + to_hex(batch.root),
                                   kCodespace);
    }
    if (members->second.size() != batch.members.size()) {
      return make_operation_result(
          error_code::corrupt_batch,
          "batch " + to_hex(batch.root) + " repeats a member", kCodespace);
    }
    for (const auto& member : batch.members) {
      auto found = by_digest.find(member);
      if (found == by_digest.end() || found->second->batch != batch.root) {
        return make_operation_result(
            error_code::integrity_error,
            "member " + to_hex(member) + " not linked to " + to_hex(batch.root),
            kCodespace);
      }
    }
  }

  for (const auto& digest : digests) {
    if (!digest.batch.has_value()) {
      continue;
    }
    auto found = members_of.find(digest.batch.value());
    if (found == std::end(members_of)) {
      return make_operation_result(
          error_code::integrity_error,
          "digest " + to_hex(digest.digest) + " references missing batch",
          kCodespace);
    }
    if (!found->second.contains(digest.digest)) {
      return make_operation_result(
          error_code::integrity_error,
          "digest " + to_hex(digest.digest) + " is not listed by its batch",
          kCodespace);
    }
  }
  return make_operation_result(error_code::ok, {}, kCodespace);
}

}  // namespace

namespace chronicle::service {

operation_result_t backend::dump(std::ostream& out, const bool human) {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  auto digests = std::vector<digest_record_t>{};
  auto batches = std::vector<batch_record_t>{};
  {
    auto lock = std::scoped_lock{context_.flush_mutex};
    auto code = digests_.list_all(digests);
    if (code == error_code::ok) {
      code = anchors_.list_all(batches);
    }
    if (code != error_code::ok) {
      return make_operation_result(code, "failed reading store", kCodespace);
    }
  }

  if (human) {
    write_human(out, digests, batches);
  } else {
    auto payload =
        dump_tuple_t{std::string{kDumpMagic}, kDumpVersion, {}, {}};
    for (const auto& digest : digests) {
      std::get<2>(payload).push_back(
          chronicle::schema::encoding::scale::encode_digest_record(digest));
    }
    for (const auto& batch : batches) {
      std::get<3>(payload).push_back(
          chronicle::schema::encoding::scale::encode_batch_record(batch));
    }
    auto encoder = chronicle::schema::encoding::scale_encoder_t{};
    auto encoded = encoder.encode(payload);
    out.write(reinterpret_cast<const char*>(encoded.data()),
              static_cast<std::streamsize>(encoded.size()));
  }
  out.flush();
  if (!out) {
    return make_operation_result(error_code::invalid_argument,
                                 "failed writing dump", kCodespace);
  }
  spdlog::info("Dumped {} digests and {} batches", digests.size(),
               batches.size());
  return make_operation_result(error_code::ok, {}, kCodespace);
}

operation_result_t backend::restore(std::istream& in,
                                    const bool verbose,
                                    const std::string_view target) {
  auto lifecycle = std::shared_lock{lifecycle_mutex_};
  auto raw = bytes_t(std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{});
  auto encoder = chronicle::schema::encoding::scale_encoder_t{};
  auto payload = encoder.try_decode<dump_tuple_t>(bytes_view_t{raw});
  if (!payload.has_value() || std::get<0>(payload.value()) != kDumpMagic) {
    return make_operation_result(error_code::invalid_argument,
                                 "input is not a chronicle dump", kCodespace);
  }
  if (std::get<1>(payload.value()) != kDumpVersion) {
    return make_operation_result(
        error_code::unsupported,
        "unsupported dump version " +
            std::to_string(std::get<1>(payload.value())),
        kCodespace);
  }

  auto digests = std::vector<digest_record_t>{};
  for (const auto& row : std::get<2>(payload.value())) {
    auto record = chronicle::schema::encoding::scale::decode_digest_record(
        bytes_view_t{row});
    if (!record.has_value()) {
      return make_operation_result(error_code::invalid_argument,
                                   "undecodable digest in dump", kCodespace);
    }
    digests.push_back(std::move(record.value()));
  }
  auto batches = std::vector<batch_record_t>{};
  for (const auto& row : std::get<3>(payload.value())) {
    auto record = chronicle::schema::encoding::scale::decode_batch_record(
        bytes_view_t{row});
    if (!record.has_value()) {
      return make_operation_result(error_code::invalid_argument,
                                   "undecodable batch in dump", kCodespace);
    }
    batches.push_back(std::move(record.value()));
  }

  auto checked = validate(digests, batches);
  if (checked.code != 0) {
    spdlog::error("Rejecting dump for {}: {}", target, checked.log);
    return checked;
  }

  {
    auto lock = std::scoped_lock{context_.flush_mutex};
    auto existing_digests = std::vector<digest_record_t>{};
    auto existing_batches = std::vector<batch_record_t>{};
    auto code = digests_.list_all(existing_digests);
    if (code == error_code::ok) {
      code = anchors_.list_all(existing_batches);
    }
    if (code != error_code::ok) {
      return make_operation_result(code, "failed reading store", kCodespace);
    }
    if (!existing_digests.empty() || !existing_batches.empty()) {
      return make_operation_result(error_code::invalid_argument,
                                   "restore target is not empty", kCodespace);
    }

    auto writes = chronicle::storage::write_set{};
    digests_.stage_import(digests, writes);
    anchors_.stage_import(batches, writes);
    if (storage_.commit(writes) != chronicle::storage::storage_status::ok) {
      return make_operation_result(error_code::storage_unavailable,
                                   "failed writing restored rows", kCodespace);
    }
    code = digests_.reload_sequence();
    if (code != error_code::ok) {
      return make_operation_result(code, "failed reloading sequence",
                                   kCodespace);
    }
  }
  spdlog::info("Restored {} digests and {} batches into {}", digests.size(),
               batches.size(), target);

  auto report = reconciler_.run(fsck_options{.verbose = verbose,
                                             .query_ledger = false,
                                             .stuck_multiple =
                                                 options_.stuck_multiple});
  for (const auto& finding : report.findings) {
    if (finding.code != error_code::stuck_digest) {
      return make_operation_result(finding.code,
                                   "restored store failed verification: " +
                                       finding.detail,
                                   kCodespace);
    }
  }
  if (report.code != 0 && report.findings.empty()) {
    return make_operation_result(static_cast<error_code>(report.code),
                                 report.log, kCodespace);
  }
  return make_operation_result(error_code::ok, {}, kCodespace);
}

}  // namespace chronicle::service
