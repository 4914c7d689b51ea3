#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/encoding/scale/records.hpp>

#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace chronicle::schema::encoding::scale {

namespace {

using digest_tuple_t = std::tuple<uint16_t,
                                  chronicle::schema::digest_t,
                                  uint64_t,
                                  int64_t,
                                  int64_t,
                                  std::optional<chronicle::schema::root_t>>;

using batch_tuple_t = std::tuple<uint16_t,
                                 chronicle::schema::root_t,
                                 std::vector<chronicle::schema::digest_t>,
                                 uint8_t,
                                 int64_t,
                                 std::optional<std::string>,
                                 std::optional<int64_t>,
                                 std::optional<int64_t>,
                                 std::optional<std::string>,
                                 uint32_t>;

}  // namespace

chronicle::schema::bytes_t encode_digest_record(
    const chronicle::schema::digest_record_t& record) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(digest_tuple_t{record.version, record.digest,
                                       record.sequence, record.submitted_at,
                                       record.collection, record.batch});
}

std::optional<chronicle::schema::digest_record_t> decode_digest_record(
    const chronicle::schema::bytes_view_t& bytes) {
  auto encoder = scale_encoder_t{};
  auto decoded = encoder.try_decode<digest_tuple_t>(bytes);
  if (!decoded.has_value() || std::get<0>(decoded.value()) != 1) {
    return std::nullopt;
  }
  auto& [version, digest, sequence, submitted_at, collection, batch] =
      decoded.value();
  return chronicle::schema::digest_record_t{.version = version,
                                            .digest = digest,
                                            .sequence = sequence,
                                            .submitted_at = submitted_at,
                                            .collection = collection,
                                            .batch = batch};
}

chronicle::schema::bytes_t encode_batch_record(
    const chronicle::schema::batch_record_t& record) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(batch_tuple_t{
      record.version, record.root, record.members,
      static_cast<uint8_t>(record.state), record.closed_at, record.tx_id,
      record.confirmed_height, record.confirmed_at, record.failure_reason,
      record.submit_attempts});
}

std::optional<chronicle::schema::batch_record_t> decode_batch_record(
    const chronicle::schema::bytes_view_t& bytes) {
  auto encoder = scale_encoder_t{};
  auto decoded = encoder.try_decode<batch_tuple_t>(bytes);
  if (!decoded.has_value() || std::get<0>(decoded.value()) != 1) {
    return std::nullopt;
  }
  auto& [version, root, members, raw_state, closed_at, tx_id,
         confirmed_height, confirmed_at, failure_reason, submit_attempts] =
      decoded.value();
  auto state = chronicle::schema::try_make_batch_state(raw_state);
  if (!state.has_value()) {
    return std::nullopt;
  }
  return chronicle::schema::batch_record_t{
      .version = version,
      .root = root,
      .members = std::move(members),
      .state = state.value(),
      .closed_at = closed_at,
      .tx_id = std::move(tx_id),
      .confirmed_height = confirmed_height,
      .confirmed_at = confirmed_at,
      .failure_reason = std::move(failure_reason),
      .submit_attempts = submit_attempts};
}

}  // namespace chronicle::schema::encoding::scale
