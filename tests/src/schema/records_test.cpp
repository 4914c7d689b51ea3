#include <gtest/gtest.h>
#include <chronicle/schema/batch_state.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/encoding/scale/records.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/testing/common.hpp>

#include <tuple>

namespace {

using chronicle::schema::batch_state_t;
using chronicle::testing::make_hash;

chronicle::schema::batch_record_t make_confirmed_batch() {
  return chronicle::schema::batch_record_t{
      .root = make_hash(90),
      .members = {make_hash(1), make_hash(2)},
      .state = batch_state_t::confirmed,
      .closed_at = 1'700'000'000,
      .tx_id = std::string{"tx1"},
      .confirmed_height = 100,
      .confirmed_at = 1'700'000'600,
      .submit_attempts = 2};
}

}  // namespace

TEST(records, digest_record_keeps_every_field) {
  auto record = chronicle::schema::digest_record_t{
      .digest = make_hash(4),
      .sequence = 17,
      .submitted_at = 1'700'000'123,
      .collection = 1'699'999'200,
      .batch = make_hash(50)};
  auto encoded =
      chronicle::schema::encoding::scale::encode_digest_record(record);
  auto decoded = chronicle::schema::encoding::scale::decode_digest_record(
      chronicle::schema::bytes_view_t{encoded});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->digest, record.digest);
  EXPECT_EQ(decoded->sequence, 17u);
  EXPECT_EQ(decoded->submitted_at, record.submitted_at);
  EXPECT_EQ(decoded->collection, record.collection);
  EXPECT_EQ(decoded->batch, record.batch);
}

TEST(records, batch_record_keeps_ledger_metadata) {
  auto batch = make_confirmed_batch();
  auto encoded = chronicle::schema::encoding::scale::encode_batch_record(batch);
  auto decoded = chronicle::schema::encoding::scale::decode_batch_record(
      chronicle::schema::bytes_view_t{encoded});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->root, batch.root);
  EXPECT_EQ(decoded->members, batch.members);
  EXPECT_EQ(decoded->state, batch_state_t::confirmed);
  EXPECT_EQ(decoded->tx_id, batch.tx_id);
  EXPECT_EQ(decoded->confirmed_height, 100);
  EXPECT_EQ(decoded->confirmed_at, batch.confirmed_at);
  EXPECT_FALSE(decoded->failure_reason.has_value());
  EXPECT_EQ(decoded->submit_attempts, 2u);
}

TEST(records, decode_rejects_unknown_version) {
  auto batch = make_confirmed_batch();
  batch.version = 2;
  auto encoded = chronicle::schema::encoding::scale::encode_batch_record(batch);
  EXPECT_FALSE(chronicle::schema::encoding::scale::decode_batch_record(
                   chronicle::schema::bytes_view_t{encoded})
                   .has_value());
}

TEST(records, decode_rejects_truncated_bytes) {
  auto encoded = chronicle::schema::encoding::scale::encode_batch_record(
      make_confirmed_batch());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(chronicle::schema::encoding::scale::decode_batch_record(
                   chronicle::schema::bytes_view_t{encoded})
                   .has_value());
}

TEST(batch_state, transitions_only_move_forward_or_into_failed) {
  using chronicle::schema::is_valid_transition;
  EXPECT_TRUE(is_valid_transition(batch_state_t::unsubmitted,
                                  batch_state_t::submitted));
  EXPECT_TRUE(is_valid_transition(batch_state_t::unsubmitted,
                                  batch_state_t::failed));
  EXPECT_TRUE(is_valid_transition(batch_state_t::submitted,
                                  batch_state_t::confirmed));
  EXPECT_TRUE(is_valid_transition(batch_state_t::submitted,
                                  batch_state_t::failed));
  EXPECT_TRUE(is_valid_transition(batch_state_t::confirmed,
                                  batch_state_t::confirmed));
  EXPECT_TRUE(is_valid_transition(batch_state_t::failed,
                                  batch_state_t::unsubmitted));
  EXPECT_TRUE(is_valid_transition(batch_state_t::failed,
                                  batch_state_t::failed));

  EXPECT_FALSE(is_valid_transition(batch_state_t::submitted,
                                   batch_state_t::unsubmitted));
  EXPECT_FALSE(is_valid_transition(batch_state_t::confirmed,
                                   batch_state_t::failed));
  EXPECT_FALSE(is_valid_transition(batch_state_t::confirmed,
                                   batch_state_t::submitted));
  EXPECT_FALSE(is_valid_transition(batch_state_t::failed,
                                   batch_state_t::submitted));
  EXPECT_FALSE(is_valid_transition(batch_state_t::unsubmitted,
                                   batch_state_t::confirmed));
}

TEST(batch_state, names_map_both_ways) {
  EXPECT_EQ(chronicle::schema::to_string(batch_state_t::submitted),
            "submitted");
  EXPECT_EQ(chronicle::schema::try_from_string<batch_state_t>("failed"),
            batch_state_t::failed);
  EXPECT_FALSE(chronicle::schema::try_make_batch_state(4).has_value());
}

TEST(error_code, codes_are_stable) {
  using chronicle::schema::error_code;
  EXPECT_EQ(chronicle::schema::to_code(error_code::ok), 0u);
  EXPECT_EQ(chronicle::schema::to_code(error_code::duplicate_root), 3u);
  EXPECT_EQ(chronicle::schema::to_string(error_code::stuck_digest),
            "stuck_digest");
  EXPECT_EQ(chronicle::schema::try_from_string<error_code>("corrupt_batch"),
            error_code::corrupt_batch);
}
