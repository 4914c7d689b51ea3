#include <gtest/gtest.h>
#include <chronicle/merkle/tree.hpp>
#include <chronicle/store/anchor_store.hpp>
#include <chronicle/testing/backend_fixture.hpp>
#include <chronicle/testing/common.hpp>

#include <future>
#include <vector>

namespace {

using chronicle::schema::batch_state_t;
using chronicle::schema::error_code;
using chronicle::testing::kTestEpoch;
using chronicle::testing::make_hash;

uint32_t code_of(const error_code code) {
  return chronicle::schema::to_code(code);
}

chronicle::schema::batch_record_t read_batch(
    chronicle::store::anchor_store& anchors,
    const chronicle::schema::root_t& root) {
  auto batch = std::optional<chronicle::schema::batch_record_t>{};
  EXPECT_EQ(anchors.get_batch(root, batch), error_code::ok);
  EXPECT_TRUE(batch.has_value());
  return batch.value_or(chronicle::schema::batch_record_t{});
}

}  // namespace

TEST(anchor_store, create_batch_stores_root_of_members) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_create"};
  auto members = std::vector{make_hash(1), make_hash(2), make_hash(3)};
  auto created = fixture.anchors().create_batch(members, kTestEpoch);
  ASSERT_EQ(created.code, 0u);
  EXPECT_EQ(created.root, chronicle::merkle::root(members).value());

  auto batch = read_batch(fixture.anchors(), created.root);
  EXPECT_EQ(batch.members, members);
  EXPECT_EQ(batch.state, batch_state_t::unsubmitted);
  EXPECT_EQ(batch.closed_at, kTestEpoch);
  EXPECT_FALSE(batch.tx_id.has_value());
}

TEST(anchor_store, duplicate_root_is_rejected) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_dup"};
  auto members = std::vector{make_hash(1), make_hash(2)};
  ASSERT_EQ(fixture.anchors().create_batch(members, kTestEpoch).code, 0u);
  auto again = fixture.anchors().create_batch(members, kTestEpoch + 3600);
  EXPECT_EQ(again.code, code_of(error_code::duplicate_root));

  auto all = std::vector<chronicle::schema::batch_record_t>{};
  ASSERT_EQ(fixture.anchors().list_all(all), error_code::ok);
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].closed_at, kTestEpoch);
}

TEST(anchor_store, empty_or_repeated_members_are_invalid) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_invalid"};
  EXPECT_EQ(fixture.anchors().create_batch({}, kTestEpoch).code,
            code_of(error_code::invalid_argument));
  EXPECT_EQ(
      fixture.anchors().create_batch({make_hash(1), make_hash(1)}, kTestEpoch)
          .code,
      code_of(error_code::invalid_argument));
}

TEST(anchor_store, lifecycle_moves_forward_and_records_metadata) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_life"};
  auto root = fixture.anchors().create_batch({make_hash(1)}, kTestEpoch).root;

  ASSERT_EQ(fixture.anchors().mark_submitted(root, "tx1").code, 0u);
  auto submitted = read_batch(fixture.anchors(), root);
  EXPECT_EQ(submitted.state, batch_state_t::submitted);
  EXPECT_EQ(submitted.tx_id, "tx1");
  EXPECT_EQ(submitted.submit_attempts, 1u);

  ASSERT_EQ(fixture.anchors().mark_confirmed(root, 100, kTestEpoch + 700).code,
            0u);
  auto confirmed = read_batch(fixture.anchors(), root);
  EXPECT_EQ(confirmed.state, batch_state_t::confirmed);
  EXPECT_EQ(confirmed.confirmed_height, 100);
  EXPECT_EQ(confirmed.confirmed_at, kTestEpoch + 700);

  auto last = std::optional<chronicle::schema::batch_record_t>{};
  ASSERT_EQ(fixture.anchors().last_anchor(last), error_code::ok);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->root, root);
}

TEST(anchor_store, confirmation_is_idempotent_only_for_same_values) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_confirm"};
  auto root = fixture.anchors().create_batch({make_hash(1)}, kTestEpoch).root;
  ASSERT_EQ(fixture.anchors().mark_submitted(root, "tx1").code, 0u);
  ASSERT_EQ(fixture.anchors().mark_confirmed(root, 100, kTestEpoch).code, 0u);

  EXPECT_EQ(fixture.anchors().mark_confirmed(root, 100, kTestEpoch).code, 0u);
  EXPECT_EQ(fixture.anchors().mark_confirmed(root, 101, kTestEpoch).code,
            code_of(error_code::conflicting_confirmation));
  EXPECT_EQ(read_batch(fixture.anchors(), root).confirmed_height, 100);
}

TEST(anchor_store, concurrent_confirmations_keep_the_first_values) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_race"};
  auto root = fixture.anchors().create_batch({make_hash(1)}, kTestEpoch).root;
  ASSERT_EQ(fixture.anchors().mark_submitted(root, "tx1").code, 0u);

  auto confirmations = std::vector<std::future<uint32_t>>{};
  for (int64_t height = 1; height <= 8; ++height) {
    confirmations.push_back(std::async(std::launch::async, [&, height] {
      return fixture.anchors()
          .mark_confirmed(root, height, kTestEpoch + height)
          .code;
    }));
  }
  auto accepted = 0;
  auto conflicts = 0;
  for (auto& confirmation : confirmations) {
    auto code = confirmation.get();
    if (code == 0u) {
      ++accepted;
    } else if (code == code_of(error_code::conflicting_confirmation)) {
      ++conflicts;
    }
  }
  EXPECT_EQ(accepted, 1);
  EXPECT_EQ(conflicts, 7);

  auto batch = read_batch(fixture.anchors(), root);
  EXPECT_EQ(batch.state, batch_state_t::confirmed);
  ASSERT_TRUE(batch.confirmed_height.has_value());
  EXPECT_EQ(batch.confirmed_at, kTestEpoch + batch.confirmed_height.value());
}

TEST(anchor_store, state_never_regresses_except_into_failed) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_mono"};
  auto root = fixture.anchors().create_batch({make_hash(1)}, kTestEpoch).root;

  EXPECT_EQ(fixture.anchors().mark_confirmed(root, 1, kTestEpoch).code,
            code_of(error_code::invalid_transition));
  EXPECT_EQ(fixture.anchors().mark_retry(root).code,
            code_of(error_code::invalid_transition));

  ASSERT_EQ(fixture.anchors().mark_submitted(root, "tx1").code, 0u);
  EXPECT_EQ(fixture.anchors().mark_submitted(root, "tx2").code,
            code_of(error_code::invalid_transition));
  ASSERT_EQ(fixture.anchors().mark_confirmed(root, 5, kTestEpoch).code, 0u);
  EXPECT_EQ(fixture.anchors().mark_failed(root, "late").code,
            code_of(error_code::invalid_transition));
  EXPECT_EQ(read_batch(fixture.anchors(), root).state,
            batch_state_t::confirmed);
}

TEST(anchor_store, failed_batch_can_only_retry) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_retry"};
  auto root = fixture.anchors().create_batch({make_hash(1)}, kTestEpoch).root;
  ASSERT_EQ(fixture.anchors().mark_failed(root, "node down").code, 0u);
  ASSERT_EQ(fixture.anchors().mark_failed(root, "still down").code, 0u);

  auto failed = read_batch(fixture.anchors(), root);
  EXPECT_EQ(failed.failure_reason, "still down");
  EXPECT_EQ(failed.submit_attempts, 1u);
  EXPECT_EQ(fixture.anchors().mark_submitted(root, "tx1").code,
            code_of(error_code::invalid_transition));

  ASSERT_EQ(fixture.anchors().mark_retry(root).code, 0u);
  ASSERT_EQ(fixture.anchors().mark_submitted(root, "tx1").code, 0u);
  auto submitted = read_batch(fixture.anchors(), root);
  EXPECT_EQ(submitted.submit_attempts, 2u);
  EXPECT_FALSE(submitted.failure_reason.has_value());
}

TEST(anchor_store, state_index_tracks_transitions) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_index"};
  auto first = fixture.anchors().create_batch({make_hash(1)}, kTestEpoch).root;
  auto second =
      fixture.anchors().create_batch({make_hash(2)}, kTestEpoch + 3600).root;
  auto third =
      fixture.anchors().create_batch({make_hash(3)}, kTestEpoch + 7200).root;
  ASSERT_EQ(fixture.anchors().mark_failed(first, "down").code, 0u);
  ASSERT_EQ(fixture.anchors().mark_submitted(third, "tx3").code, 0u);

  auto waiting = std::vector<chronicle::schema::root_t>{};
  ASSERT_EQ(fixture.anchors().awaiting_submission(waiting), error_code::ok);
  ASSERT_EQ(waiting.size(), 2u);
  EXPECT_EQ(waiting[0], first);
  EXPECT_EQ(waiting[1], second);

  auto unconfirmed = std::vector<chronicle::schema::root_t>{};
  ASSERT_EQ(fixture.anchors().unconfirmed(unconfirmed), error_code::ok);
  ASSERT_EQ(unconfirmed.size(), 2u);
  EXPECT_EQ(unconfirmed[0], third);
  EXPECT_EQ(unconfirmed[1], first);
}

TEST(anchor_store, unknown_root_is_batch_missing) {
  auto fixture = chronicle::testing::store_fixture{"chronicle_anchor_missing"};
  EXPECT_EQ(fixture.anchors().mark_submitted(make_hash(7), "tx").code,
            code_of(error_code::batch_missing));
  auto last = std::optional<chronicle::schema::batch_record_t>{};
  ASSERT_EQ(fixture.anchors().last_anchor(last), error_code::ok);
  EXPECT_FALSE(last.has_value());
}
