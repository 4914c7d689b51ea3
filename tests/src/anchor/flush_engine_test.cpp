#include <gtest/gtest.h>
#include <chronicle/anchor/flush_engine.hpp>
#include <chronicle/merkle/tree.hpp>
#include <chronicle/store/anchor_store.hpp>
#include <chronicle/store/digest_store.hpp>
#include <chronicle/testing/backend_fixture.hpp>
#include <chronicle/testing/common.hpp>

#include <future>
#include <vector>

namespace {

using chronicle::schema::batch_state_t;
using chronicle::schema::error_code;
using chronicle::testing::make_hash;

uint32_t code_of(const error_code code) {
  return chronicle::schema::to_code(code);
}

}  // namespace

TEST(flush_engine, closes_submits_and_confirms_a_batch) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_scenario"};
  auto& backend = fixture.backend();
  auto a = make_hash(10);
  auto b = make_hash(20);
  auto c = make_hash(30);
  ASSERT_EQ(backend.put(a).code, 0u);
  ASSERT_EQ(backend.put(b).code, 0u);
  ASSERT_EQ(backend.put(c).code, 0u);

  fixture.ledger().succeed_next_submit("tx1");
  fixture.clock().advance(3610);
  auto first = backend.flush();
  ASSERT_EQ(first.code, 0u);
  ASSERT_TRUE(first.root.has_value());
  EXPECT_EQ(first.root.value(), chronicle::merkle::root(std::vector{a, b, c}));
  EXPECT_EQ(first.members, 3u);
  EXPECT_EQ(first.submitted, 1u);
  EXPECT_EQ(first.confirmed, 0u);

  auto submitted = backend.lookup(b);
  ASSERT_TRUE(submitted.found);
  EXPECT_EQ(submitted.batch, first.root);
  EXPECT_EQ(submitted.state, batch_state_t::submitted);
  EXPECT_EQ(submitted.tx_id, "tx1");

  auto confirmed_at = fixture.clock().now() + 600;
  fixture.ledger().confirm("tx1", 100, confirmed_at);
  fixture.clock().advance(3600);
  auto second = backend.flush();
  ASSERT_EQ(second.code, 0u);
  EXPECT_FALSE(second.root.has_value());
  EXPECT_EQ(second.confirmed, 1u);

  auto confirmed = backend.lookup(b);
  EXPECT_EQ(confirmed.state, batch_state_t::confirmed);
  EXPECT_EQ(confirmed.confirmed_height, 100);
  EXPECT_EQ(confirmed.confirmed_at, confirmed_at);
  EXPECT_EQ(fixture.ledger().submitted().size(), 1u);
}

TEST(flush_engine, empty_window_creates_no_batch) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_empty"};
  auto result = fixture.backend().flush();
  EXPECT_EQ(result.code, 0u);
  EXPECT_FALSE(result.skipped);
  EXPECT_FALSE(result.root.has_value());
  EXPECT_TRUE(fixture.ledger().submitted().empty());

  auto report = fixture.backend().fsck(
      chronicle::schema::fsck_options{.query_ledger = false});
  EXPECT_EQ(report.batches_checked, 0u);
}

TEST(flush_engine, digests_submitted_after_close_wait_for_next_batch) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_next"};
  auto& backend = fixture.backend();
  ASSERT_EQ(backend.put(make_hash(1)).code, 0u);
  auto first = backend.flush();
  ASSERT_TRUE(first.root.has_value());

  ASSERT_EQ(backend.put(make_hash(2)).code, 0u);
  auto duplicate = backend.put(make_hash(1));
  EXPECT_TRUE(duplicate.already_existed);
  EXPECT_EQ(duplicate.batch, first.root);

  auto second = backend.flush();
  ASSERT_TRUE(second.root.has_value());
  EXPECT_EQ(second.members, 1u);
  EXPECT_EQ(second.root.value(), make_hash(2));
}

TEST(flush_engine, concurrent_tick_is_dropped) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_contend"};
  auto& backend = fixture.backend();
  ASSERT_EQ(backend.put(make_hash(1)).code, 0u);
  ASSERT_EQ(backend.put(make_hash(2)).code, 0u);

  fixture.ledger().hold_submits();
  auto running = std::async(std::launch::async, [&] { return backend.flush(); });
  fixture.ledger().wait_for_submit();

  auto dropped = backend.flush();
  EXPECT_TRUE(dropped.skipped);
  EXPECT_EQ(dropped.code, code_of(error_code::flush_in_progress));
  EXPECT_FALSE(dropped.root.has_value());

  // Submission does not wait for the flush lock.
  EXPECT_EQ(backend.put(make_hash(3)).code, 0u);

  fixture.ledger().release_submits();
  auto finished = running.get();
  ASSERT_EQ(finished.code, 0u);
  ASSERT_TRUE(finished.root.has_value());
  EXPECT_EQ(finished.members, 2u);
  EXPECT_EQ(fixture.ledger().submitted().size(), 1u);

  auto late = backend.lookup(make_hash(3));
  ASSERT_TRUE(late.found);
  EXPECT_FALSE(late.batch.has_value());
}

TEST(flush_engine, failed_submission_is_retried_next_tick) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_retry"};
  auto& backend = fixture.backend();
  ASSERT_EQ(backend.put(make_hash(1)).code, 0u);

  fixture.ledger().fail_next_submit("node unreachable");
  auto first = backend.flush();
  ASSERT_TRUE(first.root.has_value());
  EXPECT_EQ(first.failed, 1u);
  EXPECT_EQ(first.submitted, 0u);
  EXPECT_EQ(backend.lookup(make_hash(1)).state, batch_state_t::failed);

  fixture.ledger().throw_next_submit("deadline exceeded");
  auto second = backend.flush();
  EXPECT_EQ(second.retried, 1u);
  EXPECT_EQ(second.failed, 1u);
  EXPECT_FALSE(second.root.has_value());
  EXPECT_EQ(backend.lookup(make_hash(1)).state, batch_state_t::failed);

  auto third = backend.flush();
  EXPECT_EQ(third.retried, 1u);
  EXPECT_EQ(third.submitted, 1u);
  auto status = backend.lookup(make_hash(1));
  EXPECT_EQ(status.state, batch_state_t::submitted);
  EXPECT_TRUE(status.tx_id.has_value());
  EXPECT_EQ(fixture.ledger().submitted().size(), 3u);
}

TEST(flush_engine, query_failure_leaves_state_unchanged) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_query"};
  auto& backend = fixture.backend();
  ASSERT_EQ(backend.put(make_hash(1)).code, 0u);
  ASSERT_EQ(backend.flush().submitted, 1u);

  fixture.ledger().confirm("tx1", 7, chronicle::testing::kTestEpoch);
  fixture.ledger().fail_queries(true);
  auto result = backend.flush();
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.confirmed, 0u);
  EXPECT_EQ(backend.lookup(make_hash(1)).state, batch_state_t::submitted);

  fixture.ledger().fail_queries(false);
  EXPECT_EQ(backend.flush().confirmed, 1u);
  EXPECT_EQ(backend.lookup(make_hash(1)).state, batch_state_t::confirmed);
}

TEST(flush_engine, uncommitted_batch_leaves_no_trace_after_restart) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_crash"};
  ASSERT_EQ(fixture.backend().put(make_hash(1)).code, 0u);
  ASSERT_EQ(fixture.backend().put(make_hash(2)).code, 0u);

  {
    auto digests = chronicle::store::digest_store{fixture.storage(),
                                                  std::chrono::seconds{3600}};
    auto anchors = chronicle::store::anchor_store{fixture.storage()};
    auto members = std::vector{make_hash(1), make_hash(2)};
    auto writes = chronicle::storage::write_set{};
    auto staged = anchors.stage_batch(members, fixture.clock().now(), writes);
    ASSERT_EQ(staged.code, 0u);
    ASSERT_EQ(digests.stage_assignment(staged.root, members, writes),
              error_code::ok);
    // Process dies before the write set is committed.
  }
  fixture.reopen();

  auto status = fixture.backend().lookup(make_hash(1));
  ASSERT_TRUE(status.found);
  EXPECT_FALSE(status.batch.has_value());
  auto report = fixture.backend().fsck(
      chronicle::schema::fsck_options{.query_ledger = false});
  EXPECT_EQ(report.batches_checked, 0u);
  EXPECT_EQ(report.pending_digests, 2u);
  EXPECT_TRUE(report.findings.empty());

  auto result = fixture.backend().flush();
  ASSERT_TRUE(result.root.has_value());
  EXPECT_EQ(result.members, 2u);
}

TEST(flush_engine, batch_committed_before_crash_is_submitted_after_restart) {
  auto fixture = chronicle::testing::backend_fixture{"chronicle_flush_resume"};
  ASSERT_EQ(fixture.backend().put(make_hash(1)).code, 0u);

  auto members = std::vector{make_hash(1)};
  {
    auto digests = chronicle::store::digest_store{fixture.storage(),
                                                  std::chrono::seconds{3600}};
    auto anchors = chronicle::store::anchor_store{fixture.storage()};
    auto writes = chronicle::storage::write_set{};
    auto staged = anchors.stage_batch(members, fixture.clock().now(), writes);
    ASSERT_EQ(staged.code, 0u);
    ASSERT_EQ(digests.stage_assignment(staged.root, members, writes),
              error_code::ok);
    ASSERT_EQ(fixture.storage().commit(writes),
              chronicle::storage::storage_status::ok);
    // Process dies before the ledger is called.
  }
  fixture.reopen();

  auto report = fixture.backend().fsck(
      chronicle::schema::fsck_options{.query_ledger = false});
  EXPECT_EQ(report.batches_checked, 1u);
  EXPECT_TRUE(report.findings.empty());

  auto result = fixture.backend().flush();
  EXPECT_FALSE(result.root.has_value());
  EXPECT_EQ(result.retried, 1u);
  EXPECT_EQ(result.submitted, 1u);
  EXPECT_EQ(fixture.backend().lookup(make_hash(1)).state,
            batch_state_t::submitted);
}
