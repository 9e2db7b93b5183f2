#include <gtest/gtest.h>
#include <vigil/queue/commitment.hpp>
#include <vigil/testing/engine_fixture.hpp>

using vigil::schema::queue_error_code;
using vigil::testing::engine_fixture;
using vigil::testing::make_action;
using vigil::testing::make_identity;

TEST(engine_persistence, restart_restores_queue_state) {
  auto fixture = engine_fixture{"vigil_persist_state"};
  auto proposer = fixture.add_proposer();
  auto admin = fixture.administrator();
  {
    auto& engine = fixture.engine();
    ASSERT_TRUE(engine.set_cooldown(admin, 42).ok());
    ASSERT_TRUE(engine.enqueue_action(proposer, make_action(1)).ok());
    ASSERT_TRUE(engine.enqueue_action(proposer, make_action(2)).ok());
    ASSERT_TRUE(engine
                    .enqueue_secret(proposer, vigil::testing::make_hash(3),
                                    "memo")
                    .ok());
    ASSERT_TRUE(engine.veto_up_to_and_approve(admin, 1, 1).ok());
  }
  auto before = fixture.engine().state();

  fixture.restart();
  auto& engine = fixture.engine();
  EXPECT_TRUE(engine.restored());
  EXPECT_FALSE(engine.setup_event().has_value());
  EXPECT_EQ(engine.cursor(), before.cursor);
  EXPECT_EQ(engine.tail(), 3u);
  EXPECT_EQ(engine.approved_count(), 1u);
  EXPECT_EQ(engine.salt_counter(), 1u);
  EXPECT_EQ(engine.cooldown(), 42u);
  EXPECT_EQ(engine.commitment_at(1),
            vigil::queue::commitment_hash(make_action(2)));
  EXPECT_EQ(engine.created_at_of(2), vigil::testing::kStartTime);
  EXPECT_TRUE(engine.is_proposer(proposer));

  EXPECT_TRUE(engine.execute_next(make_action(2)).ok());
  EXPECT_EQ(engine.approved_count(), 0u);
}

TEST(engine_persistence, restart_ignores_new_configuration) {
  auto fixture = engine_fixture{"vigil_persist_config"};
  auto config = fixture.config();
  config.administrator = make_identity(0x66);
  config.cooldown = 999;
  config.expiration = 0;

  fixture.restart(config);
  auto& engine = fixture.engine();
  EXPECT_EQ(engine.administrator(), fixture.administrator());
  EXPECT_EQ(engine.cooldown(), 0u);
  EXPECT_EQ(engine.expiration(), 0x1337u);
}

TEST(engine_persistence, restart_keeps_cursor_after_failed_execution) {
  auto fixture = engine_fixture{"vigil_persist_failure"};
  auto proposer = fixture.add_proposer();
  ASSERT_TRUE(fixture.engine().enqueue_action(proposer, make_action(1)).ok());
  fixture.fail_executions(true);
  ASSERT_TRUE(fixture.engine().execute_next(make_action(1)).failed_with(
      queue_error_code::execution_failed));

  fixture.restart();
  EXPECT_EQ(fixture.engine().cursor(), 1u);
  EXPECT_EQ(fixture.engine().tail(), 1u);
}

TEST(engine_persistence, restart_preserves_proposer_order) {
  auto fixture = engine_fixture{"vigil_persist_registry"};
  for (uint8_t seed = 1; seed <= 4; ++seed) {
    fixture.add_proposer(seed);
  }
  ASSERT_TRUE(fixture.engine()
                  .deregister_proposer(fixture.administrator(), make_identity(4),
                                       make_identity(3))
                  .ok());
  auto sentinel = vigil::schema::make_sentinel_identity();
  auto before = fixture.engine().list_proposers(sentinel, 10).proposers;

  fixture.restart();
  auto after = fixture.engine().list_proposers(sentinel, 10);
  EXPECT_EQ(after.proposers, before);
  ASSERT_EQ(after.proposers.size(), 3u);
  EXPECT_EQ(after.proposers[0], make_identity(4));
  EXPECT_EQ(after.proposers[1], make_identity(2));
  EXPECT_TRUE(vigil::schema::is_sentinel_identity(after.next));
}

TEST(engine_persistence, rejected_operations_write_nothing) {
  auto fixture = engine_fixture{"vigil_persist_rejected"};
  auto proposer = fixture.add_proposer();
  ASSERT_TRUE(
      fixture.engine().enqueue(proposer, vigil::testing::make_hash(1)).ok());
  auto stored = fixture.storage().load_queue_state();
  ASSERT_TRUE(stored.has_value());

  auto admin = fixture.administrator();
  EXPECT_FALSE(fixture.engine().veto_up_to_and_approve(admin, 1, 1).ok());
  EXPECT_FALSE(fixture.engine().set_expiration(admin, 1).ok());
  EXPECT_FALSE(fixture.engine().execute_next(make_action(9)).ok());

  auto after = fixture.storage().load_queue_state();
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->cursor, stored->cursor);
  EXPECT_EQ(after->approved, stored->approved);
  EXPECT_EQ(after->expiration, stored->expiration);
}
