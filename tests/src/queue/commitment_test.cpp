#include <gtest/gtest.h>
#include <vigil/queue/commitment.hpp>
#include <vigil/testing/common.hpp>

#include <set>

using vigil::testing::make_action;

TEST(commitment, hash_is_deterministic) {
  auto action = make_action(7);
  EXPECT_EQ(vigil::queue::commitment_hash(action),
            vigil::queue::commitment_hash(make_action(7)));
  EXPECT_EQ(vigil::queue::commitment_hash(action),
            vigil::queue::commitment_hash(
                action.to, action.value,
                vigil::schema::make_bytes_view(action.payload),
                action.call_type));
}

TEST(commitment, every_field_is_bound) {
  auto base = make_action(7);
  auto seen = std::set<vigil::schema::hash32_t>{};
  seen.insert(vigil::queue::commitment_hash(base));

  auto changed_to = base;
  changed_to.to = vigil::testing::make_identity(8);
  seen.insert(vigil::queue::commitment_hash(changed_to));

  auto changed_value = base;
  changed_value.value += 1;
  seen.insert(vigil::queue::commitment_hash(changed_value));

  auto changed_payload = base;
  changed_payload.payload.push_back(0x00);
  seen.insert(vigil::queue::commitment_hash(changed_payload));

  auto changed_call_type = base;
  changed_call_type.call_type = vigil::schema::call_type_t::delegate_call;
  seen.insert(vigil::queue::commitment_hash(changed_call_type));

  EXPECT_EQ(seen.size(), 5u);
}

TEST(commitment, secret_hash_depends_on_salt) {
  auto action = make_action(3);
  auto first = vigil::queue::secret_commitment_hash(action, 0);
  EXPECT_EQ(first, vigil::queue::secret_commitment_hash(action, 0));
  EXPECT_NE(first, vigil::queue::secret_commitment_hash(action, 1));
}

TEST(commitment, secret_and_plain_hashes_never_coincide) {
  auto action = make_action(3);
  auto plain = vigil::queue::commitment_hash(action);
  for (uint64_t salt = 0; salt < 16; ++salt) {
    EXPECT_NE(plain, vigil::queue::secret_commitment_hash(action, salt));
  }
}

TEST(commitment, empty_payload_hashes) {
  auto action = make_action(1);
  action.payload.clear();
  EXPECT_NE(vigil::queue::commitment_hash(action),
            vigil::schema::make_zero_hash());
  EXPECT_NE(vigil::queue::commitment_hash(action),
            vigil::queue::commitment_hash(make_action(1)));
}
