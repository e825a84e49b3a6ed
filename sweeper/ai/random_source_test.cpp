#include "sweeper/ai/random_source.h"

#include <set>
#include <vector>

#include "gtest/gtest.h"

namespace sweeper {
namespace ai {
namespace {

TEST(RandomSourceTest, StaysInRange) {
  auto random = NewRandomSource(7);
  std::set<std::size_t> seen;
  for (int i = 0; i < 1000; ++i) {
    const std::size_t index = random->Uniform(5);
    ASSERT_LT(index, 5u);
    seen.insert(index);
  }
  EXPECT_EQ(5u, seen.size());
}

TEST(RandomSourceTest, SingleChoice) {
  auto random = NewRandomSource(7);
  EXPECT_EQ(0u, random->Uniform(1));
}

TEST(RandomSourceTest, SameSeedSameSequence) {
  auto a = NewRandomSource(42);
  auto b = NewRandomSource(42);
  std::vector<std::size_t> sequence_a;
  std::vector<std::size_t> sequence_b;
  for (int i = 0; i < 20; ++i) {
    sequence_a.push_back(a->Uniform(100));
    sequence_b.push_back(b->Uniform(100));
  }
  EXPECT_EQ(sequence_a, sequence_b);
}

}  // namespace
}  // namespace ai
}  // namespace sweeper
