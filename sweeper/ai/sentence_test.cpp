#include "sweeper/ai/sentence.h"

#include <set>
#include <sstream>

#include "gtest/gtest.h"

namespace sweeper {
namespace ai {
namespace {

const std::set<Cell> kCells{{0, 0}, {0, 1}, {0, 2}};

TEST(SentenceTest, KnownMinesWhenCountMatchesSize) {
  EXPECT_EQ(kCells, Sentence(kCells, 3).KnownMines());
  EXPECT_TRUE(Sentence(kCells, 2).KnownMines().empty());
  EXPECT_TRUE(Sentence(kCells, 0).KnownMines().empty());
}

TEST(SentenceTest, EmptySentenceHasNoKnownMines) {
  EXPECT_TRUE(Sentence().KnownMines().empty());
  EXPECT_TRUE(Sentence().IsEmpty());
}

TEST(SentenceTest, KnownSafesWhenCountIsZero) {
  EXPECT_EQ(kCells, Sentence(kCells, 0).KnownSafes());
  EXPECT_TRUE(Sentence(kCells, 1).KnownSafes().empty());
  EXPECT_TRUE(Sentence(kCells, 3).KnownSafes().empty());

  // An empty sentence yields its (empty) cell set.
  EXPECT_TRUE(Sentence().KnownSafes().empty());
}

TEST(SentenceTest, MarkMineRemovesCellAndDecrementsCount) {
  Sentence sentence(kCells, 2);
  sentence.MarkMine(Cell{0, 1});
  EXPECT_EQ((std::set<Cell>{{0, 0}, {0, 2}}), sentence.GetCells());
  EXPECT_EQ(1, sentence.GetCount());
}

TEST(SentenceTest, MarkSafeRemovesCellAndKeepsCount) {
  Sentence sentence(kCells, 2);
  sentence.MarkSafe(Cell{0, 1});
  EXPECT_EQ((std::set<Cell>{{0, 0}, {0, 2}}), sentence.GetCells());
  EXPECT_EQ(2, sentence.GetCount());
  EXPECT_EQ(sentence.GetCells(), sentence.KnownMines());
}

TEST(SentenceTest, MarkingAbsentCellIsNoOp) {
  Sentence sentence(kCells, 2);
  sentence.MarkMine(Cell{5, 5});
  sentence.MarkSafe(Cell{4, 4});
  EXPECT_EQ(Sentence(kCells, 2), sentence);
}

TEST(SentenceTest, MarkMineTwiceIsSameAsOnce) {
  Sentence once(kCells, 2);
  once.MarkMine(Cell{0, 0});
  Sentence twice(kCells, 2);
  twice.MarkMine(Cell{0, 0});
  twice.MarkMine(Cell{0, 0});
  EXPECT_EQ(once, twice);
}

TEST(SentenceTest, Consistency) {
  EXPECT_TRUE(Sentence().IsConsistent());
  EXPECT_TRUE(Sentence(kCells, 0).IsConsistent());
  EXPECT_TRUE(Sentence(kCells, 3).IsConsistent());
  EXPECT_FALSE(Sentence(kCells, 4).IsConsistent());
  EXPECT_FALSE(Sentence(kCells, -1).IsConsistent());
  EXPECT_FALSE(Sentence(std::set<Cell>(), 1).IsConsistent());
}

TEST(SentenceTest, Equality) {
  EXPECT_EQ(Sentence(kCells, 1), Sentence(kCells, 1));
  EXPECT_NE(Sentence(kCells, 1), Sentence(kCells, 2));
  EXPECT_NE(Sentence(kCells, 1), Sentence({{0, 0}}, 1));
}

TEST(SentenceTest, OrderingIsStrict) {
  const Sentence a({{0, 0}}, 1);
  const Sentence b({{0, 1}}, 1);
  const Sentence c({{0, 0}}, 0);
  EXPECT_TRUE(a < b || b < a);
  EXPECT_TRUE(c < a);
  EXPECT_FALSE(a < a);
}

TEST(SentenceTest, SubsetDifference) {
  const Sentence small({{0, 0}, {0, 1}}, 1);
  const Sentence large(kCells, 2);
  EXPECT_TRUE(small.IsSubsetOf(large));
  EXPECT_FALSE(large.IsSubsetOf(small));
  EXPECT_TRUE(Sentence().IsSubsetOf(small));
  EXPECT_EQ(Sentence({{0, 2}}, 1), small.Subtract(large));
}

TEST(SentenceTest, Print) {
  std::ostringstream out;
  out << Sentence({{0, 1}, {1, 0}}, 1);
  EXPECT_EQ("{(0, 1), (1, 0)} = 1", out.str());
}

}  // namespace
}  // namespace ai
}  // namespace sweeper
