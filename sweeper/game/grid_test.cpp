#include "sweeper/game/grid.h"

#include <set>
#include <sstream>
#include <unordered_set>
#include <vector>

#include "gtest/gtest.h"
#include "sweeper/game/cell.h"

namespace sweeper {
namespace {

TEST(CellTest, EqualityAndOrdering) {
  EXPECT_EQ((Cell{1, 2}), (Cell{1, 2}));
  EXPECT_NE((Cell{1, 2}), (Cell{2, 1}));
  EXPECT_LT((Cell{0, 5}), (Cell{1, 0}));
  EXPECT_LT((Cell{1, 0}), (Cell{1, 1}));
  EXPECT_FALSE((Cell{1, 1}) < (Cell{1, 1}));
}

TEST(CellTest, Hashing) {
  std::unordered_set<Cell> cells;
  cells.insert(Cell{0, 1});
  cells.insert(Cell{1, 0});
  cells.insert(Cell{0, 1});
  EXPECT_EQ(2u, cells.size());
  EXPECT_EQ(1u, cells.count(Cell{1, 0}));
}

TEST(CellTest, Print) {
  std::ostringstream out;
  out << Cell{3, 7};
  EXPECT_EQ("(3, 7)", out.str());
}

TEST(GridTest, ValuesAreDefaultConstructed) {
  Grid<int> grid(2, 3);
  EXPECT_EQ(2u, grid.GetRows());
  EXPECT_EQ(3u, grid.GetCols());
  EXPECT_EQ(6u, grid.GetSize());
  grid(Cell{1, 2}) = 7;
  EXPECT_EQ(7, grid(Cell{1, 2}));
  EXPECT_EQ(0, grid(Cell{0, 0}));

  grid.Reset(1, 1);
  EXPECT_EQ(0, grid(Cell{0, 0}));
}

TEST(GridTest, IsValid) {
  Grid<int> grid(2, 3);
  EXPECT_TRUE(grid.IsValid(Cell{1, 2}));
  EXPECT_FALSE(grid.IsValid(Cell{2, 0}));
  EXPECT_FALSE(grid.IsValid(Cell{0, 3}));
}

TEST(GridTest, ForEachVisitsRowMajor) {
  Grid<int> grid(2, 2);
  std::vector<Cell> visited;
  grid.ForEach([&visited](const Cell& cell, const int&) {
    visited.push_back(cell);
  });
  const std::vector<Cell> expected{{0, 0}, {0, 1}, {1, 0}, {1, 1}};
  EXPECT_EQ(expected, visited);
}

std::set<Cell> Adjacent(const Grid<int>& grid, const Cell& cell) {
  std::set<Cell> cells;
  grid.ForEachAdjacent(cell, [&cells](const Cell& adjacent) {
    cells.insert(adjacent);
    return false;
  });
  return cells;
}

TEST(GridTest, ForEachAdjacentClipsToBounds) {
  Grid<int> grid(3, 3);
  EXPECT_EQ((std::set<Cell>{{0, 1}, {1, 0}, {1, 1}}),
            Adjacent(grid, Cell{0, 0}));
  EXPECT_EQ((std::set<Cell>{{0, 0}, {0, 2}, {1, 0}, {1, 1}, {1, 2}}),
            Adjacent(grid, Cell{0, 1}));
  EXPECT_EQ(8u, Adjacent(grid, Cell{1, 1}).size());
  EXPECT_EQ(0u, Adjacent(Grid<int>(1, 1), Cell{0, 0}).size());
}

TEST(GridTest, ForEachAdjacentCountsTrueResults) {
  Grid<int> grid(3, 3);
  grid(Cell{0, 0}) = 1;
  grid(Cell{2, 2}) = 1;
  EXPECT_EQ(2u, grid.ForEachAdjacent(Cell{1, 1}, [&grid](const Cell& cell) {
    return grid(cell) == 1;
  }));
}

}  // namespace
}  // namespace sweeper
