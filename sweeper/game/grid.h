#ifndef SWEEPER_GAME_GRID_H_
#define SWEEPER_GAME_GRID_H_

#include <cstddef>
#include <vector>

#include "sweeper/game/cell.h"

namespace sweeper {

// Calls the provided function object for each cell of a rows x cols field
// within one row and one column of the given cell, excluding the cell itself.
//
// The function should be callable as:
//   bool v = fn(cell);
//
// Returns the number of function calls that returned true.
template <class Fn>
std::size_t ForEachAdjacent(std::size_t rows, std::size_t cols,
                            const Cell& cell, Fn fn) {
  std::size_t count = 0;
  // Note: This relies on the fact that unsigned underflow is well defined.
  for (std::size_t row = cell.row - 1; row != cell.row + 2; ++row) {
    for (std::size_t col = cell.col - 1; col != cell.col + 2; ++col) {
      const Cell adjacent{row, col};
      if (adjacent != cell && row < rows && col < cols && fn(adjacent)) {
        ++count;
      }
    }
  }
  return count;
}

// A dense two dimensional grid of values addressed by Cell.
template <typename T>
class Grid {
 public:
  Grid() : Grid(0, 0) {}

  Grid(std::size_t rows, std::size_t cols) { Reset(rows, cols); }

  // Discards all values and resizes the grid. Every value is default
  // constructed.
  void Reset(std::size_t rows, std::size_t cols) {
    rows_ = rows;
    cols_ = cols;
    values_.assign(rows * cols, T());
  }

  std::size_t GetRows() const { return rows_; }
  std::size_t GetCols() const { return cols_; }

  // Returns the total number of cells.
  std::size_t GetSize() const { return rows_ * cols_; }

  // Returns true if the cell lies within the grid.
  bool IsValid(const Cell& cell) const {
    return cell.row < rows_ && cell.col < cols_;
  }

  const T& operator()(const Cell& cell) const {
    return values_[cell.row * cols_ + cell.col];
  }

  T& operator()(const Cell& cell) { return values_[cell.row * cols_ + cell.col]; }

  // Calls the provided function object for each cell in row-major order.
  //
  // The function should be callable as:
  //   fn(cell, value);
  template <class Fn>
  void ForEach(Fn fn) const {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        const Cell cell{row, col};
        fn(cell, (*this)(cell));
      }
    }
  }

  // Calls the provided function object for each of the valid adjacent cells.
  // See the free function ForEachAdjacent.
  template <class Fn>
  std::size_t ForEachAdjacent(const Cell& cell, Fn fn) const {
    return sweeper::ForEachAdjacent(rows_, cols_, cell, fn);
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
  std::vector<T> values_;
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_GRID_H_
