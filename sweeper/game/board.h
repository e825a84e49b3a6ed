#ifndef SWEEPER_GAME_BOARD_H_
#define SWEEPER_GAME_BOARD_H_

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <unordered_set>
#include <vector>

#include "sweeper/game/cell.h"

namespace sweeper {

// The ground truth of a game: the dimensions of the field and the location of
// every mine.
//
// A Board is a read-only oracle. Nothing that plays a game ever mutates it.
class Board {
 public:
  virtual ~Board() = default;

  // Returns the number of rows.
  virtual std::size_t GetRows() const = 0;

  // Returns the number of columns.
  virtual std::size_t GetCols() const = 0;

  // Returns the number of mines.
  virtual std::size_t GetMines() const = 0;

  // Returns true if the cell contains a mine.
  virtual bool IsMine(const Cell& cell) const = 0;

  // Returns the number of mines within one row and column of the cell, not
  // including the cell itself.
  virtual std::size_t AdjacentMines(const Cell& cell) const = 0;

  // Returns true if the flagged cells are exactly the mines.
  virtual bool IsWon(const std::unordered_set<Cell>& flagged) const = 0;

  // Prints the mine layout.
  virtual void Print(std::ostream& out) const = 0;
};

// Creates a new board with randomly placed mines.
//   rows - The number of rows.
//   cols - The number of columns.
//   mines - The number of mines.
//   seed - Seed for the PRNG to generate the mine locations.
//
// Returns nullptr if either dimension is zero or there would be no cell left
// without a mine.
std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                std::size_t mines, unsigned seed);

// Creates a new board with mines at the given cells.
//
// Returns nullptr if either dimension is zero, a mine lies outside the board,
// or every cell would be a mine.
std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                const std::vector<Cell>& mines);

}  // namespace sweeper

#endif  // SWEEPER_GAME_BOARD_H_
