#include "sweeper/game/board.h"

#include <functional>
#include <ostream>
#include <random>
#include <string>

#include "sweeper/game/grid.h"

namespace sweeper {

namespace {

class BoardImpl : public Board {
 public:
  BoardImpl(std::size_t rows, std::size_t cols) : grid_(rows, cols) {}

  ~BoardImpl() final = default;

  // Places a mine on the cell.
  //
  // Returns false if the cell was already a mine.
  bool SetMine(const Cell& cell) {
    Square& square = grid_(cell);
    if (square.is_mine) {
      return false;
    }
    square.is_mine = true;
    mines_.insert(cell);
    return true;
  }

  std::size_t GetRows() const final { return grid_.GetRows(); }

  std::size_t GetCols() const final { return grid_.GetCols(); }

  std::size_t GetMines() const final { return mines_.size(); }

  bool IsMine(const Cell& cell) const final {
    return grid_.IsValid(cell) && grid_(cell).is_mine;
  }

  std::size_t AdjacentMines(const Cell& cell) const final {
    return grid_.ForEachAdjacent(
        cell, [this](const Cell& adjacent) { return grid_(adjacent).is_mine; });
  }

  bool IsWon(const std::unordered_set<Cell>& flagged) const final {
    return flagged == mines_;
  }

  void Print(std::ostream& out) const final {
    const std::string separator(2 * grid_.GetCols() + 1, '-');
    for (std::size_t row = 0; row < grid_.GetRows(); ++row) {
      out << separator << '\n';
      for (std::size_t col = 0; col < grid_.GetCols(); ++col) {
        out << (grid_(Cell{row, col}).is_mine ? "|X" : "| ");
      }
      out << "|\n";
    }
    out << separator << '\n';
  }

 private:
  struct Square {
    bool is_mine = false;
  };

  Grid<Square> grid_;
  std::unordered_set<Cell> mines_;
};

}  // namespace

std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                std::size_t mines, unsigned seed) {
  if (rows == 0 || cols == 0 || mines >= rows * cols) {
    return nullptr;
  }

  std::unique_ptr<BoardImpl> board(new BoardImpl(rows, cols));

  std::default_random_engine g;
  g.seed(seed);
  std::uniform_int_distribution<std::size_t> d(0, rows * cols - 1);
  auto rng = std::bind(d, g);

  for (std::size_t remaining_mines = mines; remaining_mines > 0;) {
    const std::size_t rnd = rng();
    if (board->SetMine(Cell{rnd / cols, rnd % cols})) {
      --remaining_mines;
    }
  }
  return std::move(board);
}

std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                const std::vector<Cell>& mines) {
  if (rows == 0 || cols == 0) {
    return nullptr;
  }

  std::unique_ptr<BoardImpl> board(new BoardImpl(rows, cols));
  for (const Cell& cell : mines) {
    if (cell.row >= rows || cell.col >= cols) {
      return nullptr;
    }
    board->SetMine(cell);
  }

  if (board->GetMines() >= rows * cols) {
    return nullptr;
  }
  return std::move(board);
}

}  // namespace sweeper
