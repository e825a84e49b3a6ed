#include "sweeper/ai/sentence.h"

#include <algorithm>
#include <iterator>
#include <ostream>

namespace sweeper {
namespace ai {

std::set<Cell> Sentence::KnownMines() const {
  if (count_ != 0 && static_cast<std::size_t>(count_) == cells_.size()) {
    return cells_;
  }
  return std::set<Cell>();
}

std::set<Cell> Sentence::KnownSafes() const {
  if (count_ == 0) {
    return cells_;
  }
  return std::set<Cell>();
}

void Sentence::MarkMine(const Cell& cell) {
  if (cells_.erase(cell) != 0) {
    --count_;
  }
}

void Sentence::MarkSafe(const Cell& cell) { cells_.erase(cell); }

bool Sentence::IsSubsetOf(const Sentence& other) const {
  return std::includes(other.cells_.begin(), other.cells_.end(),
                       cells_.begin(), cells_.end());
}

Sentence Sentence::Subtract(const Sentence& other) const {
  std::set<Cell> cells;
  std::set_difference(other.cells_.begin(), other.cells_.end(),
                      cells_.begin(), cells_.end(),
                      std::inserter(cells, cells.end()));
  return Sentence(std::move(cells), other.count_ - count_);
}

std::ostream& operator<<(std::ostream& out, const Sentence& sentence) {
  out << '{';
  const char* separator = "";
  for (const Cell& cell : sentence.GetCells()) {
    out << separator << cell;
    separator = ", ";
  }
  return out << "} = " << sentence.GetCount();
}

}  // namespace ai
}  // namespace sweeper
