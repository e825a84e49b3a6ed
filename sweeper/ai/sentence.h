#ifndef SWEEPER_AI_SENTENCE_H_
#define SWEEPER_AI_SENTENCE_H_

#include <cstddef>
#include <iosfwd>
#include <set>
#include <utility>

#include "sweeper/game/cell.h"

namespace sweeper {
namespace ai {

// A logical statement about a game: exactly GetCount() of GetCells() are
// mines.
//
// The count is signed so that an inconsistent observation shows up as a
// negative count instead of wrapping around. See IsConsistent.
class Sentence {
 public:
  Sentence() : count_(0) {}

  Sentence(std::set<Cell> cells, int count)
      : cells_(std::move(cells)), count_(count) {}

  const std::set<Cell>& GetCells() const { return cells_; }
  int GetCount() const { return count_; }

  // Returns true if the sentence carries no information, i.e. it is {} = 0.
  bool IsEmpty() const { return cells_.empty() && count_ == 0; }

  // Returns true if 0 <= count <= |cells|.
  //
  // Consistent observations can only ever produce consistent sentences.
  bool IsConsistent() const {
    return count_ >= 0 && static_cast<std::size_t>(count_) <= cells_.size();
  }

  // Returns every cell if all of them must be mines, otherwise nothing.
  std::set<Cell> KnownMines() const;

  // Returns every cell if none of them can be mines, otherwise nothing.
  std::set<Cell> KnownSafes() const;

  // Removes a cell known to be a mine, decrementing the count.
  //
  // Does nothing if the cell is not part of the sentence.
  void MarkMine(const Cell& cell);

  // Removes a cell known to be safe.
  //
  // Does nothing if the cell is not part of the sentence.
  void MarkSafe(const Cell& cell);

  // Returns true if this sentence's cells are a subset of other's cells.
  bool IsSubsetOf(const Sentence& other) const;

  // Returns the sentence (other - this) implied when this is a subset of other.
  Sentence Subtract(const Sentence& other) const;

 private:
  std::set<Cell> cells_;
  int count_;
};

inline bool operator==(const Sentence& a, const Sentence& b) {
  return a.GetCount() == b.GetCount() && a.GetCells() == b.GetCells();
}

inline bool operator!=(const Sentence& a, const Sentence& b) {
  return !(a == b);
}

// Orders sentences by count, then by cells. Used for deduplication.
inline bool operator<(const Sentence& a, const Sentence& b) {
  if (a.GetCount() != b.GetCount()) {
    return a.GetCount() < b.GetCount();
  }
  return a.GetCells() < b.GetCells();
}

// Prints the sentence as {(r, c), ...} = count.
std::ostream& operator<<(std::ostream& out, const Sentence& sentence);

}  // namespace ai
}  // namespace sweeper

#endif  // SWEEPER_AI_SENTENCE_H_
