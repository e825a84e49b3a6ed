#include "sweeper/ai/agent.h"

#include <algorithm>
#include <ostream>
#include <set>
#include <utility>

#include "sweeper/game/grid.h"

namespace sweeper {
namespace ai {

Agent::Agent(std::size_t rows, std::size_t cols,
             std::unique_ptr<RandomSource> random, std::ostream* trace)
    : rows_(rows), cols_(cols), random_(std::move(random)), trace_(trace) {}

void Agent::MarkMine(const Cell& cell) {
  mines_.insert(cell);
  for (Sentence& sentence : knowledge_) {
    sentence.MarkMine(cell);
  }
}

void Agent::MarkSafe(const Cell& cell) {
  safes_.insert(cell);
  for (Sentence& sentence : knowledge_) {
    sentence.MarkSafe(cell);
  }
}

void Agent::AddKnowledge(const Cell& cell, std::size_t count) {
  moves_made_.insert(cell);
  MarkSafe(cell);

  Sentence sentence = MakeSentence(cell, count);
  if (trace_ != nullptr) {
    *trace_ << "Observed " << cell << ": " << sentence << '\n';
  }
  knowledge_.push_back(std::move(sentence));

  MarkKnownCells();
  InferSubsets();
  PruneEmptySentences();
}

bool Agent::MakeSafeMove(Cell* move) const {
  bool found = false;
  for (const Cell& cell : safes_) {
    if (moves_made_.count(cell) != 0) {
      continue;
    }
    // Take the first candidate in row-major order.
    if (!found || cell < *move) {
      *move = cell;
      found = true;
    }
  }
  return found;
}

bool Agent::MakeRandomMove(Cell* move) {
  std::vector<Cell> candidates;
  for (std::size_t row = 0; row < rows_; ++row) {
    for (std::size_t col = 0; col < cols_; ++col) {
      const Cell cell{row, col};
      if (moves_made_.count(cell) == 0 && mines_.count(cell) == 0) {
        candidates.push_back(cell);
      }
    }
  }
  if (candidates.empty()) {
    return false;
  }
  *move = candidates[random_->Uniform(candidates.size())];
  return true;
}

bool Agent::IsConsistent() const {
  for (const Sentence& sentence : knowledge_) {
    if (!sentence.IsConsistent()) {
      return false;
    }
  }
  for (const Cell& cell : mines_) {
    if (safes_.count(cell) != 0) {
      return false;
    }
  }
  return true;
}

Sentence Agent::MakeSentence(const Cell& cell, std::size_t count) const {
  std::set<Cell> cells;
  int mines = static_cast<int>(count);
  ForEachAdjacent(rows_, cols_, cell,
                  [this, &cells, &mines](const Cell& adjacent) {
                    if (mines_.count(adjacent) != 0) {
                      // Already accounts for one of the adjacent mines.
                      --mines;
                    } else if (safes_.count(adjacent) == 0) {
                      cells.insert(adjacent);
                    }
                    return false;
                  });
  return Sentence(std::move(cells), mines);
}

void Agent::MarkKnownCells() {
  // Marking only shrinks sentences in place, so the knowledge base keeps its
  // size while it is walked.
  for (std::size_t i = 0; i < knowledge_.size(); ++i) {
    const std::set<Cell> mines = knowledge_[i].KnownMines();
    const std::set<Cell> safes = knowledge_[i].KnownSafes();
    for (const Cell& cell : mines) {
      if (trace_ != nullptr && mines_.count(cell) == 0) {
        *trace_ << "Deduced mine " << cell << '\n';
      }
      MarkMine(cell);
    }
    for (const Cell& cell : safes) {
      if (trace_ != nullptr && safes_.count(cell) == 0) {
        *trace_ << "Deduced safe " << cell << '\n';
      }
      MarkSafe(cell);
    }
  }
}

void Agent::InferSubsets() {
  std::set<Sentence> known(knowledge_.begin(), knowledge_.end());
  std::vector<Sentence> inferred;
  for (const Sentence& subset : knowledge_) {
    for (const Sentence& superset : knowledge_) {
      if (subset == superset || !subset.IsSubsetOf(superset)) {
        continue;
      }
      Sentence sentence = subset.Subtract(superset);
      if (!known.insert(sentence).second) {
        continue;
      }
      if (trace_ != nullptr) {
        *trace_ << "Inferred " << sentence << '\n';
      }
      inferred.push_back(std::move(sentence));
    }
  }
  knowledge_.insert(knowledge_.end(), inferred.begin(), inferred.end());
}

void Agent::PruneEmptySentences() {
  knowledge_.erase(std::remove_if(knowledge_.begin(), knowledge_.end(),
                                  [](const Sentence& sentence) {
                                    return sentence.IsEmpty();
                                  }),
                   knowledge_.end());
}

}  // namespace ai
}  // namespace sweeper
