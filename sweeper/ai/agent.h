#ifndef SWEEPER_AI_AGENT_H_
#define SWEEPER_AI_AGENT_H_

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <unordered_set>
#include <vector>

#include "sweeper/ai/random_source.h"
#include "sweeper/ai/sentence.h"
#include "sweeper/game/cell.h"

namespace sweeper {
namespace ai {

// A player that learns from observations and deduces which cells are safe and
// which are mines.
//
// The agent keeps a knowledge base of Sentences. Every observation adds a
// sentence about the neighbors of the uncovered cell, after which the agent
// performs one round of inference:
//  - Any sentence whose cells must all be mines, or must all be safe, marks
//    those cells throughout the knowledge base.
//  - For any two sentences A and B where A's cells are a subset of B's, the
//    sentence (B - A) = (B.count - A.count) is added if not already known.
//
// Inference is not repeated to a fixed point within a single
// observation. Sentences derived by one observation are acted upon by the
// next.
//
// The agent never touches the board. Observations are supplied by the caller.
class Agent {
 public:
  // Creates an agent for a board of the given dimensions.
  //
  // If trace is not nullptr, a line is written to it for every observation and
  // every new deduction.
  Agent(std::size_t rows, std::size_t cols,
        std::unique_ptr<RandomSource> random, std::ostream* trace = nullptr);

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  std::size_t GetRows() const { return rows_; }
  std::size_t GetCols() const { return cols_; }

  // Marks the cell as a mine in the agent and in every sentence.
  void MarkMine(const Cell& cell);

  // Marks the cell as safe in the agent and in every sentence.
  void MarkSafe(const Cell& cell);

  // Records that the cell was uncovered and that count of its neighbors are
  // mines, then updates the knowledge base.
  void AddKnowledge(const Cell& cell, std::size_t count);

  // Finds a cell known to be safe that has not been played yet.
  //
  // Returns false if there is no such cell.
  bool MakeSafeMove(Cell* move) const;

  // Picks uniformly at random among the cells that have not been played and
  // are not known to be mines.
  //
  // Returns false if there is no such cell.
  bool MakeRandomMove(Cell* move);

  const std::unordered_set<Cell>& GetMovesMade() const { return moves_made_; }
  const std::unordered_set<Cell>& GetSafes() const { return safes_; }
  const std::unordered_set<Cell>& GetMines() const { return mines_; }
  const std::vector<Sentence>& GetKnowledge() const { return knowledge_; }

  // Returns false if any sentence violates 0 <= count <= |cells| or if a cell
  // is known to be both safe and a mine. Only an inconsistent sequence of
  // observations can make this false.
  bool IsConsistent() const;

 private:
  // Builds the sentence for an observation, leaving out neighbors that are
  // already known.
  Sentence MakeSentence(const Cell& cell, std::size_t count) const;

  // Marks the cells of every sentence that are known to be mines or safe.
  void MarkKnownCells();

  // Adds every sentence implied by a pair of sentences in the knowledge base.
  void InferSubsets();

  // Removes sentences that carry no information.
  void PruneEmptySentences();

  const std::size_t rows_;
  const std::size_t cols_;
  const std::unique_ptr<RandomSource> random_;
  std::ostream* const trace_;

  // Cells that have been played.
  std::unordered_set<Cell> moves_made_;

  // Cells known to be safe.
  std::unordered_set<Cell> safes_;

  // Cells known to be mines.
  std::unordered_set<Cell> mines_;

  // Sentences known to be true, in the order they were learned.
  std::vector<Sentence> knowledge_;
};

}  // namespace ai
}  // namespace sweeper

#endif  // SWEEPER_AI_AGENT_H_
