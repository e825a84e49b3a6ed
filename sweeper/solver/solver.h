#ifndef SWEEPER_SOLVER_SOLVER_H_
#define SWEEPER_SOLVER_SOLVER_H_

#include <iosfwd>
#include <memory>
#include <vector>

#include "sweeper/game/game.h"

namespace sweeper {
namespace solver {

// Solving algorithms.
enum class Algorithm {
  // Play only cells the knowledge base proves safe, and flag proven mines.
  KNOWLEDGE,

  // As KNOWLEDGE, but uncover a random cell not known to be a mine when
  // nothing can be proven.
  KNOWLEDGE_WITH_GUESSES,
};

class Solver : public EventSubscriber {
 public:
  virtual ~Solver() = default;

  // Recommends actions based on the Solver's current knowledge of the game.
  //
  // The Solver is NOT required to produce a complete set of actions, nor is it
  // required to be idempotent.
  //
  // The Solver must return an empty vector to indicate that no progress can be
  // made.
  virtual std::vector<Action> Analyze() = 0;
};

// Creates a new solver for the specified algorithm.
//
// seed drives the random moves of KNOWLEDGE_WITH_GUESSES. If trace is not
// nullptr the solver's deductions are written to it.
//
// This solver will be automatically subscribed to the provided game.
std::unique_ptr<Solver> New(Algorithm alg, Game& game, unsigned seed,
                            std::ostream* trace = nullptr);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_SOLVER_H_
