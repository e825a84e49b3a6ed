#ifndef SWEEPER_SOLVER_KNOWLEDGE_H_
#define SWEEPER_SOLVER_KNOWLEDGE_H_

#include <iosfwd>
#include <memory>

#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {
namespace knowledge {

// Provides a solver backed by an ai::Agent.
//
// Every uncovered cell becomes an observation for the agent. Analysis flags
// every mine the agent has proven and uncovers one cell the agent has proven
// safe. If guess is true and nothing is proven safe, a random cell that is not
// known to be a mine is uncovered instead.
//
// The returned solver is not subscribed to the game. Use solver::New.
std::unique_ptr<Solver> New(Game& game, bool guess, unsigned seed,
                            std::ostream* trace);

}  // namespace knowledge
}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_KNOWLEDGE_H_
