#include "sweeper/solver/solver.h"

#include "sweeper/solver/knowledge.h"

namespace sweeper {
namespace solver {

std::unique_ptr<Solver> New(Algorithm alg, Game& game, unsigned seed,
                            std::ostream* trace) {
  std::unique_ptr<Solver> solver;
  switch (alg) {
    case Algorithm::KNOWLEDGE:
      solver = knowledge::New(game, false, seed, trace);
      break;
    case Algorithm::KNOWLEDGE_WITH_GUESSES:
      solver = knowledge::New(game, true, seed, trace);
      break;
    default:
      return nullptr;
  }
  game.Subscribe(solver.get());
  return solver;
}

}  // namespace solver
}  // namespace sweeper
