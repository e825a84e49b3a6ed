#ifndef SWEEPER_SOLVER_AUTOPLAY_H_
#define SWEEPER_SOLVER_AUTOPLAY_H_

#include <cstddef>

#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {

// Repeatedly executes the actions recommended by the solver until the game is
// over or the solver makes no recommendation.
//
// Returns the state the game was left in.
Game::State AutoPlay(Game& game, Solver& solver);

// Aggregate results of playing many games.
struct TrialStats {
  std::size_t games = 0;
  std::size_t wins = 0;
  std::size_t losses = 0;

  // Games the solver could not finish without guessing.
  std::size_t stuck = 0;
};

// Plays games on freshly generated boards with the given algorithm. The game
// with index i uses seed + i for both the board and the solver.
//
// Returns false, leaving stats untouched, if the board configuration is
// invalid.
bool RunTrials(std::size_t rows, std::size_t cols, std::size_t mines,
               Algorithm alg, unsigned seed, std::size_t games,
               TrialStats* stats);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_AUTOPLAY_H_
