#include "sweeper/solver/autoplay.h"

#include <memory>
#include <vector>

namespace sweeper {
namespace solver {

Game::State AutoPlay(Game& game, Solver& solver) {
  std::vector<Action> actions;
  do {
    actions = solver.Analyze();
    game.Execute(actions);
  } while (!actions.empty() && !game.IsGameOver());
  return game.GetState();
}

bool RunTrials(std::size_t rows, std::size_t cols, std::size_t mines,
               Algorithm alg, unsigned seed, std::size_t games,
               TrialStats* stats) {
  TrialStats result;
  for (std::size_t i = 0; i < games; ++i) {
    const unsigned game_seed = seed + static_cast<unsigned>(i);
    std::unique_ptr<Game> game = NewGame(rows, cols, mines, game_seed);
    if (game == nullptr) {
      return false;
    }
    std::unique_ptr<Solver> solver = New(alg, *game, game_seed);

    ++result.games;
    switch (AutoPlay(*game, *solver)) {
      case Game::State::WIN:
        ++result.wins;
        break;
      case Game::State::LOSS:
        ++result.losses;
        break;
      default:
        ++result.stuck;
        break;
    }
  }
  *stats = result;
  return true;
}

}  // namespace solver
}  // namespace sweeper
