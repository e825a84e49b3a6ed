// Main program to play with a text user interface.
//
// The knowledge based solver makes every move it can prove safe. With -g it
// also guesses, playing the whole game unattended; otherwise the player is
// prompted whenever the solver is stuck.

#include <ctime>
#include <iostream>
#include <memory>

#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"
#include "sweeper/ui/config.h"
#include "sweeper/ui/text_ui.h"

int main(int argc, char* argv[]) {
  sweeper::ui::Config config;
  config.seed = static_cast<unsigned>(std::time(nullptr));
  if (!sweeper::ui::ParseArgs(argc, argv, &config, std::cerr)) {
    sweeper::ui::PrintUsage(std::cerr, argv[0]);
    return 1;
  }

  const sweeper::ui::Difficulty& difficulty = config.difficulty;
  auto game = sweeper::NewGame(difficulty.rows, difficulty.cols,
                               difficulty.mines, config.seed);
  if (game == nullptr) {
    std::cerr << "Invalid board configuration.\n";
    return 1;
  }

  auto ui = sweeper::ui::NewTextUi(*game, std::cin, std::cout);
  auto solver = sweeper::solver::New(config.algorithm, *game, config.seed,
                                     config.trace ? &std::cerr : nullptr);

  ui->Play(*game, *solver);
  game->GetBoard().Print(std::cout);

  return 0;
}
