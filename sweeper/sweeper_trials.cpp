// Plays many games unattended and reports how often the solver wins.

#include <ctime>
#include <iostream>

#include "sweeper/solver/autoplay.h"
#include "sweeper/solver/solver.h"
#include "sweeper/ui/config.h"

int main(int argc, char* argv[]) {
  sweeper::ui::Config config;
  config.seed = static_cast<unsigned>(std::time(nullptr));
  config.games = 100;
  if (!sweeper::ui::ParseArgs(argc, argv, &config, std::cerr)) {
    sweeper::ui::PrintUsage(std::cerr, argv[0]);
    return 1;
  }

  const sweeper::ui::Difficulty& difficulty = config.difficulty;
  std::cout << "board=" << difficulty.rows << 'x' << difficulty.cols
            << " mines=" << difficulty.mines << " seed=" << config.seed
            << " games=" << config.games << std::endl;

  sweeper::solver::TrialStats stats;
  if (!sweeper::solver::RunTrials(
          difficulty.rows, difficulty.cols, difficulty.mines,
          sweeper::solver::Algorithm::KNOWLEDGE_WITH_GUESSES, config.seed,
          config.games, &stats)) {
    std::cerr << "Invalid board configuration.\n";
    return 1;
  }

  std::cout << "wins=" << stats.wins << " losses=" << stats.losses
            << " stuck=" << stats.stuck << '\n'
            << "succ. avg. = "
            << static_cast<double>(stats.wins) / static_cast<double>(stats.games)
            << std::endl;
  return 0;
}
