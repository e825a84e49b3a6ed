#ifndef SWEEPER_UI_CONFIG_H_
#define SWEEPER_UI_CONFIG_H_

#include <cstddef>
#include <iosfwd>

#include "sweeper/solver/solver.h"

namespace sweeper {
namespace ui {

// The dimensions and mine count of a game.
struct Difficulty {
  std::size_t rows;
  std::size_t cols;
  std::size_t mines;
};

// Premade common difficulties.
extern const Difficulty kClassicDifficulty;
extern const Difficulty kBeginnerDifficulty;
extern const Difficulty kIntermediateDifficulty;
extern const Difficulty kExpertDifficulty;

// Looks up a premade difficulty by name: "classic", "beginner",
// "intermediate" or "expert".
//
// Returns false if the name is unknown.
bool FindDifficulty(const char* name, Difficulty* difficulty);

// Settings shared by the front ends.
struct Config {
  Difficulty difficulty = kClassicDifficulty;

  // Seed for the mine layout and for random moves.
  unsigned seed = 0;

  // The solver used to play.
  solver::Algorithm algorithm = solver::Algorithm::KNOWLEDGE;

  // Write the agent's deductions to stderr.
  bool trace = false;

  // The number of games played by the trials runner.
  std::size_t games = 1;
};

// Parses command line arguments of the form:
//   [-d <difficulty>] [-s <seed>] [-t <games>] [-g] [-v] [<rows> <cols> <mines>]
//
// config must be filled with defaults by the caller; only the options present
// are overwritten. On failure a message is written to err and false is
// returned.
bool ParseArgs(int argc, const char* const argv[], Config* config,
               std::ostream& err);

// Writes a usage message for the named program.
void PrintUsage(std::ostream& out, const char* program);

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_CONFIG_H_
