#include "sweeper/ui/config.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ostream>

namespace sweeper {
namespace ui {

const Difficulty kClassicDifficulty{8, 8, 8};
const Difficulty kBeginnerDifficulty{9, 9, 10};
const Difficulty kIntermediateDifficulty{16, 16, 40};
const Difficulty kExpertDifficulty{16, 30, 99};

namespace {

// Parses a non-negative decimal integer.
//
// Returns false unless the whole string is a number.
bool ParseNumber(const char* str, unsigned long* value) {
  if (str == nullptr || *str == '\0' || *str == '-') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  *value = std::strtoul(str, &end, 10);
  return errno == 0 && *end == '\0';
}

}  // namespace

bool FindDifficulty(const char* name, Difficulty* difficulty) {
  if (std::strcmp(name, "classic") == 0) {
    *difficulty = kClassicDifficulty;
  } else if (std::strcmp(name, "beginner") == 0) {
    *difficulty = kBeginnerDifficulty;
  } else if (std::strcmp(name, "intermediate") == 0) {
    *difficulty = kIntermediateDifficulty;
  } else if (std::strcmp(name, "expert") == 0) {
    *difficulty = kExpertDifficulty;
  } else {
    return false;
  }
  return true;
}

bool ParseArgs(int argc, const char* const argv[], Config* config,
               std::ostream& err) {
  int i = 1;
  for (; i < argc && argv[i][0] == '-'; ++i) {
    const char* flag = argv[i];
    if (std::strlen(flag) != 2) {
      err << "Unknown option: " << flag << '\n';
      return false;
    }

    // Options without a value.
    if (flag[1] == 'g') {
      config->algorithm = solver::Algorithm::KNOWLEDGE_WITH_GUESSES;
      continue;
    }
    if (flag[1] == 'v') {
      config->trace = true;
      continue;
    }

    if (i + 1 >= argc) {
      err << "Missing value for " << flag << '\n';
      return false;
    }
    const char* value = argv[++i];
    unsigned long number = 0;
    switch (flag[1]) {
      case 'd':
        if (!FindDifficulty(value, &config->difficulty)) {
          err << "Unknown difficulty: " << value << '\n';
          return false;
        }
        break;
      case 's':
        if (!ParseNumber(value, &number)) {
          err << "Invalid seed: " << value << '\n';
          return false;
        }
        config->seed = static_cast<unsigned>(number);
        break;
      case 't':
        if (!ParseNumber(value, &number) || number == 0) {
          err << "Invalid number of games: " << value << '\n';
          return false;
        }
        config->games = number;
        break;
      default:
        err << "Unknown option: " << flag << '\n';
        return false;
    }
  }

  const int positional = argc - i;
  if (positional == 0) {
    return true;
  }
  if (positional != 3) {
    err << "Expected <rows> <cols> <mines>\n";
    return false;
  }

  unsigned long rows = 0;
  unsigned long cols = 0;
  unsigned long mines = 0;
  if (!ParseNumber(argv[i], &rows) || !ParseNumber(argv[i + 1], &cols) ||
      !ParseNumber(argv[i + 2], &mines)) {
    err << "Invalid board dimensions\n";
    return false;
  }
  if (rows == 0 || cols == 0 || mines >= rows * cols) {
    err << "A board needs at least one row, one column and one safe cell\n";
    return false;
  }
  config->difficulty = Difficulty{rows, cols, mines};
  return true;
}

void PrintUsage(std::ostream& out, const char* program) {
  out << "usage: " << program
      << " [-d classic|beginner|intermediate|expert] [-s <seed>]"
         " [-t <games>] [-g] [-v] [<rows> <cols> <mines>]\n"
         "  -d  premade difficulty (default classic: 8x8, 8 mines)\n"
         "  -s  seed for the mine layout and random moves\n"
         "  -t  number of games to play (trials only)\n"
         "  -g  guess a random cell when nothing is known to be safe\n"
         "  -v  trace the agent's deductions to stderr\n";
}

}  // namespace ui
}  // namespace sweeper
