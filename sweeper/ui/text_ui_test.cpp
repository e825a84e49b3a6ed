#include "sweeper/ui/text_ui.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace ui {
namespace {

// Plays a 1x5 game with a mine in the middle using the given player input.
std::string PlayScripted(const std::string& input) {
  std::unique_ptr<Game> game =
      NewGame(NewBoard(1, 5, std::vector<Cell>{{0, 2}}));
  std::istringstream in(input);
  std::ostringstream out;
  std::unique_ptr<TextUi> ui = NewTextUi(*game, in, out);
  std::unique_ptr<solver::Solver> solver =
      solver::New(solver::Algorithm::KNOWLEDGE, *game, 1);
  ui->Play(*game, *solver);
  return out.str();
}

TEST(TextUiTest, SolverFinishesAfterFirstMove) {
  const std::string out = PlayScripted("u 0 0\n");
  EXPECT_NE(std::string::npos, out.find("- - - - -\n"));
  EXPECT_NE(std::string::npos, out.find("0 1 F - -\n"));
  EXPECT_NE(std::string::npos, out.find("You win!"));
}

TEST(TextUiTest, Quit) {
  const std::string out = PlayScripted("q\n");
  EXPECT_NE(std::string::npos, out.find("No moves left to make."));
  EXPECT_EQ(std::string::npos, out.find("You win!"));
}

TEST(TextUiTest, EndOfInput) {
  EXPECT_NE(std::string::npos,
            PlayScripted("").find("No moves left to make."));
}

TEST(TextUiTest, RejectsInvalidCommands) {
  const std::string out = PlayScripted("x\nu 3 0\nq\n");
  std::size_t count = 0;
  for (std::size_t pos = out.find("Invalid command.");
       pos != std::string::npos;
       pos = out.find("Invalid command.", pos + 1)) {
    ++count;
  }
  EXPECT_EQ(2u, count);
}

TEST(TextUiTest, UncoveringMineLoses) {
  const std::string out = PlayScripted("u 0 2\n");
  EXPECT_NE(std::string::npos, out.find("- - X - -\n"));
  EXPECT_NE(std::string::npos, out.find("You lose."));
}

}  // namespace
}  // namespace ui
}  // namespace sweeper
