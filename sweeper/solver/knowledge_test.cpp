#include "sweeper/solver/knowledge.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "sweeper/solver/autoplay.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {
namespace {

std::unique_ptr<Game> NewTestGame(std::size_t rows, std::size_t cols,
                                  const std::vector<Cell>& mines) {
  return NewGame(NewBoard(rows, cols, mines));
}

TEST(KnowledgeSolverTest, NothingIsKnownBeforeTheFirstMove) {
  auto game = NewTestGame(3, 3, {{2, 2}});
  ASSERT_NE(nullptr, game);
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1);
  ASSERT_NE(nullptr, solver);

  EXPECT_TRUE(solver->Analyze().empty());
}

TEST(KnowledgeSolverTest, UncoversProvenSafeCell) {
  auto game = NewTestGame(3, 3, {{2, 2}});
  ASSERT_NE(nullptr, game);
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1);
  ASSERT_NE(nullptr, solver);

  game->Execute(Action{Action::Type::UNCOVER, Cell{0, 0}});

  const std::vector<Action> expected{{Action::Type::UNCOVER, Cell{0, 1}}};
  EXPECT_EQ(expected, solver->Analyze());
}

TEST(KnowledgeSolverTest, FlagsProvenMines) {
  auto game = NewTestGame(1, 5, {{0, 2}});
  ASSERT_NE(nullptr, game);
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1);
  ASSERT_NE(nullptr, solver);

  game->Execute(Action{Action::Type::UNCOVER, Cell{0, 0}});
  std::vector<Action> actions = solver->Analyze();
  ASSERT_EQ(
      (std::vector<Action>{{Action::Type::UNCOVER, Cell{0, 1}}}), actions);
  game->Execute(actions);

  // (0, 3) and (0, 4) cannot be reached by deduction.
  actions = solver->Analyze();
  ASSERT_EQ((std::vector<Action>{{Action::Type::FLAG, Cell{0, 2}}}), actions);
  game->Execute(actions);

  // Flagging every mine wins.
  EXPECT_EQ(Game::State::WIN, game->GetState());
  EXPECT_TRUE(solver->Analyze().empty());
}

TEST(KnowledgeSolverTest, RemovesFlagBeforeUncoveringSafeCell) {
  auto game = NewTestGame(1, 5, {{0, 2}});
  ASSERT_NE(nullptr, game);
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1);
  ASSERT_NE(nullptr, solver);

  game->Execute(Action{Action::Type::UNCOVER, Cell{0, 0}});
  game->Execute(Action{Action::Type::FLAG, Cell{0, 1}});

  const std::vector<Action> expected{{Action::Type::FLAG, Cell{0, 1}},
                                     {Action::Type::UNCOVER, Cell{0, 1}}};
  EXPECT_EQ(expected, solver->Analyze());
}

TEST(KnowledgeSolverTest, DoesNotFlagTwice) {
  auto game = NewTestGame(1, 5, {{0, 2}, {0, 4}});
  ASSERT_NE(nullptr, game);
  std::ostringstream trace;
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1, &trace);
  ASSERT_NE(nullptr, solver);

  game->Execute(Action{Action::Type::FLAG, Cell{0, 2}});
  game->Execute(Action{Action::Type::UNCOVER, Cell{0, 0}});
  game->Execute(Action{Action::Type::UNCOVER, Cell{0, 1}});
  ASSERT_NE(std::string::npos, trace.str().find("Deduced mine (0, 2)"));

  // The mine is proven but already flagged, and nothing else is known.
  EXPECT_TRUE(solver->Analyze().empty());
  EXPECT_EQ(1u, game->GetFlags());
  EXPECT_EQ(Game::State::PLAYING, game->GetState());
}

TEST(KnowledgeSolverTest, SolvesBoardAfterFirstMove) {
  auto game = NewTestGame(3, 3, {{2, 2}});
  ASSERT_NE(nullptr, game);
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1);
  ASSERT_NE(nullptr, solver);

  game->Execute(Action{Action::Type::UNCOVER, Cell{0, 0}});
  EXPECT_EQ(Game::State::WIN, AutoPlay(*game, *solver));
}

TEST(KnowledgeSolverTest, GuessesTheFirstMove) {
  auto game = NewTestGame(2, 2, {});
  ASSERT_NE(nullptr, game);
  auto solver = New(Algorithm::KNOWLEDGE_WITH_GUESSES, *game, 5);
  ASSERT_NE(nullptr, solver);

  const std::vector<Action> actions = solver->Analyze();
  ASSERT_EQ(1u, actions.size());
  EXPECT_EQ(Action::Type::UNCOVER, actions[0].type);

  EXPECT_EQ(Game::State::WIN, AutoPlay(*game, *solver));
}

TEST(KnowledgeSolverTest, TracesDeductions) {
  auto game = NewTestGame(3, 3, {{2, 2}});
  ASSERT_NE(nullptr, game);
  std::ostringstream trace;
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1, &trace);
  ASSERT_NE(nullptr, solver);

  game->Execute(Action{Action::Type::UNCOVER, Cell{0, 0}});
  EXPECT_NE(std::string::npos, trace.str().find("Observed (0, 0)"));
}

TEST(AutoPlayTest, StopsWhenStuck) {
  auto game = NewTestGame(3, 3, {{2, 2}});
  ASSERT_NE(nullptr, game);
  auto solver = New(Algorithm::KNOWLEDGE, *game, 1);
  ASSERT_NE(nullptr, solver);

  EXPECT_EQ(Game::State::NEW, AutoPlay(*game, *solver));
}

TEST(RunTrialsTest, GuessingAlwaysFinishes) {
  TrialStats stats;
  ASSERT_TRUE(RunTrials(8, 8, 8, Algorithm::KNOWLEDGE_WITH_GUESSES, 17, 20,
                        &stats));
  EXPECT_EQ(20u, stats.games);
  EXPECT_EQ(20u, stats.wins + stats.losses);
  EXPECT_EQ(0u, stats.stuck);
}

TEST(RunTrialsTest, WithoutGuessingNothingStarts) {
  TrialStats stats;
  ASSERT_TRUE(RunTrials(8, 8, 8, Algorithm::KNOWLEDGE, 17, 3, &stats));
  EXPECT_EQ(3u, stats.stuck);
}

TEST(RunTrialsTest, RejectsInvalidBoard) {
  TrialStats stats;
  EXPECT_FALSE(RunTrials(2, 2, 4, Algorithm::KNOWLEDGE_WITH_GUESSES, 1, 1,
                         &stats));
  EXPECT_EQ(0u, stats.games);
}

}  // namespace
}  // namespace solver
}  // namespace sweeper
