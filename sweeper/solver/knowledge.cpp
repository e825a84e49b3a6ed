#include "sweeper/solver/knowledge.h"

#include <set>
#include <unordered_set>
#include <vector>

#include "sweeper/ai/agent.h"
#include "sweeper/ai/random_source.h"

namespace sweeper {
namespace solver {
namespace knowledge {

namespace {

class KnowledgeSolver : public Solver {
 public:
  KnowledgeSolver(Game& game, bool guess, unsigned seed, std::ostream* trace)
      : agent_(game.GetRows(), game.GetCols(), ai::NewRandomSource(seed),
               trace),
        guess_(guess),
        game_over_(false) {}

  ~KnowledgeSolver() final = default;

  void NotifyEvent(const Event& event) final {
    switch (event.type) {
      case Event::Type::UNCOVER:
        agent_.AddKnowledge(event.cell, event.adjacent_mines);
        break;
      case Event::Type::FLAG:
        flagged_.insert(event.cell);
        break;
      case Event::Type::UNFLAG:
        flagged_.erase(event.cell);
        break;
      case Event::Type::WIN:
      case Event::Type::LOSS:
        game_over_ = true;
        break;
      case Event::Type::IDENTIFY_MINE:
        // No new knowledge.
        break;
    }
  }

  std::vector<Action> Analyze() final {
    std::vector<Action> actions;
    if (game_over_) {
      return actions;
    }

    // Flag proven mines in row-major order.
    const std::set<Cell> mines(agent_.GetMines().begin(),
                               agent_.GetMines().end());
    for (const Cell& mine : mines) {
      if (flagged_.count(mine) == 0) {
        actions.push_back(Action{Action::Type::FLAG, mine});
      }
    }

    Cell move;
    if (agent_.MakeSafeMove(&move) ||
        (guess_ && agent_.MakeRandomMove(&move))) {
      // A flagged cell cannot be uncovered, so the flag is removed first.
      if (flagged_.count(move) != 0) {
        actions.push_back(Action{Action::Type::FLAG, move});
      }
      actions.push_back(Action{Action::Type::UNCOVER, move});
    }
    return actions;
  }

 private:
  ai::Agent agent_;
  const bool guess_;
  bool game_over_;
  std::unordered_set<Cell> flagged_;
};

}  // namespace

std::unique_ptr<Solver> New(Game& game, bool guess, unsigned seed,
                            std::ostream* trace) {
  return std::unique_ptr<Solver>(new KnowledgeSolver(game, guess, seed, trace));
}

}  // namespace knowledge
}  // namespace solver
}  // namespace sweeper
