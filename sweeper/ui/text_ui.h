#ifndef SWEEPER_UI_TEXT_UI_H_
#define SWEEPER_UI_TEXT_UI_H_

#include <iosfwd>
#include <memory>

#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace ui {

// A text user interface based on iostreams.
class TextUi {
 public:
  virtual ~TextUi() = default;

  // Plays the game until it is over or the player quits.
  //
  // After execution of each action, the solver will be queried, and any actions
  // it recommends will be executed. If the solver does not recommend any
  // actions, the user is prompted for an action.
  //
  // The TextUi must be subscribed to the game before the first action.
  virtual void Play(Game& game, solver::Solver& solver) = 0;
};

// Returns a new text user interface for the given iostreams.
//
// The returned TextUi is subscribed to the game.
std::unique_ptr<TextUi> NewTextUi(Game& game, std::istream& in,
                                  std::ostream& out);

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_TEXT_UI_H_
