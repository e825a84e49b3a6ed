#ifndef SWEEPER_UI_GAME_WINDOW_H_
#define SWEEPER_UI_GAME_WINDOW_H_

#include <memory>

#include <gtkmm/applicationwindow.h>
#include <gtkmm/box.h>
#include <gtkmm/button.h>
#include <gtkmm/label.h>

#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"
#include "sweeper/ui/config.h"
#include "sweeper/ui/mine_field.h"

namespace sweeper {
namespace ui {

// The main window for the game.
//
// The player may uncover and flag cells directly, or press "AI Move" to let
// the knowledge based solver make one move.
class GameWindow : public Gtk::ApplicationWindow {
 public:
  explicit GameWindow(const Config& config);

 private:
  // Starts a new game with a fresh seed.
  void NewGame();

  // Executes an action from the mine field.
  void HandleAction(Action action);

  // Lets the solver make one move, guessing if nothing is known to be safe.
  void MakeAiMove();

  // Shows the game state in the status label.
  void UpdateStatus();

  Config config_;

  Gtk::Box vbox_;
  Gtk::Box button_box_;
  Gtk::Button ai_move_button_;
  Gtk::Button new_game_button_;
  Gtk::Label status_label_;
  MineField mine_field_;

  // The current game.
  std::unique_ptr<Game> game_;

  // The current solver.
  std::unique_ptr<solver::Solver> solver_;
};

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_GAME_WINDOW_H_
