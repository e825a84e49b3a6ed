#include "sweeper/ui/game_window.h"

#include <iostream>
#include <sstream>
#include <vector>

#include <sigc++/functors/mem_fun.h>

namespace sweeper {
namespace ui {

GameWindow::GameWindow(const Config& config)
    : config_(config),
      vbox_(Gtk::ORIENTATION_VERTICAL, 6),
      button_box_(Gtk::ORIENTATION_HORIZONTAL, 6),
      ai_move_button_("AI Move"),
      new_game_button_("New Game") {
  set_title("Sweeper");
  set_border_width(6);

  button_box_.pack_start(ai_move_button_, Gtk::PACK_SHRINK);
  button_box_.pack_start(new_game_button_, Gtk::PACK_SHRINK);
  button_box_.pack_start(status_label_, Gtk::PACK_EXPAND_WIDGET);
  vbox_.pack_start(button_box_, Gtk::PACK_SHRINK);
  vbox_.pack_start(mine_field_, Gtk::PACK_EXPAND_WIDGET);
  add(vbox_);

  mine_field_.signal_action().connect(
      sigc::mem_fun(*this, &GameWindow::HandleAction));
  ai_move_button_.signal_clicked().connect(
      sigc::mem_fun(*this, &GameWindow::MakeAiMove));
  new_game_button_.signal_clicked().connect(
      sigc::mem_fun(*this, &GameWindow::NewGame));

  // The first game uses the configured seed.
  --config_.seed;
  NewGame();
  show_all_children();
}

void GameWindow::NewGame() {
  ++config_.seed;
  const Difficulty& difficulty = config_.difficulty;
  game_ = sweeper::NewGame(difficulty.rows, difficulty.cols, difficulty.mines,
                           config_.seed);
  solver_ = solver::New(solver::Algorithm::KNOWLEDGE_WITH_GUESSES, *game_,
                        config_.seed, config_.trace ? &std::cerr : nullptr);

  // Subscribe UI widgets to the new game, causing them to reset.
  mine_field_.Reset(*game_);
  UpdateStatus();
}

void GameWindow::HandleAction(Action action) {
  game_->Execute(action);
  UpdateStatus();
}

void GameWindow::MakeAiMove() {
  const std::vector<Action> actions = solver_->Analyze();
  if (actions.empty()) {
    if (!game_->IsGameOver()) {
      status_label_.set_text("No moves left to make.");
    }
    return;
  }
  game_->Execute(actions);
  UpdateStatus();
}

void GameWindow::UpdateStatus() {
  std::ostringstream status;
  switch (game_->GetState()) {
    case Game::State::WIN:
      status << "Won";
      break;
    case Game::State::LOSS:
      status << "Lost";
      break;
    default:
      status << "Mines: " << game_->GetMines()
             << "  Flags: " << game_->GetFlags();
      break;
  }
  status_label_.set_text(status.str());
}

}  // namespace ui
}  // namespace sweeper
