#include "sweeper/ui/text_ui.h"

#include <cstddef>
#include <istream>
#include <limits>
#include <ostream>
#include <utility>
#include <vector>

#include "sweeper/game/grid.h"

namespace sweeper {
namespace ui {

namespace {

class TextUiImpl : public TextUi, public EventSubscriber {
 public:
  TextUiImpl(std::size_t rows, std::size_t cols, std::istream& in,
             std::ostream& out)
      : grid_(rows, cols), in_(in), out_(out) {}

  ~TextUiImpl() final = default;

  void Play(Game& game, solver::Solver& solver) final {
    while (!game.IsGameOver()) {
      Print();

      std::vector<Action> actions = solver.Analyze();
      if (actions.empty()) {
        // Analysis produced no actions. Get action from user.
        Action action;
        if (!GetActionFromPlayer(&action)) {
          out_ << "No moves left to make.\n\n";
          return;
        }
        actions.push_back(action);
      }
      game.Execute(actions);
    }

    Print();

    switch (game.GetState()) {
      case Game::State::WIN:
        out_ << "You win!\n\n";
        break;
      case Game::State::LOSS:
        out_ << "You lose.\n\n";
        break;
      default:
        break;
    }
  }

  // Updates player knowledge based on the event.
  void NotifyEvent(const Event& event) final {
    Square& square = grid_(event.cell);
    switch (event.type) {
      case Event::Type::UNCOVER:
        square.state = CellState::UNCOVERED;
        square.adjacent_mines = event.adjacent_mines;
        break;
      case Event::Type::FLAG:
        square.state = CellState::FLAGGED;
        break;
      case Event::Type::UNFLAG:
        square.state = CellState::COVERED;
        break;
      case Event::Type::WIN:
        // No new knowledge.
        break;
      case Event::Type::LOSS:
        square.state = CellState::LOSING_MINE;
        break;
      case Event::Type::IDENTIFY_MINE:
        square.state = CellState::MINE;
        break;
    }
  }

 private:
  // Represents player knowledge about a cell.
  struct Square {
    CellState state = CellState::COVERED;

    // The number of adjacent mines.
    // Only valid if the state is UNCOVERED.
    std::size_t adjacent_mines = 0;
  };

  void Print() const {
    grid_.ForEach([this](const Cell& cell, const Square& square) {
      switch (square.state) {
        case CellState::UNCOVERED:
          out_ << square.adjacent_mines;
          break;
        case CellState::COVERED:
          out_ << '-';
          break;
        case CellState::FLAGGED:
          out_ << 'F';
          break;
        case CellState::MINE:
          out_ << '*';
          break;
        case CellState::LOSING_MINE:
          out_ << 'X';
          break;
      }
      out_ << (cell.col + 1 == grid_.GetCols() ? '\n' : ' ');
    });
    out_ << '\n';
  }

  // Prompts until the player enters a valid command.
  //
  // Returns false if the player quits or input ends.
  bool GetActionFromPlayer(Action* action) {
    for (;;) {
      out_ << "Command: ";

      const int c = in_.get();
      if (c == std::char_traits<char>::eof()) {
        return false;
      }

      bool fail = false;
      switch (c) {
        case 'u':
        case 'U':
          action->type = Action::Type::UNCOVER;
          in_ >> action->cell.row >> action->cell.col;
          break;
        case 'f':
        case 'F':
          action->type = Action::Type::FLAG;
          in_ >> action->cell.row >> action->cell.col;
          break;
        case 'q':
        case 'Q':
          return false;
        default:
          fail = true;
      }
      fail = fail || !in_ || !grid_.IsValid(action->cell);

      in_.clear();
      in_.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

      if (!fail) {
        return true;
      }
      out_ << "Invalid command.\n";
    }
  }

  Grid<Square> grid_;
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace

std::unique_ptr<TextUi> NewTextUi(Game& game, std::istream& in,
                                  std::ostream& out) {
  std::unique_ptr<TextUiImpl> ui(
      new TextUiImpl(game.GetRows(), game.GetCols(), in, out));
  game.Subscribe(ui.get());
  return std::move(ui);
}

}  // namespace ui
}  // namespace sweeper
