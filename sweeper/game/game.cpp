#include "sweeper/game/game.h"

#include <unordered_set>
#include <utility>

#include "sweeper/game/grid.h"

namespace sweeper {

namespace {

// Convenience function to create an UNCOVER event.
Event UncoverEvent(const Cell& cell, std::size_t adjacent_mines) {
  return Event{Event::Type::UNCOVER, cell, adjacent_mines};
}

// Convenience function to create a FLAG event.
Event FlagEvent(const Cell& cell) { return Event{Event::Type::FLAG, cell, 0}; }

// Convenience function to create an UNFLAG event.
Event UnflagEvent(const Cell& cell) {
  return Event{Event::Type::UNFLAG, cell, 0};
}

// Convenience function to create a WIN event.
Event WinEvent(const Cell& cell) { return Event{Event::Type::WIN, cell, 0}; }

// Convenience function to create a LOSS event.
Event LossEvent(const Cell& cell) { return Event{Event::Type::LOSS, cell, 0}; }

// Convenience function to create an IDENTIFY_MINE event.
Event IdentifyMineEvent(const Cell& cell) {
  return Event{Event::Type::IDENTIFY_MINE, cell, 0};
}

// The game implementation.
class GameImpl : public Game {
 public:
  explicit GameImpl(std::unique_ptr<Board> board)
      : board_(std::move(board)),
        state_(State::NEW),
        remaining_covered_(board_->GetRows() * board_->GetCols() -
                           board_->GetMines()),
        grid_(board_->GetRows(), board_->GetCols()) {}

  ~GameImpl() final = default;

  void Execute(const Action& action) final {
    if (IsGameOver() || !grid_.IsValid(action.cell)) {
      return;
    }

    std::vector<Event> events;
    switch (action.type) {
      case Action::Type::UNCOVER:
        Uncover(action.cell, events);
        break;
      case Action::Type::FLAG:
        ToggleFlagged(action.cell, events);
        break;
    }

    if (state_ == State::NEW) {
      state_ = State::PLAYING;
    }

    for (const Event& event : events) {
      for (EventSubscriber* subscriber : subscribers_) {
        subscriber->NotifyEvent(event);
      }
    }
  }

  void Subscribe(EventSubscriber* subscriber) final {
    subscribers_.push_back(subscriber);
  }

  std::size_t GetRows() const final { return board_->GetRows(); }

  std::size_t GetCols() const final { return board_->GetCols(); }

  std::size_t GetMines() const final { return board_->GetMines(); }

  std::size_t GetFlags() const final { return flagged_.size(); }

  State GetState() const final { return state_; }

  const Board& GetBoard() const final { return *board_; }

 private:
  // Uncovers the cell.
  //
  // Does nothing if the cell is flagged or already uncovered.
  void Uncover(const Cell& cell, std::vector<Event>& events) {
    CellState& state = grid_(cell).state;
    if (state != CellState::COVERED) {
      return;
    }

    // If a mine was uncovered this is a loss.
    if (board_->IsMine(cell)) {
      state = CellState::LOSING_MINE;
      ShowAllMinesAndLose(cell, events);
      return;
    }

    state = CellState::UNCOVERED;
    events.push_back(UncoverEvent(cell, board_->AdjacentMines(cell)));
    --remaining_covered_;

    // If there are no more safe cells to uncover this is a win.
    if (remaining_covered_ == 0) {
      Win(cell, events);
    }
  }

  // Toggles the flag on the cell.
  //
  // Does nothing if the cell is already uncovered.
  void ToggleFlagged(const Cell& cell, std::vector<Event>& events) {
    CellState& state = grid_(cell).state;
    switch (state) {
      case CellState::COVERED:
        state = CellState::FLAGGED;
        flagged_.insert(cell);
        events.push_back(FlagEvent(cell));
        break;
      case CellState::FLAGGED:
        state = CellState::COVERED;
        flagged_.erase(cell);
        events.push_back(UnflagEvent(cell));
        break;
      default:
        return;
    }

    // Flagging exactly the mines is a win.
    if (!flagged_.empty() && board_->IsWon(flagged_)) {
      Win(cell, events);
    }
  }

  void Win(const Cell& cell, std::vector<Event>& events) {
    events.push_back(WinEvent(cell));
    state_ = State::WIN;
  }

  // Generates events to show all mines, followed by a loss event at the given
  // location.
  void ShowAllMinesAndLose(const Cell& cell, std::vector<Event>& events) {
    grid_.ForEach([this, &cell, &events](const Cell& other,
                                         const Square& square) {
      if (other != cell && board_->IsMine(other) &&
          square.state != CellState::FLAGGED) {
        events.push_back(IdentifyMineEvent(other));
      }
    });

    events.push_back(LossEvent(cell));
    state_ = State::LOSS;
  }

  // The player's view of a cell.
  struct Square {
    CellState state = CellState::COVERED;
  };

  const std::unique_ptr<Board> board_;
  State state_;
  std::size_t remaining_covered_;
  Grid<Square> grid_;
  std::unordered_set<Cell> flagged_;
  std::vector<EventSubscriber*> subscribers_;
};

}  // namespace

std::unique_ptr<Game> NewGame(std::unique_ptr<Board> board) {
  if (board == nullptr) {
    return nullptr;
  }
  return std::unique_ptr<Game>(new GameImpl(std::move(board)));
}

std::unique_ptr<Game> NewGame(std::size_t rows, std::size_t cols,
                              std::size_t mines, unsigned seed) {
  return NewGame(NewBoard(rows, cols, mines, seed));
}

}  // namespace sweeper
