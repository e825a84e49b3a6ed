#ifndef SWEEPER_UI_MINE_FIELD_H_
#define SWEEPER_UI_MINE_FIELD_H_

#include <cstddef>

#include <cairomm/context.h>
#include <cairomm/refptr.h>
#include <gtkmm/drawingarea.h>
#include <sigc++/signal.h>

#include "sweeper/game/game.h"
#include "sweeper/game/grid.h"

namespace sweeper {
namespace ui {

// A mine field widget.
//
// Left clicks uncover a cell, right clicks toggle its flag.
class MineField : public Gtk::DrawingArea, public EventSubscriber {
 public:
  MineField();

  // Resets the internal state for a new game and subscribes to it.
  void Reset(Game& game);

  // Updates the visual state based on the event.
  void NotifyEvent(const Event& event) final;

  // The signal sent when an Action is peformed on the mine field.
  sigc::signal<void, Action>& signal_action() { return signal_action_; }

 protected:
  // Draws the widget.
  bool on_draw(const Cairo::RefPtr<Cairo::Context>& cr) final;

  // Remembers the cell under the pointer.
  bool on_button_press_event(GdkEventButton* event) final;

  // Emits an action if the button is released over the pressed cell.
  bool on_button_release_event(GdkEventButton* event) final;

 private:
  // The GUI's knowledge about a cell.
  struct Square {
    CellState state = CellState::COVERED;
    std::size_t adjacent_mines = 0;
  };

  // The area actually used to draw the cells, centered in the allocation.
  struct DrawingDimensions {
    double x;
    double y;
    double cell_size;
  };

  // Computes the drawing dimensions for the current allocation.
  DrawingDimensions GetDrawingDimensions() const;

  // Computes the cell from mouse event coordinates.
  //
  // Returns false if the point is outside the mine field.
  bool GetCellFromPoint(double x, double y, Cell* cell) const;

  // Draws a single cell with its top left corner at the origin.
  void DrawSquare(const Cairo::RefPtr<Cairo::Context>& cr,
                  const Square& square, double size) const;

  // Knowledge about the grid of cells.
  Grid<Square> grid_;

  // The cell under the pointer when a button was pressed.
  Cell pressed_cell_;
  bool pressed_ = false;

  // Signal emitted when an action occurs.
  sigc::signal<void, Action> signal_action_;
};

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_MINE_FIELD_H_
