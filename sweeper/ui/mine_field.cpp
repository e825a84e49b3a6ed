#include "sweeper/ui/mine_field.h"

#include <algorithm>
#include <array>
#include <cmath>

#include <cairomm/enums.h>
#include <cairomm/types.h>
#include <gdkmm/window.h>

namespace sweeper {
namespace ui {

namespace {

// The minimum cell size, in pixels.
constexpr int kCellSize = 24;

constexpr double kPi = 3.14159265358979323846;

// Encapsulates a simple RGB color.
struct Color {
  double r;
  double g;
  double b;
};

// The color to use for numbers 1 through 8.
constexpr std::array<Color, 8> kNumberColor{{
    {0.0, 0.0, 1.0},  // 1
    {0.0, 0.5, 0.0},  // 2
    {1.0, 0.0, 0.0},  // 3
    {0.0, 0.0, 0.5},  // 4
    {0.5, 0.0, 0.0},  // 5
    {0.0, 0.5, 0.5},  // 6
    {0.5, 0.0, 0.5},  // 7
    {0.0, 0.0, 0.0},  // 8
}};

constexpr Color kCoveredColor{0.6, 0.6, 0.6};
constexpr Color kUncoveredColor{0.85, 0.85, 0.85};
constexpr Color kLosingMineColor{1.0, 0.0, 0.0};
constexpr Color kBorderColor{0.4, 0.4, 0.4};
constexpr Color kMineColor{0.0, 0.0, 0.0};
constexpr Color kFlagColor{0.9, 0.0, 0.0};

// Sets the source color in the specified context.
void SetColor(const Cairo::RefPtr<Cairo::Context>& cr, const Color& color) {
  cr->set_source_rgb(color.r, color.g, color.b);
}

// Fills a size x size square at the origin and outlines it.
void DrawBackground(const Cairo::RefPtr<Cairo::Context>& cr, const Color& color,
                    double size) {
  SetColor(cr, color);
  cr->rectangle(0.0, 0.0, size, size);
  cr->fill_preserve();
  SetColor(cr, kBorderColor);
  cr->set_line_width(1.0);
  cr->stroke();
}

void DrawMine(const Cairo::RefPtr<Cairo::Context>& cr, double size) {
  SetColor(cr, kMineColor);
  cr->arc(size / 2, size / 2, size / 4, 0.0, 2 * kPi);
  cr->fill();
}

void DrawFlag(const Cairo::RefPtr<Cairo::Context>& cr, double size) {
  SetColor(cr, kFlagColor);
  cr->move_to(0.3 * size, 0.2 * size);
  cr->line_to(0.75 * size, 0.4 * size);
  cr->line_to(0.3 * size, 0.6 * size);
  cr->close_path();
  cr->fill();

  SetColor(cr, kMineColor);
  cr->set_line_width(std::max(1.0, size / 12));
  cr->move_to(0.3 * size, 0.2 * size);
  cr->line_to(0.3 * size, 0.8 * size);
  cr->stroke();
}

void DrawNumber(const Cairo::RefPtr<Cairo::Context>& cr, std::size_t number,
                double size) {
  const char str[2] = {static_cast<char>('0' + number), '\0'};

  SetColor(cr, kNumberColor[number - 1]);
  cr->select_font_face("monospace", Cairo::FONT_SLANT_NORMAL,
                       Cairo::FONT_WEIGHT_BOLD);
  cr->set_font_size(0.8 * size);
  Cairo::TextExtents te;
  cr->get_text_extents(str, te);
  cr->move_to(size / 2 - te.width / 2 - te.x_bearing,
              size / 2 - te.height / 2 - te.y_bearing);
  cr->show_text(str);
}

}  // namespace

MineField::MineField() {
  add_events(Gdk::BUTTON_PRESS_MASK | Gdk::BUTTON_RELEASE_MASK);
}

void MineField::Reset(Game& game) {
  game.Subscribe(this);
  grid_.Reset(game.GetRows(), game.GetCols());
  pressed_ = false;

  set_size_request(kCellSize * static_cast<int>(game.GetCols()),
                   kCellSize * static_cast<int>(game.GetRows()));
  queue_draw();
}

void MineField::NotifyEvent(const Event& event) {
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
      break;
    case Event::Type::LOSS:
      square.state = CellState::LOSING_MINE;
      break;
    case Event::Type::IDENTIFY_MINE:
      square.state = CellState::MINE;
      break;
  }
  queue_draw();
}

bool MineField::on_draw(const Cairo::RefPtr<Cairo::Context>& cr) {
  if (grid_.GetSize() == 0) {
    return false;
  }

  const DrawingDimensions dim = GetDrawingDimensions();
  grid_.ForEach([this, &cr, &dim](const Cell& cell, const Square& square) {
    cr->save();
    cr->translate(dim.x + cell.col * dim.cell_size,
                  dim.y + cell.row * dim.cell_size);
    DrawSquare(cr, square, dim.cell_size);
    cr->restore();
  });
  return true;
}

bool MineField::on_button_press_event(GdkEventButton* event) {
  if (event->type != GDK_BUTTON_PRESS) {
    return false;
  }
  pressed_ = GetCellFromPoint(event->x, event->y, &pressed_cell_);
  return pressed_;
}

bool MineField::on_button_release_event(GdkEventButton* event) {
  if (!pressed_) {
    return false;
  }
  pressed_ = false;

  // Only act if the release was in the same cell that was pressed.
  Cell cell;
  if (!GetCellFromPoint(event->x, event->y, &cell) || cell != pressed_cell_) {
    return false;
  }

  if (event->button == 1) {
    signal_action_.emit(Action{Action::Type::UNCOVER, cell});
  } else if (event->button == 3) {
    signal_action_.emit(Action{Action::Type::FLAG, cell});
  }
  return true;
}

MineField::DrawingDimensions MineField::GetDrawingDimensions() const {
  const double width = get_allocated_width();
  const double height = get_allocated_height();
  const double cell_size =
      std::floor(std::min(width / grid_.GetCols(), height / grid_.GetRows()));

  DrawingDimensions dim;
  dim.cell_size = cell_size;
  dim.x = std::floor((width - cell_size * grid_.GetCols()) / 2);
  dim.y = std::floor((height - cell_size * grid_.GetRows()) / 2);
  return dim;
}

bool MineField::GetCellFromPoint(double x, double y, Cell* cell) const {
  if (grid_.GetSize() == 0) {
    return false;
  }
  const DrawingDimensions dim = GetDrawingDimensions();
  if (x < dim.x || y < dim.y || dim.cell_size <= 0.0) {
    return false;
  }
  const Cell candidate{
      static_cast<std::size_t>((y - dim.y) / dim.cell_size),
      static_cast<std::size_t>((x - dim.x) / dim.cell_size)};
  if (!grid_.IsValid(candidate)) {
    return false;
  }
  *cell = candidate;
  return true;
}

void MineField::DrawSquare(const Cairo::RefPtr<Cairo::Context>& cr,
                           const Square& square, double size) const {
  switch (square.state) {
    case CellState::UNCOVERED:
      DrawBackground(cr, kUncoveredColor, size);
      if (square.adjacent_mines > 0 && square.adjacent_mines <= 8) {
        DrawNumber(cr, square.adjacent_mines, size);
      }
      break;
    case CellState::COVERED:
      DrawBackground(cr, kCoveredColor, size);
      break;
    case CellState::FLAGGED:
      DrawBackground(cr, kCoveredColor, size);
      DrawFlag(cr, size);
      break;
    case CellState::MINE:
      DrawBackground(cr, kUncoveredColor, size);
      DrawMine(cr, size);
      break;
    case CellState::LOSING_MINE:
      DrawBackground(cr, kLosingMineColor, size);
      DrawMine(cr, size);
      break;
  }
}

}  // namespace ui
}  // namespace sweeper
