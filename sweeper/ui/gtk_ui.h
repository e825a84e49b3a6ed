#ifndef SWEEPER_UI_GTK_UI_H_
#define SWEEPER_UI_GTK_UI_H_

#include <glibmm/refptr.h>
#include <gtkmm/application.h>

#include "sweeper/ui/config.h"

namespace sweeper {
namespace ui {

// Creates a new GTK application that will create and manage the game.
//
// To create and start an application:
//   sweeper::ui::NewGtkUi(config)->run(argc, argv);
Glib::RefPtr<Gtk::Application> NewGtkUi(const Config& config);

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_GTK_UI_H_
