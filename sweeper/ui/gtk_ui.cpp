#include "sweeper/ui/gtk_ui.h"

#include <memory>

#include <giomm/application.h>
#include <sigc++/functors/mem_fun.h>

#include "sweeper/ui/game_window.h"

namespace sweeper {
namespace ui {

namespace {

constexpr const char* kApplicationId = "org.sweeper.Sweeper";

// The master GTK application.
class SweeperApplication : public Gtk::Application {
 public:
  explicit SweeperApplication(const Config& config)
      : Gtk::Application(kApplicationId, Gio::APPLICATION_NON_UNIQUE),
        config_(config) {}

 private:
  // Handler for the activate signal. Creates the game window.
  void on_activate() final {
    Gtk::Application::on_activate();

    window_.reset(new GameWindow(config_));
    add_window(*window_);
    window_->signal_hide().connect(
        sigc::mem_fun(this, &SweeperApplication::OnHideWindow));
    window_->present();
  }

  // Destroys the game window when it receives a hide signal.
  void OnHideWindow() { window_.reset(); }

  const Config config_;
  std::unique_ptr<GameWindow> window_;
};

}  // namespace

Glib::RefPtr<Gtk::Application> NewGtkUi(const Config& config) {
  return Glib::RefPtr<Gtk::Application>(new SweeperApplication(config));
}

}  // namespace ui
}  // namespace sweeper
