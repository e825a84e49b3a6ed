// Main program to play with a GTK user interface.

#include <ctime>
#include <iostream>

#include "sweeper/ui/config.h"
#include "sweeper/ui/gtk_ui.h"

int main(int argc, char* argv[]) {
  sweeper::ui::Config config;
  config.seed = static_cast<unsigned>(std::time(nullptr));
  if (!sweeper::ui::ParseArgs(argc, argv, &config, std::cerr)) {
    sweeper::ui::PrintUsage(std::cerr, argv[0]);
    return 1;
  }

  // Options were consumed above, so GTK only sees the program name.
  int gtk_argc = 1;
  return sweeper::ui::NewGtkUi(config)->run(gtk_argc, argv);
}
