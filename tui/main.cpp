#include "config.hpp"
#include "logging.hpp"
#include "pathutils.hpp"
#include "pickerui.hpp"
#include "stdoutredirect.hpp"

#include <filesystem>
#include <iostream>
#include <spdlog/spdlog.h>

namespace {

void printUsage(std::ostream &out) {
  out << "pf - folder picker\n"
      << "\n"
      << "Usage: pf [start-path]\n"
      << "\n"
      << "Options:\n"
      << "  --help, -h      Show this help\n"
      << "  --version, -v   Show version\n"
      << "\n"
      << "Press F1 inside pf for keyboard shortcuts.\n"
      << "The selected folder is printed on stdout; use it as\n"
      << "  cd \"$(pf)\"\n";
}

PickerConfig loadConfig(const std::optional<std::string> &home) {
  PickerConfig config;
  auto path = PickerConfig::defaultConfigPath(home);

  std::error_code ec;
  if (path && std::filesystem::exists(*path, ec)) {
    config.loadFromFile(*path);
  }
  for (const auto &warning : config.warnings()) {
    spdlog::warn("{}", warning);
  }
  return config;
}

} // namespace

int main(int argc, char *argv[]) {
  initConsoleLogging();

  std::string start_arg;
  if (argc > 1) {
    const std::string arg = argv[1];
    if (arg == "--help" || arg == "-h") {
      printUsage(std::cerr);
      return 0;
    }
    if (arg == "--version" || arg == "-v") {
      std::cerr << "pf " << FOLDERPICK_VERSION << std::endl;
      return 0;
    }
    start_arg = arg;
  }

  const auto home = homeDirectory();
  if (!home) {
    spdlog::warn("cannot resolve home directory; '~' will not expand");
  }

  PickerConfig config = loadConfig(home);
  const std::string start_dir = resolveStartPath(start_arg, home);

  std::error_code ec;
  if (!std::filesystem::is_directory(start_dir, ec)) {
    spdlog::warn("{} is not a readable directory", start_dir);
  }

  configureLogging(config);

  std::string selected;
  try {
    StdoutRedirect redirect;
    if (!redirect.active()) {
      spdlog::warn("could not redirect stdout; output may be mixed");
    }

    PickerUI ui(config, start_dir, home);
    ui.initialize();
    ui.run();
    selected = ui.selectedPath();
  } catch (const std::exception &e) {
    // Terminal is already restored by the screen's destructor
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (!selected.empty()) {
    std::cout << selected << std::endl;
  }
  return 0;
}
