#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "ndog_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "ndog" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "ndog");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      init(false);
      print_err(nullptr, "{}", error);
      parser.usage(*settings);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        log_error(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    NdogEngine engine(settings);
    return engine.run();
  } catch(std::exception& e) {
    init(false);
    Logger logger("ndog-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
