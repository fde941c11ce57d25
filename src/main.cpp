#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "rom_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    RomEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "romid");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    RomEngine engine(settings, options);
    auto logger = engine.logger();
    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(settings->save()) {
        logger->info("Saved settings to {}", settings->settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    if(settings->get<std::string>("command").empty() && settings->save_requested()) {
      return 0;
    }

    int status = engine.execute();
    flush_logs();
    return status;
  } catch(std::exception& e) {
    init(false);
    Logger logger("romid-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
