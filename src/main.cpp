#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <string>

#include "command_line_parser.hpp"
#include "config.hpp"
#include "log.hpp"
#include "node.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    init(false);
    Logger logger("lanshare");
    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "lanshare");

    // first pass only locates the shared folder, whose settings file is then
    // loaded and overridden by the command line
    SettingsManager bootstrap;
    std::string error;
    if(!parser.parse(argc, argv, bootstrap, error)) {
      logger.print_err("{}", error);
      parser.usage();
      return 1;
    }
    if(bootstrap.help_requested()) {
      parser.usage();
      return 0;
    }

    std::filesystem::path folder = bootstrap.get<std::string>("folder");
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(folder / ".config" / "settings.json");
    bool loaded = settings->load();
    // the folder that holds the settings file always wins over a stored one
    if(!parser.parse(argc, argv, *settings, error) ||
       !settings->set_from_string("folder", folder.string(), error)) {
      logger.print_err("{}", error);
      return 1;
    }

    init(settings->get<bool>("verbose"));
    if(loaded) {
      logger.debug("Loaded settings from {}", settings->settings_path().string());
    }

    std::error_code ec;
    if(!std::filesystem::is_directory(folder, ec)) {
      logger.error("Shared folder {} does not exist", folder.string());
      return 1;
    }
    if(settings->get<bool>("readonly") && settings->get<bool>("writeonly")) {
      logger.error("readonly and writeonly cannot be combined");
      return 1;
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger.error("Unable to persist settings to {}", settings->settings_path().string());
      } else {
        logger.info("Settings saved to {}", settings->settings_path().string());
      }
    }

    auto config = Config::from_settings(*settings);

    Node::Options options;
    options.start_shell = true;
    options.use_console = true;
    options.exit_on_session_end = true;

    Node node(config, options);
    node.start();
    node.run();
    node.stop();

    return node.exit_code();
  } catch(std::exception& e) {
    init(false);
    Logger logger("lanshare-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
