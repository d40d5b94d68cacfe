#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>

#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    SyncEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "replisync");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      std::cerr << parser.usage(*settings);
      return 2;
    }
    if(settings->help_requested()) {
      print_out(nullptr, "{}", parser.usage(*settings));
      return 0;
    }

    SyncEngine engine(settings, options);
    auto logger = engine.logger();
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    if(settings->get<bool>("verbose")) {
      engine.logger()->debug("Verbose logging enabled");
    }

    // The engine runs on its own thread; this one waits for a signal.
    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&engine](const std::error_code& ec, int){
      if(!ec) engine.logger()->print("Shutting down");
    });
    engine.start_background();
    signal_io.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("replisync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
