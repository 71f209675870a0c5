// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream> // CLI output and errors before the logger exists
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] [identifier]\n"
      << "\n"
      << "Advertises <identifier> on the local network and logs the peers it\n"
      << "sees. The identifier defaults to $PEER_ID, then \"bob\".\n"
      << "\n"
      << "Options:\n"
      << "  --summary=<secs>     Seconds between peer summaries (default: 5)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: taken from $LANPEER_LOG\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: peer, discovery, app, all\n"
      << "                       Can be comma-separated: --debug=peer,discovery\n"
      << "\n"
      << "Environment:\n"
      << "  PEER_ID              Identifier when none is given\n"
      << "  LANPEER_LOG          Log filter, e.g. \"info,discovery=debug\"\n"
      << "  LANPEER_WORKERS      Worker threads (0 = one per core)\n"
      << "  LANPEER_SUMMARY_SECS Seconds between peer summaries\n"
      << "  LANPEER_PORT         Multicast port (default 45454)\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    lanpeer::app::AppConfig config;
    std::string env_error;
    if (!config.LoadEnvironment(&env_error)) {
      std::cerr << "Error: " << env_error << std::endl;
      return 1;
    }

    std::string log_level;
    std::vector<std::string> debug_components;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << lanpeer::GetFullVersionString() << std::endl;
        std::cout << lanpeer::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--summary=") == 0) {
        auto secs = lanpeer::util::SafeParseInt(arg.substr(10), 1, 3600);
        if (!secs) {
          std::cerr << "Error: Invalid summary interval: " << arg.substr(10) << std::endl;
          std::cerr << "Interval must be a number of seconds between 1 and 3600" << std::endl;
          return 1;
        }
        config.process_config.summary_interval = std::chrono::seconds(*secs);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
        if (!lanpeer::util::LogManager::IsValidLevel(log_level)) {
          std::cerr << "Error: Invalid log level: " << log_level << std::endl;
          return 1;
        }
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=peer,discovery
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      } else {
        positional.push_back(arg);
      }
    }

    if (positional.size() > 1) {
      std::cerr << "Error: expected at most one identifier" << std::endl;
      print_usage(argv[0]);
      return 1;
    }
    if (!positional.empty()) {
      config.identifier = positional.front();
    }

    lanpeer::util::LogManager::InitializeFromEnvironment();
    if (!log_level.empty()) {
      lanpeer::util::LogManager::SetLogLevel(log_level);
    }
    for (const auto &component : debug_components) {
      if (component == "all") {
        lanpeer::util::LogManager::SetLogLevel("trace");
      } else {
        lanpeer::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    std::cout << lanpeer::GetStartupBanner(config.identifier) << std::flush;

    // Nested scope: the application (and its worker threads) must be gone
    // before LogManager::Shutdown()
    int exit_code = 0;
    {
      lanpeer::app::Application app(config);

      if (!app.start()) {
        LOG_APP_ERROR("Failed to start application");
        lanpeer::util::LogManager::Shutdown();
        return 1;
      }

      app.wait_for_shutdown();

      if (!app.session_ok()) {
        LOG_APP_ERROR("Session failed: {}", app.session_error());
        exit_code = 1;
      }
    }

    lanpeer::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Logger may not be usable while unwinding
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    lanpeer::util::LogManager::Shutdown();
    return 1;
  }
}
