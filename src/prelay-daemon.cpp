/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-daemon.cpp
 * @brief Entry point for the print relay daemon.
 *
 * Loads the configuration, starts the relay server and runs the
 * Prelay_Runtime main loop until SIGINT or SIGTERM. SIGHUP reloads the
 * configuration file and restarts the server with it. Server events are
 * written to the console and, when log_dir is set, to a log file.
 */

#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "prelay.hpp"

namespace {

struct Options {
  std::string config_path{};
  std::optional<uint16_t> port{};
  std::optional<std::string> printer_name{};
  bool list_printers{};
};

void usage(const char *prog) {
  std::cout << "Usage: " << prog
            << " [-c config.json] [-p port] [-P printer] [--list-printers]"
               " [--help]\n"
            << "  -c, --config FILE    configuration file (default: search"
               " ./config.json, ~/.config/prelay, $TMPDIR/prelay)\n"
            << "  -p, --port PORT      listening port (overrides config)\n"
            << "  -P, --printer NAME   printer device or queue (overrides"
               " config)\n"
            << "      --list-printers  list printers of the configured sink"
               " and exit\n"
            << "  -h, --help           show this help\n";
}

auto parsePort(const std::string &text) -> std::optional<uint16_t> {
  try {
    size_t used{};
    const unsigned long value = std::stoul(text, &used);

    if (used != text.size() || value < 1 || value > 65535) {
      return std::nullopt;
    }

    return static_cast<uint16_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

void applyOverrides(const Options &options, prelay::ServerConfig &config) {
  if (options.port) {
    config.port = *options.port;
  }

  if (options.printer_name) {
    config.printer_name = *options.printer_name;
  }
}

auto loadConfig(prelay::Prelay_Config_Store &store, const Options &options)
    -> std::optional<prelay::ServerConfig> {
  auto loaded = store.load();
  if (!loaded) {
    std::cerr << "[!] " << prelay::toString(loaded.error().code) << ": "
              << loaded.error().message << "\n";

    return std::nullopt;
  }

  applyOverrides(options, *loaded);

  return *loaded;
}

} // namespace

int main(int argc, char *argv[]) {
  // Before any thread exists, so all of them inherit the mask.
  prelay::Prelay_Runtime::blockSignals();

  Options options{};

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](const std::string &what) -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << what << "\n";
        return std::nullopt;
      }

      return std::string{argv[++i]};
    };

    if ("-c" == arg || "--config" == arg) {
      auto value = next(arg);
      if (!value) {
        return 2;
      }

      options.config_path = *value;
    } else if ("-p" == arg || "--port" == arg) {
      auto value = next(arg);
      if (!value) {
        return 2;
      }

      options.port = parsePort(*value);
      if (!options.port) {
        std::cerr << "invalid port: " << *value << "\n";
        return 2;
      }
    } else if ("-P" == arg || "--printer" == arg) {
      auto value = next(arg);
      if (!value) {
        return 2;
      }

      options.printer_name = *value;
    } else if ("--list-printers" == arg) {
      options.list_printers = true;
    } else if ("-h" == arg || "--help" == arg) {
      usage(argv[0]);
      return 0;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage(argv[0]);
      return 2;
    }
  }

  // An empty path searches the default locations.
  prelay::Prelay_Config_Store store{options.config_path};

  auto config = loadConfig(store, options);
  if (!config) {
    return 1;
  }

  if (options.list_printers) {
    auto sink = prelay::makePrintSink(*config);
    if (!sink) {
      std::cerr << "[!] " << sink.error().message << "\n";
      return 1;
    }

    for (const auto &printer : (*sink)->listPrinters()) {
      std::cout << printer << "\n";
    }

    return 0;
  }

  prelay::Prelay_Event_Log log{std::cout, config->log_dir,
                               config->log_retention_days};

  if (!store.path().empty()) {
    log.log(prelay::Prelay_Event_Log::Level::kInfo,
            "[INFO] Configuration loaded from " + store.path().string());
  } else {
    log.log(prelay::Prelay_Event_Log::Level::kInfo,
            "[INFO] No configuration file found, using defaults");
  }

  if (config->printer_name.empty()) {
    log.log(prelay::Prelay_Event_Log::Level::kError,
            "[!] No printer configured! Set printer_name or use -P");
    return 1;
  }

  prelay::Prelay_Relay_Server server{};
  server.subscribe(&log);

  auto started = server.start(*config);
  if (!started) {
    return 1;
  }

  prelay::Prelay_Runtime runtime{};

  runtime.registerSignalHandler(SIGHUP, [&]([[maybe_unused]] int signo) {
    log.log(prelay::Prelay_Event_Log::Level::kInfo,
            "[INFO] SIGHUP received, reloading configuration");

    auto reloaded = loadConfig(store, options);
    if (!reloaded) {
      log.log(prelay::Prelay_Event_Log::Level::kWarning,
              "[WARN] Keeping the running configuration");
      return;
    }

    if (reloaded->printer_name.empty()) {
      log.log(prelay::Prelay_Event_Log::Level::kWarning,
              "[WARN] Reloaded configuration has no printer, keeping the"
              " running configuration");
      return;
    }

    auto restarted = server.restart(*reloaded);
    if (!restarted) {
      log.log(prelay::Prelay_Event_Log::Level::kError,
              "[!] Restart failed: " + restarted.error().message);
    }
  });

  runtime.enterMainLoop();

  auto stopped = server.stop();
  if (!stopped) {
    log.log(prelay::Prelay_Event_Log::Level::kInfo,
            "[INFO] " + stopped.error().message);
  }

  return 0;
}
