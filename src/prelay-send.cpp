/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-send.cpp
 * @brief Test client: sends one job to a relay and waits for it to close.
 *
 * Sends the contents of file, or "Hello World" when no file is given,
 * then half-closes the connection to mark the end of the job and waits
 * for the relay to close its side.
 */

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "prelay-config.hpp"
#include "prelay-socket.hpp"

namespace {

constexpr std::chrono::milliseconds kDefaultTimeout{5000};

void usage(const char *prog) {
  std::cout << "Usage: " << prog << " [-H host] [-p port] [-t timeout_ms]"
            << " [file]\n"
            << "  -H, --host HOST      relay IPv4 address (default 127.0.0.1)\n"
            << "  -p, --port PORT      relay port (default "
            << prelay::ServerConfig::kDefaultPort << ")\n"
            << "  -t, --timeout MS     connect and reply timeout (default "
            << kDefaultTimeout.count() << ")\n"
            << "  file                 data to send (default \"Hello World\")\n";
}

auto parseNumber(const std::string &text, unsigned long max)
    -> std::optional<unsigned long> {
  try {
    size_t used{};
    const unsigned long value = std::stoul(text, &used);

    if (used != text.size() || value > max) {
      return std::nullopt;
    }

    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::string host{"127.0.0.1"};
  uint16_t port{prelay::ServerConfig::kDefaultPort};
  std::chrono::milliseconds timeout{kDefaultTimeout};
  std::string file{};

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return std::nullopt;
      }

      return std::string{argv[++i]};
    };

    if ("-H" == arg || "--host" == arg) {
      auto value = next();
      if (!value) {
        return 2;
      }

      host = "localhost" == *value ? "127.0.0.1" : *value;
    } else if ("-p" == arg || "--port" == arg) {
      auto value = next();
      auto number = value ? parseNumber(*value, 65535) : std::nullopt;
      if (!number || 0 == *number) {
        std::cerr << "invalid port\n";
        return 2;
      }

      port = static_cast<uint16_t>(*number);
    } else if ("-t" == arg || "--timeout" == arg) {
      auto value = next();
      auto number = value ? parseNumber(*value, 3600000) : std::nullopt;
      if (!number) {
        std::cerr << "invalid timeout\n";
        return 2;
      }

      timeout = std::chrono::milliseconds{*number};
    } else if ("-h" == arg || "--help" == arg) {
      usage(argv[0]);
      return 0;
    } else if (file.empty() && !arg.starts_with("-")) {
      file = arg;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage(argv[0]);
      return 2;
    }
  }

  std::string data{"Hello World"};

  if (!file.empty()) {
    std::ifstream in{file, std::ios::binary};
    if (!in) {
      std::cerr << "[ERROR] Can not read " << file << "\n";
      return 1;
    }

    std::ostringstream content{};
    content << in.rdbuf();
    data = content.str();
  }

  std::cout << "[INFO] Connecting to " << host << ":" << port << "...\n";

  try {
    prelay::Prelay_Tcp_Stream stream{host, port, timeout};

    std::cout << "[OK] Connected successfully!\n";

    stream.write(data);
    stream.shutdownWrite();

    std::cout << "[OK] Data sent successfully! (" << data.size()
              << " bytes)\n";

    // The relay closes its side once the job is handed to the printer.
    while (true) {
      auto reply = stream.readSome(timeout);
      if (!reply) {
        std::cerr << "[WARN] No close from the relay: "
                  << reply.error().message() << "\n";
        break;
      }

      if (reply->empty()) {
        break;
      }
    }
  } catch (const std::system_error &e) {
    const int err = e.code().value();

    if (ECONNREFUSED == err) {
      std::cerr << "[ERROR] Connection refused. Is the server running on "
                << host << ":" << port << "?\n";
    } else if (ETIMEDOUT == err || EINPROGRESS == err || EAGAIN == err) {
      std::cerr << "[ERROR] Connection timeout. Check the IP address and"
                << " port.\n";
    } else {
      std::cerr << "[ERROR] " << e.what() << "\n";
    }

    return 1;
  }

  return 0;
}
