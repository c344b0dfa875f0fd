/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-config.cpp
 * @brief JSON configuration load/save through protobuf's JSON utilities.
 */

#include "prelay-config.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "prelay-debug.hpp"

namespace prelay {

namespace {

constexpr const char *kConfigFileName = "config.json";

auto invalid(std::string message) -> std::unexpected<ConfigError> {
  return std::unexpected(
      ConfigError{ConfigErrorCode::kInvalidValue, std::move(message)});
}

} // namespace

auto validateConfig(const ServerConfig &config, bool allow_ephemeral_port)
    -> std::expected<void, ConfigError> {
  if (0 == config.port && !allow_ephemeral_port) {
    return invalid("port must be between 1 and 65535");
  }

  if (0 == config.max_jobs) {
    return invalid("max_jobs must be at least 1");
  }

  if (config.sink != "device" && config.sink != "cups") {
    return invalid("sink must be \"device\" or \"cups\", not \"" +
                   config.sink + "\"");
  }

  return {};
}

auto mergeConfig(const ServerConfigPb &pb, ServerConfig config)
    -> std::expected<ServerConfig, ConfigError> {
  if (pb.has_printer_name()) {
    config.printer_name = pb.printer_name();
  }

  if (pb.has_port()) {
    if (pb.port() < 1 || pb.port() > std::numeric_limits<uint16_t>::max()) {
      return invalid("port " + std::to_string(pb.port()) +
                     " is outside 1..65535");
    }

    config.port = static_cast<uint16_t>(pb.port());
  }

  if (pb.has_auto_start()) {
    config.auto_start = pb.auto_start();
  }

  if (pb.has_minimize_to_tray()) {
    config.minimize_to_tray = pb.minimize_to_tray();
  }

  if (pb.has_service_name()) {
    config.service_name = pb.service_name();
  }

  if (pb.has_service_description()) {
    config.service_description = pb.service_description();
  }

  if (pb.has_bind_address()) {
    config.bind_address = pb.bind_address();
  }

  if (pb.has_max_jobs()) {
    config.max_jobs = pb.max_jobs();
  }

  if (pb.has_grace_period_ms()) {
    config.grace_period_ms = pb.grace_period_ms();
  }

  if (pb.has_idle_timeout_ms()) {
    config.idle_timeout_ms = pb.idle_timeout_ms();
  }

  if (pb.has_port_reclaim_retries()) {
    config.port_reclaim_retries = pb.port_reclaim_retries();
  }

  if (pb.has_port_reclaim_delay_ms()) {
    config.port_reclaim_delay_ms = pb.port_reclaim_delay_ms();
  }

  if (pb.has_sink()) {
    config.sink = pb.sink();
  }

  if (pb.has_device_dir()) {
    config.device_dir = pb.device_dir();
  }

  if (pb.has_log_dir()) {
    config.log_dir = pb.log_dir();
  }

  if (pb.has_log_retention_days()) {
    config.log_retention_days = pb.log_retention_days();
  }

  auto valid = validateConfig(config);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  return config;
}

auto toConfigPb(const ServerConfig &config) -> ServerConfigPb {
  ServerConfigPb pb{};

  pb.set_printer_name(config.printer_name);
  pb.set_port(config.port);
  pb.set_auto_start(config.auto_start);
  pb.set_minimize_to_tray(config.minimize_to_tray);
  pb.set_service_name(config.service_name);
  pb.set_service_description(config.service_description);
  pb.set_bind_address(config.bind_address);
  pb.set_max_jobs(config.max_jobs);
  pb.set_grace_period_ms(config.grace_period_ms);
  pb.set_idle_timeout_ms(config.idle_timeout_ms);
  pb.set_port_reclaim_retries(config.port_reclaim_retries);
  pb.set_port_reclaim_delay_ms(config.port_reclaim_delay_ms);
  pb.set_sink(config.sink);
  pb.set_device_dir(config.device_dir);
  pb.set_log_dir(config.log_dir);
  pb.set_log_retention_days(config.log_retention_days);

  return pb;
}

auto parseConfig(const std::string &json)
    -> std::expected<ServerConfig, ConfigError> {
  ServerConfigPb pb{};
  google::protobuf::util::JsonParseOptions options{};

  options.ignore_unknown_fields = true;

  const auto status =
      google::protobuf::util::JsonStringToMessage(json, &pb, options);
  if (!status.ok()) {
    return std::unexpected(ConfigError{ConfigErrorCode::kParseError,
                                       std::string{status.message()}});
  }

  return mergeConfig(pb, ServerConfig{});
}

auto formatConfig(const ServerConfig &config)
    -> std::expected<std::string, ConfigError> {
  std::string json{};
  google::protobuf::util::JsonPrintOptions options{};

  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;

  const auto status =
      google::protobuf::util::MessageToJsonString(toConfigPb(config), &json,
                                                  options);
  if (!status.ok()) {
    return std::unexpected(ConfigError{ConfigErrorCode::kWriteFailed,
                                       std::string{status.message()}});
  }

  return json;
}

auto defaultConfigPaths() -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> paths{};

  paths.emplace_back(kConfigFileName);

  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    paths.push_back(std::filesystem::path{xdg} / "prelay" / kConfigFileName);
  } else if (const char *home = std::getenv("HOME"); home && *home) {
    paths.push_back(std::filesystem::path{home} / ".config" / "prelay" /
                    kConfigFileName);
  }

  std::error_code ec{};
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    tmp = "/tmp";
  }

  paths.push_back(tmp / "prelay" / kConfigFileName);

  return paths;
}

// class Prelay_Config_Store
Prelay_Config_Store::Prelay_Config_Store(std::filesystem::path path)
    : m_explicit_path{std::move(path)} {}

auto Prelay_Config_Store::load() -> std::expected<ServerConfig, ConfigError> {
  std::vector<std::filesystem::path> candidates{};

  if (!m_explicit_path.empty()) {
    candidates.push_back(m_explicit_path);
  } else {
    candidates = defaultConfigPaths();
  }

  for (const auto &candidate : candidates) {
    std::error_code ec{};

    if (!std::filesystem::exists(candidate, ec)) {
      continue;
    }

    std::ifstream in{candidate};
    if (!in) {
      PRELAY_DEBUG_PRINT(std::cerr << "config: can not read " << candidate
                                   << ", trying next location\n");
      continue;
    }

    std::stringstream content{};
    content << in.rdbuf();

    auto config = parseConfig(content.str());
    if (!config) {
      config.error().message =
          candidate.string() + ": " + config.error().message;

      return config;
    }

    m_path = candidate;

    return config;
  }

  if (!m_explicit_path.empty()) {
    return std::unexpected(ConfigError{
        ConfigErrorCode::kNotFound,
        "configuration file " + m_explicit_path.string() + " does not exist"});
  }

  return ServerConfig{};
}

auto Prelay_Config_Store::save(const ServerConfig &config)
    -> std::expected<void, ConfigError> {
  auto json = formatConfig(config);
  if (!json) {
    return std::unexpected(json.error());
  }

  std::vector<std::filesystem::path> candidates{};

  if (!m_path.empty()) {
    candidates.push_back(m_path);
  } else if (!m_explicit_path.empty()) {
    candidates.push_back(m_explicit_path);
  }

  for (auto &path : defaultConfigPaths()) {
    candidates.push_back(std::move(path));
  }

  for (const auto &candidate : candidates) {
    std::error_code ec{};

    if (candidate.has_parent_path()) {
      std::filesystem::create_directories(candidate.parent_path(), ec);
      if (ec) {
        continue;
      }
    }

    std::ofstream out{candidate, std::ios::trunc};
    if (!out) {
      continue;
    }

    out << *json << "\n";
    out.close();
    if (!out) {
      continue;
    }

    m_path = candidate;

    return {};
  }

  return std::unexpected(ConfigError{
      ConfigErrorCode::kWriteFailed,
      "failed to save configuration to any location"});
}

auto Prelay_Config_Store::path() const -> const std::filesystem::path & {
  return m_path;
}

} // namespace prelay
