/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-config.hpp
 * @brief Relay configuration record and its JSON file persistence.
 *
 * The configuration file is a JSON object parsed with protobuf's JSON
 * utilities into a ServerConfigPb message (proto/prelay-config.proto),
 * so both snake_case ("printer_name") and lowerCamelCase ("printerName")
 * keys are accepted and keys unknown to this version are ignored. Keys
 * missing from the file keep the defaults of ServerConfig.
 *
 * Lookup order when no explicit path is given:
 *   ./config.json
 *   $XDG_CONFIG_HOME/prelay/config.json (or $HOME/.config/prelay/...)
 *   $TMPDIR/prelay/config.json (or /tmp/prelay/...)
 */

#ifndef PRELAY_CONFIG_HPP_
#define PRELAY_CONFIG_HPP_

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "prelay-error.hpp"

#include "proto/prelay-config.pb.h"

namespace prelay {

struct ServerConfig {
  static constexpr uint16_t kDefaultPort{9100};

  std::string printer_name{};
  uint16_t port{kDefaultPort};
  bool auto_start{};
  bool minimize_to_tray{true};
  std::string service_name{"prelay"};
  std::string service_description{
      "prelay - network print relay for raw print data"};

  std::string bind_address{"0.0.0.0"};
  uint32_t max_jobs{64};
  uint32_t grace_period_ms{3000};
  uint32_t idle_timeout_ms{};
  uint32_t port_reclaim_retries{1};
  uint32_t port_reclaim_delay_ms{1000};
  std::string sink{"device"};
  std::string device_dir{"/dev/usb"};
  std::string log_dir{};
  uint32_t log_retention_days{30};
};

/**
 * @brief Check value ranges (port 1..65535, max_jobs > 0, known sink).
 *
 * @param allow_ephemeral_port Accept port 0 (bind any free port); used by
 *                             tests.
 */
auto validateConfig(const ServerConfig &config,
                    bool allow_ephemeral_port = false)
    -> std::expected<void, ConfigError>;

/**
 * @brief Merge the fields present in pb over config.
 */
auto mergeConfig(const ServerConfigPb &pb, ServerConfig config)
    -> std::expected<ServerConfig, ConfigError>;

auto toConfigPb(const ServerConfig &config) -> ServerConfigPb;

auto parseConfig(const std::string &json)
    -> std::expected<ServerConfig, ConfigError>;

auto formatConfig(const ServerConfig &config)
    -> std::expected<std::string, ConfigError>;

/**
 * @brief The candidate file locations, most preferred first.
 */
auto defaultConfigPaths() -> std::vector<std::filesystem::path>;

/**
 * @brief Loads and saves the configuration, remembering where it came
 *        from so a later save writes back to the same file.
 */
class Prelay_Config_Store {
public:
  Prelay_Config_Store() = default;
  explicit Prelay_Config_Store(std::filesystem::path path);

  /**
   * @brief Load from the explicit path, or the first existing default
   *        location. A missing file yields the defaults (kNotFound only
   *        when an explicit path does not exist).
   */
  auto load() -> std::expected<ServerConfig, ConfigError>;

  /**
   * @brief Write config as JSON to the remembered path, falling back to
   *        the default locations; the first writable one wins.
   */
  auto save(const ServerConfig &config) -> std::expected<void, ConfigError>;

  auto path() const -> const std::filesystem::path &;

private:
  std::filesystem::path m_explicit_path{};
  std::filesystem::path m_path{};
};

} // namespace prelay

#endif // PRELAY_CONFIG_HPP_
