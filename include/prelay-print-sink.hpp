/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-print-sink.hpp
 * @brief Delivery of one job's raw bytes to a named local printing device.
 *
 * deliver() is synchronous and is called from connection handler threads,
 * possibly several at once, so implementations must be safe for
 * concurrent use. There are no retries: a failed delivery is the job's
 * outcome.
 */

#ifndef PRELAY_PRINT_SINK_HPP_
#define PRELAY_PRINT_SINK_HPP_

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "prelay-config.hpp"
#include "prelay-error.hpp"

namespace prelay {

class Prelay_Print_Sink {
public:
  Prelay_Print_Sink() = default;
  virtual ~Prelay_Print_Sink() noexcept = default;

  Prelay_Print_Sink(const Prelay_Print_Sink &obj) = delete;
  const Prelay_Print_Sink &operator=(const Prelay_Print_Sink &obj) = delete;
  Prelay_Print_Sink(Prelay_Print_Sink &&obj) = delete;
  Prelay_Print_Sink &operator=(Prelay_Print_Sink &&obj) = delete;

  /**
   * @brief Hand data, unmodified, to printer_name.
   *
   * @return kNotFound if the printer is unknown or unavailable,
   *         kDeliveryFailed if the device or spooler rejects the data.
   */
  virtual auto deliver(const std::string &printer_name,
                       const std::string &data)
      -> std::expected<void, SinkError> = 0;

  /**
   * @brief Identifiers this sink can deliver to.
   */
  virtual auto listPrinters() -> std::vector<std::string> = 0;
};

/**
 * @brief Build the sink named by config.sink ("device" or "cups").
 *
 * @return kInvalidValue for an unknown sink or a backend this build does
 *         not include.
 */
auto makePrintSink(const ServerConfig &config)
    -> std::expected<std::unique_ptr<Prelay_Print_Sink>, ConfigError>;

} // namespace prelay

#endif // PRELAY_PRINT_SINK_HPP_
