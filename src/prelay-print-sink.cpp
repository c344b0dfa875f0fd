/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-print-sink.cpp
 */

#include "prelay-print-sink.hpp"

#include "prelay-device-print-sink.hpp"

#ifdef PRELAY_HAVE_CUPS
#include "prelay-cups-print-sink.hpp"
#endif

namespace prelay {

auto makePrintSink(const ServerConfig &config)
    -> std::expected<std::unique_ptr<Prelay_Print_Sink>, ConfigError> {
  if ("device" == config.sink) {
    return std::make_unique<Prelay_Device_Print_Sink>(config.device_dir);
  }

  if ("cups" == config.sink) {
#ifdef PRELAY_HAVE_CUPS
    return std::make_unique<Prelay_Cups_Print_Sink>();
#else
    return std::unexpected(ConfigError{
        ConfigErrorCode::kInvalidValue,
        "sink \"cups\" is not available, prelay was built without CUPS"});
#endif
  }

  return std::unexpected(ConfigError{ConfigErrorCode::kInvalidValue,
                                     "unknown sink \"" + config.sink + "\""});
}

} // namespace prelay
