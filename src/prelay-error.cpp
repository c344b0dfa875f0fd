/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-error.cpp
 * @brief Names of the error codes, used in log lines and CLI messages.
 */

#include "prelay-error.hpp"

#include <string_view>

namespace prelay {

auto toString(StartErrorCode code) -> std::string_view {
  switch (code) {
  case StartErrorCode::kAlreadyRunning:
    return "AlreadyRunning";
  case StartErrorCode::kBindError:
    return "BindError";
  case StartErrorCode::kPortBusy:
    return "PortBusy";
  case StartErrorCode::kInvalidConfig:
    return "InvalidConfig";
  }

  return "Unknown";
}

auto toString(StopErrorCode code) -> std::string_view {
  switch (code) {
  case StopErrorCode::kNotRunning:
    return "NotRunning";
  }

  return "Unknown";
}

auto toString(PortErrorCode code) -> std::string_view {
  switch (code) {
  case PortErrorCode::kPortBusy:
    return "PortBusy";
  case PortErrorCode::kReclaimFailed:
    return "ReclaimFailed";
  case PortErrorCode::kLookupFailed:
    return "LookupFailed";
  }

  return "Unknown";
}

auto toString(SinkErrorCode code) -> std::string_view {
  switch (code) {
  case SinkErrorCode::kNotFound:
    return "NotFound";
  case SinkErrorCode::kDeliveryFailed:
    return "DeliveryFailed";
  }

  return "Unknown";
}

auto toString(ConnectionErrorCode code) -> std::string_view {
  switch (code) {
  case ConnectionErrorCode::kReadError:
    return "ReadError";
  case ConnectionErrorCode::kCancelled:
    return "Cancelled";
  case ConnectionErrorCode::kRejected:
    return "Rejected";
  case ConnectionErrorCode::kEmptyJob:
    return "EmptyJob";
  }

  return "Unknown";
}

auto toString(ConfigErrorCode code) -> std::string_view {
  switch (code) {
  case ConfigErrorCode::kNotFound:
    return "NotFound";
  case ConfigErrorCode::kParseError:
    return "ParseError";
  case ConfigErrorCode::kInvalidValue:
    return "InvalidValue";
  case ConfigErrorCode::kWriteFailed:
    return "WriteFailed";
  }

  return "Unknown";
}

} // namespace prelay
