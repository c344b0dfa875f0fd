/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-error.hpp
 * @brief Error values returned through std::expected by the relay's
 *        control plane, port guard, print sinks and configuration loader.
 *
 * Each error is a code plus a human readable message. Control operations
 * return these synchronously; per-connection failures never surface here
 * and are reported on the event feed instead.
 */

#ifndef PRELAY_ERROR_HPP_
#define PRELAY_ERROR_HPP_

#include <sys/types.h>

#include <string>
#include <string_view>

namespace prelay {

enum class StartErrorCode { kAlreadyRunning, kBindError, kPortBusy, kInvalidConfig };

struct StartError {
  StartErrorCode code{};
  std::string message{};

  // Set for kPortBusy: the process holding the port (pid 0 if unknown).
  pid_t pid{};
  std::string process_name{};
};

enum class StopErrorCode { kNotRunning };

struct StopError {
  StopErrorCode code{};
  std::string message{};
};

enum class PortErrorCode { kPortBusy, kReclaimFailed, kLookupFailed };

struct PortError {
  PortErrorCode code{};
  std::string message{};
  pid_t pid{};
  std::string process_name{};
};

enum class SinkErrorCode { kNotFound, kDeliveryFailed };

struct SinkError {
  SinkErrorCode code{};
  std::string message{};
};

// Failure of one accepted connection before its bytes reach a sink.
enum class ConnectionErrorCode { kReadError, kCancelled, kRejected, kEmptyJob };

struct ConnectionError {
  ConnectionErrorCode code{};
  std::string message{};
};

enum class ConfigErrorCode { kNotFound, kParseError, kInvalidValue, kWriteFailed };

struct ConfigError {
  ConfigErrorCode code{};
  std::string message{};
};

auto toString(StartErrorCode code) -> std::string_view;
auto toString(StopErrorCode code) -> std::string_view;
auto toString(PortErrorCode code) -> std::string_view;
auto toString(SinkErrorCode code) -> std::string_view;
auto toString(ConnectionErrorCode code) -> std::string_view;
auto toString(ConfigErrorCode code) -> std::string_view;

} // namespace prelay

#endif // PRELAY_ERROR_HPP_
