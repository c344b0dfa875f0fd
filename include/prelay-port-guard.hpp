/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-port-guard.hpp
 * @brief Makes sure the relay's listening port is free before binding,
 *        reclaiming it from a stale instance of the relay if needed.
 *
 * The lookup does not bind. It looks for a TCP socket in LISTEN state on
 * the port in the kernel socket tables (/proc/net/tcp and /proc/net/tcp6),
 * then maps the socket inode to its owning process by scanning
 * /proc/<pid>/fd for "socket:[inode]".
 *
 * An owner is a stale instance when it is not this process and either
 * runs the same executable as this process or carries the configured
 * service name as its process name. Stale instances are sent SIGTERM,
 * then SIGKILL if the port is still held after the reclaim delay. Any
 * other owner is reported and left alone.
 */

#ifndef PRELAY_PORT_GUARD_HPP_
#define PRELAY_PORT_GUARD_HPP_

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

#include "prelay-error.hpp"

namespace prelay {

struct PortConflict {
  pid_t pid{};
  std::string process_name{};
  std::string executable{};
};

class Prelay_Port_Guard {
public:
  struct Options {
    std::string service_name{};
    uint32_t reclaim_retries{1};
    std::chrono::milliseconds reclaim_delay{1000};
  };

  explicit Prelay_Port_Guard(Options options);
  virtual ~Prelay_Port_Guard() noexcept = default;

  Prelay_Port_Guard(const Prelay_Port_Guard &obj) = delete;
  const Prelay_Port_Guard &operator=(const Prelay_Port_Guard &obj) = delete;
  Prelay_Port_Guard(Prelay_Port_Guard &&obj) = delete;
  Prelay_Port_Guard &operator=(Prelay_Port_Guard &&obj) = delete;

  /**
   * @brief Succeed if nothing listens on port, reclaiming it from a stale
   *        instance when possible.
   *
   * @return kPortBusy with the occupant for a foreign listener (pid 0 and
   *         "unknown" if the owner can not be identified), kReclaimFailed
   *         if a stale instance still holds the port after the retries.
   */
  auto ensureAvailable(uint16_t port) -> std::expected<void, PortError>;

  /**
   * @brief The process listening on port, if any.
   */
  static auto findListener(uint16_t port) -> std::optional<PortConflict>;

  auto isSelfInstance(const PortConflict &conflict) const -> bool;

private:
  void reclaim(uint16_t port, const PortConflict &conflict);
  auto waitForRelease(uint16_t port, pid_t pid) -> bool;

  Options m_options{};
};

} // namespace prelay

#endif // PRELAY_PORT_GUARD_HPP_
