/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-server.hpp
 * @brief The print relay server: listens on a TCP port and forwards every
 *        connection's bytes, verbatim, to the configured printer.
 *
 * Lifecycle
 *
 *   Stopped --start()--> Starting --+--> Listening --stop()--> Stopping --+
 *      ^                            |                                     |
 *      |                            +--> Failed --+                       |
 *      +------------------------------------------+-----------------------+
 *
 * start(), stop() and restart() are serialized by one control mutex and
 * may be called from any thread; status() only reads an atomic. Every
 * transition is published on the event feed, so a failed start shows up
 * as Starting, Failed (with the reason) and Stopped.
 *
 * Threads
 *  - one accept loop thread, ended by shutting down the listening socket;
 *  - one thread per in-flight job, at most max_jobs of them. A connection
 *    accepted while at the cap is closed at once and reported as
 *    Failed(Rejected);
 *  - a reaper (Prelay_Async) joining finished job threads;
 *  - the event feed's executor.
 *
 * stop() lets in-flight jobs run for the grace period, then cancels the
 * rest, which report Failed(Cancelled). All job outcomes are published
 * before the final Stopped state change.
 */

#ifndef PRELAY_SERVER_HPP_
#define PRELAY_SERVER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "prelay-async.hpp"
#include "prelay-config.hpp"
#include "prelay-connection.hpp"
#include "prelay-error.hpp"
#include "prelay-event.hpp"
#include "prelay-print-sink.hpp"
#include "prelay-proc.hpp"
#include "prelay-socket.hpp"

namespace prelay {

class Prelay_Relay_Server {
public:
  /**
   * @param sink Sink used for every job. When empty, the sink named by
   *             the configuration is built on each start().
   */
  explicit Prelay_Relay_Server(std::shared_ptr<Prelay_Print_Sink> sink = {});
  virtual ~Prelay_Relay_Server() noexcept;

  Prelay_Relay_Server(const Prelay_Relay_Server &obj) = delete;
  const Prelay_Relay_Server &operator=(const Prelay_Relay_Server &obj) = delete;
  Prelay_Relay_Server(Prelay_Relay_Server &&obj) = delete;
  Prelay_Relay_Server &operator=(Prelay_Relay_Server &&obj) = delete;

  /**
   * @brief Claim the port and start accepting jobs.
   *
   * Port 0 binds an ephemeral port, see port().
   *
   * @return kAlreadyRunning (state unchanged) unless Stopped,
   *         kInvalidConfig, kPortBusy for a foreign occupant of the port,
   *         kBindError if bind or listen fails.
   */
  auto start(const ServerConfig &config) -> std::expected<void, StartError>;

  /**
   * @brief Stop accepting, give in-flight jobs the grace period, cancel
   *        the rest and release the port.
   *
   * A job still inside the sink shortly after the grace period is
   * reported Failed(Cancelled) at once and left to finish on its own
   * thread; its late result is not published.
   *
   * @return kNotRunning if already Stopped.
   */
  auto stop() -> std::expected<void, StopError>;

  /**
   * @brief stop() if running, then start(config).
   */
  auto restart(const ServerConfig &config) -> std::expected<void, StartError>;

  auto status() const -> ServerState;

  /**
   * @brief Queue the events published from now on for the returned
   *        subscription.
   */
  auto subscribe() -> std::unique_ptr<Prelay_Event_Subscription>;

  /**
   * @brief Register a callback subscriber; it must unsubscribe() before it
   *        is destroyed.
   */
  void subscribe(Prelay_Event_Subscriber *subscriber);

  auto config() -> ServerConfig;

  /**
   * @brief The bound port while running, 0 when stopped.
   */
  auto port() const -> uint16_t;

  auto activeJobs() -> size_t;

private:
  auto startLocked(const ServerConfig &config)
      -> std::expected<void, StartError>;
  auto stopLocked() -> std::expected<void, StopError>;
  auto failStart(StartError error) -> std::unexpected<StartError>;

  void setState(ServerState next, std::string_view reason = {});

  void acceptLoop();
  void dispatch(std::unique_ptr<Prelay_Tcp_Stream> stream);
  void reject(Job job, std::string reason);
  void onJobComplete(const Job &job);
  void reap(uint64_t job_id);

  Prelay_Event_Feed m_events{"prelay-events"};

  std::mutex m_control_mutex{};
  std::atomic<ServerState> m_state{ServerState::kStopped};
  std::atomic<uint16_t> m_port{};

  std::mutex m_config_mutex{};
  ServerConfig m_config{};

  std::shared_ptr<Prelay_Print_Sink> m_sink{};
  std::shared_ptr<Prelay_Print_Sink> m_active_sink{};

  std::unique_ptr<Prelay_Tcp_Listener> m_listener{};
  std::unique_ptr<Prelay_Proc> m_accept_proc{};

  std::atomic<uint64_t> m_next_job_id{};

  std::mutex m_jobs_mutex{};
  std::condition_variable m_jobs_cond{};
  std::map<uint64_t, std::unique_ptr<Prelay_Connection_Handler>> m_jobs{};

  // Jobs whose outcome is not published yet, as recorded at dispatch.
  std::map<uint64_t, Job> m_pending{};

  // Handlers reported cancelled by stop() while still inside the sink;
  // joined once done, at the latest by the destructor.
  std::vector<std::unique_ptr<Prelay_Connection_Handler>> m_abandoned{};

  Prelay_Async m_reaper{"prelay-reaper"};
}; // class Prelay_Relay_Server

} // namespace prelay

#endif // PRELAY_SERVER_HPP_
