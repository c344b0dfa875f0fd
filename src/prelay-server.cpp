/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-server.cpp
 * @brief Implementation of the relay server lifecycle and accept loop.
 */

#include "prelay-server.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "prelay-debug.hpp"
#include "prelay-port-guard.hpp"

namespace prelay {

namespace {

constexpr std::chrono::milliseconds kAcceptRetryDelay{10};
constexpr std::chrono::milliseconds kAcceptExhaustedDelay{100};

// How long cancelled jobs get to wind down after the grace period.
constexpr std::chrono::milliseconds kCancelWait{500};

} // namespace

Prelay_Relay_Server::Prelay_Relay_Server(
    std::shared_ptr<Prelay_Print_Sink> sink)
    : m_sink{std::move(sink)} {}

Prelay_Relay_Server::~Prelay_Relay_Server() noexcept try {
  {
    const std::lock_guard<std::mutex> lock(m_control_mutex);

    if (ServerState::kStopped != m_state) {
      stopLocked();
    }
  }

  // Blocks until abandoned deliveries return from the sink.
  m_abandoned.clear();

  m_reaper.shutdown();
  m_events.waitForEmpty();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Prelay_Relay_Server::start(const ServerConfig &config)
    -> std::expected<void, StartError> {
  const std::lock_guard<std::mutex> lock(m_control_mutex);

  return startLocked(config);
}

auto Prelay_Relay_Server::stop() -> std::expected<void, StopError> {
  const std::lock_guard<std::mutex> lock(m_control_mutex);

  return stopLocked();
}

auto Prelay_Relay_Server::restart(const ServerConfig &config)
    -> std::expected<void, StartError> {
  const std::lock_guard<std::mutex> lock(m_control_mutex);

  if (ServerState::kStopped != m_state) {
    stopLocked();
  }

  return startLocked(config);
}

auto Prelay_Relay_Server::status() const -> ServerState { return m_state; }

auto Prelay_Relay_Server::subscribe()
    -> std::unique_ptr<Prelay_Event_Subscription> {
  auto subscription = std::make_unique<Prelay_Event_Subscription>();

  m_events.registerSubscriber(subscription.get());

  return subscription;
}

void Prelay_Relay_Server::subscribe(Prelay_Event_Subscriber *subscriber) {
  m_events.registerSubscriber(subscriber);
}

auto Prelay_Relay_Server::config() -> ServerConfig {
  const std::lock_guard<std::mutex> lock(m_config_mutex);

  return m_config;
}

auto Prelay_Relay_Server::port() const -> uint16_t { return m_port; }

auto Prelay_Relay_Server::activeJobs() -> size_t {
  const std::lock_guard<std::mutex> lock(m_jobs_mutex);

  return m_pending.size();
}

auto Prelay_Relay_Server::startLocked(const ServerConfig &config)
    -> std::expected<void, StartError> {
  if (ServerState::kStopped != m_state) {
    return std::unexpected(StartError{StartErrorCode::kAlreadyRunning,
                                      "server is already running"});
  }

  {
    const std::lock_guard<std::mutex> lock(m_config_mutex);
    m_config = config;
  }

  m_port = config.port;
  setState(ServerState::kStarting);

  auto valid = validateConfig(config, true);
  if (!valid) {
    return failStart(
        StartError{StartErrorCode::kInvalidConfig, valid.error().message});
  }

  if (m_sink) {
    m_active_sink = m_sink;
  } else {
    auto sink = makePrintSink(config);
    if (!sink) {
      return failStart(
          StartError{StartErrorCode::kInvalidConfig, sink.error().message});
    }

    m_active_sink = std::move(*sink);
  }

  // Port 0 asks the kernel for a free port, there is nothing to guard.
  if (0 != config.port) {
    Prelay_Port_Guard guard{Prelay_Port_Guard::Options{
        config.service_name, config.port_reclaim_retries,
        std::chrono::milliseconds{config.port_reclaim_delay_ms}}};

    std::expected<void, PortError> available{};
    try {
      available = guard.ensureAvailable(config.port);
    } catch (const std::exception &e) {
      available = std::unexpected(
          PortError{PortErrorCode::kLookupFailed, e.what(), 0, ""});
    }

    if (!available) {
      const auto &error = available.error();
      const auto code = PortErrorCode::kLookupFailed == error.code
                            ? StartErrorCode::kBindError
                            : StartErrorCode::kPortBusy;

      return failStart(
          StartError{code, error.message, error.pid, error.process_name});
    }
  }

  try {
    m_listener = std::make_unique<Prelay_Tcp_Listener>(
        config.bind_address, config.port, SOMAXCONN);
  } catch (const std::system_error &e) {
    return failStart(StartError{StartErrorCode::kBindError,
                                "bind " + config.bind_address + ":" +
                                    std::to_string(config.port) + ": " +
                                    e.what()});
  }

  m_port = m_listener->port();

  m_accept_proc = std::make_unique<Prelay_Proc>("prelay-accept");
  if (!m_accept_proc->exec([this]() -> void { this->acceptLoop(); })) {
    m_accept_proc.reset();
    m_listener.reset();

    return failStart(StartError{StartErrorCode::kBindError,
                                "failed to create the accept thread"});
  }

  setState(ServerState::kListening);

  return {};
}

auto Prelay_Relay_Server::stopLocked() -> std::expected<void, StopError> {
  if (ServerState::kStopped == m_state) {
    return std::unexpected(
        StopError{StopErrorCode::kNotRunning, "server is not running"});
  }

  setState(ServerState::kStopping);

  m_listener->shutdown();
  m_accept_proc->wait();

  const auto grace = std::chrono::milliseconds{config().grace_period_ms};
  const auto drained = [this]() -> bool { return m_pending.empty(); };

  std::vector<std::unique_ptr<Prelay_Connection_Handler>> finished{};
  {
    std::unique_lock<std::mutex> lock(m_jobs_mutex);

    if (!m_jobs_cond.wait_for(lock, grace, drained)) {
      PRELAY_DEBUG_PRINT(std::cerr << "stop: cancelling " << m_pending.size()
                                   << " job(s) after grace period\n");

      for (auto &[id, handler] : m_jobs) {
        handler->cancel();
      }

      if (!m_jobs_cond.wait_for(lock, kCancelWait, drained)) {
        for (auto &[id, job] : m_pending) {
          auto it = m_jobs.find(id);
          if (m_jobs.end() != it) {
            job.byte_count = it->second->bytesReceived();
            m_abandoned.push_back(std::move(it->second));
            m_jobs.erase(it);
          }

          job.outcome = JobOutcome::kFailed;
          job.failure = JobFailure::kCancelled;
          job.failure_reason = "cancelled by server shutdown during delivery";
          job.completed = Job::Clock::now();

          m_events.publishJobOutcome(job);
        }

        m_pending.clear();
      }
    }

    for (auto &[id, handler] : m_jobs) {
      finished.push_back(std::move(handler));
    }

    m_jobs.clear();
  }

  // Their outcome is published, only the thread exit is left to join.
  for (auto &handler : finished) {
    handler->wait();
  }

  std::erase_if(m_abandoned, [](const auto &handler) -> bool {
    if (!handler->isDone()) {
      return false;
    }

    handler->wait();
    return true;
  });

  m_accept_proc.reset();
  m_listener.reset();
  m_active_sink.reset();

  setState(ServerState::kStopped);
  m_port = 0;

  return {};
}

auto Prelay_Relay_Server::failStart(StartError error)
    -> std::unexpected<StartError> {
  PRELAY_DEBUG_PRINT(std::cerr << "start: " << toString(error.code) << ": "
                               << error.message << "\n");

  m_active_sink.reset();

  setState(ServerState::kFailed, error.message);
  setState(ServerState::kStopped);
  m_port = 0;

  return std::unexpected(std::move(error));
}

void Prelay_Relay_Server::setState(ServerState next, std::string_view reason) {
  const ServerState previous = m_state.exchange(next);

  m_events.publishStateChange(previous, next, reason, m_port,
                              config().printer_name);
}

void Prelay_Relay_Server::acceptLoop() {
  while (true) {
    auto accepted = m_listener->accept();

    if (!accepted) {
      if (m_listener->isShutdown()) {
        break;
      }

      const int err = accepted.error().value();

      PRELAY_DEBUG_PRINT(std::cerr << "accept: " << accepted.error().message()
                                   << "\n");

      if (EINTR == err) {
        continue;
      }

      const bool exhausted =
          EMFILE == err || ENFILE == err || ENOBUFS == err || ENOMEM == err;

      std::this_thread::sleep_for(exhausted ? kAcceptExhaustedDelay
                                            : kAcceptRetryDelay);
      continue;
    }

    dispatch(std::move(*accepted));
  }
}

void Prelay_Relay_Server::dispatch(std::unique_ptr<Prelay_Tcp_Stream> stream) {
  const ServerConfig config = this->config();

  Job job{};
  job.id = ++m_next_job_id;
  job.remote_address = stream->remoteAddress();
  job.printer_name = config.printer_name;
  job.accepted = Job::Clock::now();

  const std::string remote_address = job.remote_address;
  Prelay_Connection_Handler *handler{};

  {
    const std::lock_guard<std::mutex> lock(m_jobs_mutex);

    if (m_pending.size() >= config.max_jobs) {
      stream->shutdown();
      stream.reset();

      reject(std::move(job), "more than " + std::to_string(config.max_jobs) +
                                 " jobs in progress");
      return;
    }

    const uint64_t id = job.id;
    m_pending.emplace(id, job);

    auto created = std::make_unique<Prelay_Connection_Handler>(
        std::move(job), std::move(stream), m_active_sink,
        std::chrono::milliseconds{config.idle_timeout_ms},
        [this](const Job &done) -> void { this->onJobComplete(done); });

    handler = created.get();
    m_jobs.emplace(id, std::move(created));
  }

  if (!handler->start()) {
    std::unique_ptr<Prelay_Connection_Handler> failed{};
    Job rejected{};

    {
      const std::lock_guard<std::mutex> lock(m_jobs_mutex);
      auto it = m_jobs.find(handler->id());

      failed = std::move(it->second);
      m_jobs.erase(it);
      m_pending.erase(failed->id());
      m_jobs_cond.notify_all();
    }

    rejected.id = failed->id();
    rejected.remote_address = remote_address;
    rejected.printer_name = config.printer_name;
    rejected.accepted = Job::Clock::now();
    reject(std::move(rejected), "failed to create a job thread");
  }
}

void Prelay_Relay_Server::reject(Job job, std::string reason) {
  job.outcome = JobOutcome::kFailed;
  job.failure = JobFailure::kRejected;
  job.failure_reason = std::move(reason);
  job.completed = Job::Clock::now();

  m_events.publishJobOutcome(job);
}

void Prelay_Relay_Server::onJobComplete(const Job &job) {
  const uint64_t id = job.id;
  const std::lock_guard<std::mutex> lock(m_jobs_mutex);

  // stop() has already reported the job if it is no longer pending.
  if (m_pending.erase(id) > 0) {
    m_events.publishJobOutcome(job);
    m_jobs_cond.notify_all();
  }

  m_reaper.addExecTask([this, id]() -> void { this->reap(id); });
}

void Prelay_Relay_Server::reap(uint64_t job_id) {
  std::unique_ptr<Prelay_Connection_Handler> handler{};

  {
    const std::lock_guard<std::mutex> lock(m_jobs_mutex);

    auto it = m_jobs.find(job_id);
    if (m_jobs.end() == it) {
      return;
    }

    handler = std::move(it->second);
    m_jobs.erase(it);
  }

  handler->wait();
}

} // namespace prelay
