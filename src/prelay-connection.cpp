/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-connection.cpp
 */

#include "prelay-connection.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include "prelay-debug.hpp"

namespace prelay {

Prelay_Connection_Handler::Prelay_Connection_Handler(
    Job job, std::unique_ptr<Prelay_Tcp_Stream> stream,
    std::shared_ptr<Prelay_Print_Sink> sink,
    std::chrono::milliseconds idle_timeout, Completion on_complete)
    : m_job{std::move(job)}, m_stream{std::move(stream)},
      m_sink{std::move(sink)}, m_idle_timeout{idle_timeout},
      m_on_complete{std::move(on_complete)},
      m_proc{"prelay-job-" + std::to_string(m_job.id)} {}

Prelay_Connection_Handler::~Prelay_Connection_Handler() noexcept try {
  if (m_proc.isRunning()) {
    cancel();
    m_proc.wait();
  }
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Prelay_Connection_Handler::start() -> bool {
  return m_proc.exec([this]() -> void { this->run(); });
}

auto Prelay_Connection_Handler::run() -> Job {
  auto data = readAll();

  if (!data) {
    fail(toJobFailure(data.error().code), std::move(data.error().message));
  } else {
    m_delivering = true;

    if (m_cancelled) {
      fail(JobFailure::kCancelled, "cancelled before delivery");
    } else {
      try {
        auto delivered = m_sink->deliver(m_job.printer_name, *data);
        if (delivered) {
          m_job.outcome = JobOutcome::kSuccess;
        } else {
          fail(toJobFailure(delivered.error().code),
               std::move(delivered.error().message));
        }
      } catch (const std::exception &e) {
        fail(JobFailure::kSinkDeliveryFailed, e.what());
      }
    }
  }

  m_stream->shutdown();
  m_job.completed = Job::Clock::now();

  PRELAY_DEBUG_PRINT(std::cerr << "job " << m_job.id << " from "
                               << m_job.remote_address << ": "
                               << toString(m_job.outcome) << " "
                               << toString(m_job.failure) << ", "
                               << m_job.byte_count << " bytes\n");

  m_done = true;

  if (m_on_complete) {
    m_on_complete(m_job);
  }

  return m_job;
}

void Prelay_Connection_Handler::cancel() {
  m_cancelled = true;

  if (!m_delivering) {
    m_stream->shutdown();
  }
}

void Prelay_Connection_Handler::wait() {
  if (m_proc.isRunning()) {
    m_proc.wait();
  }
}

auto Prelay_Connection_Handler::isDone() const -> bool { return m_done; }

auto Prelay_Connection_Handler::id() const -> uint64_t { return m_job.id; }

auto Prelay_Connection_Handler::bytesReceived() const -> uint64_t {
  return m_bytes_received;
}

auto Prelay_Connection_Handler::readAll()
    -> std::expected<std::string, ConnectionError> {
  std::string data{};

  while (!m_cancelled) {
    auto chunk = m_stream->readSome(m_idle_timeout);

    if (!chunk) {
      if (m_cancelled) {
        break;
      }

      if (std::errc::timed_out == chunk.error()) {
        return std::unexpected(ConnectionError{
            ConnectionErrorCode::kReadError,
            "no data for " + std::to_string(m_idle_timeout.count()) + " ms"});
      }

      return std::unexpected(ConnectionError{ConnectionErrorCode::kReadError,
                                             chunk.error().message()});
    }

    if (chunk->empty()) {
      break;
    }

    data += *chunk;
    m_job.byte_count = data.size();
    m_bytes_received = data.size();
  }

  // A shutdown issued by cancel() looks like end of stream to the reader.
  if (m_cancelled) {
    return std::unexpected(ConnectionError{
        ConnectionErrorCode::kCancelled, "cancelled by server shutdown"});
  }

  if (data.empty()) {
    return std::unexpected(ConnectionError{ConnectionErrorCode::kEmptyJob,
                                           "peer closed without sending data"});
  }

  return data;
}

void Prelay_Connection_Handler::fail(JobFailure failure, std::string reason) {
  m_job.outcome = JobOutcome::kFailed;
  m_job.failure = failure;
  m_job.failure_reason = std::move(reason);
}

} // namespace prelay
