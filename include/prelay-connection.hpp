/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-connection.hpp
 * @brief Owns one accepted connection end to end: drains the peer's bytes,
 *        hands them to the print sink and reports the job outcome.
 *
 * The connection delimits the job: bytes are read until the peer closes
 * (or half-closes) its side. The completion callback receives the
 * terminal Job exactly once, on the handler's own thread, whatever the
 * outcome:
 *  - Success: the sink accepted every byte;
 *  - Failed(EmptyJob): the peer sent nothing, the sink is not called;
 *  - Failed(ReadError): reset or idle timeout;
 *  - Failed(Cancelled): cancel() was called before delivery;
 *  - Failed(SinkNotFound / SinkDeliveryFailed): the sink refused.
 */

#ifndef PRELAY_CONNECTION_HPP_
#define PRELAY_CONNECTION_HPP_

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>

#include "prelay-error.hpp"
#include "prelay-job.hpp"
#include "prelay-print-sink.hpp"
#include "prelay-proc.hpp"
#include "prelay-socket.hpp"

namespace prelay {

class Prelay_Connection_Handler {
public:
  using Completion = std::function<void(const Job &job)>;

  /**
   * @param job          Job with id, remote address, printer name and
   *                     accepted time filled in.
   * @param stream       The accepted connection.
   * @param sink         Where the job's bytes go.
   * @param idle_timeout Longest wait for the next chunk, zero for none.
   * @param on_complete  Receives the terminal job.
   */
  Prelay_Connection_Handler(Job job, std::unique_ptr<Prelay_Tcp_Stream> stream,
                            std::shared_ptr<Prelay_Print_Sink> sink,
                            std::chrono::milliseconds idle_timeout,
                            Completion on_complete);
  virtual ~Prelay_Connection_Handler() noexcept;

  Prelay_Connection_Handler(const Prelay_Connection_Handler &obj) = delete;
  const Prelay_Connection_Handler &
  operator=(const Prelay_Connection_Handler &obj) = delete;
  Prelay_Connection_Handler(Prelay_Connection_Handler &&obj) = delete;
  Prelay_Connection_Handler &
  operator=(Prelay_Connection_Handler &&obj) = delete;

  /**
   * @brief Run the job on a thread of its own.
   *
   * @return false if the thread can not be created; the job is not run.
   */
  auto start() -> bool;

  /**
   * @brief Run the job on the calling thread and return its terminal
   *        state.
   */
  auto run() -> Job;

  /**
   * @brief Abort the job: a blocked read returns and the job reports
   *        Failed(Cancelled). A delivery already handed to the sink is
   *        not interrupted.
   */
  void cancel();

  /**
   * @brief Join the thread started by start().
   */
  void wait();

  auto isDone() const -> bool;

  auto id() const -> uint64_t;

  /**
   * @brief Bytes read so far; safe to call while the job runs.
   */
  auto bytesReceived() const -> uint64_t;

private:
  auto readAll() -> std::expected<std::string, ConnectionError>;
  void fail(JobFailure failure, std::string reason);

  Job m_job{};
  std::unique_ptr<Prelay_Tcp_Stream> m_stream{};
  std::shared_ptr<Prelay_Print_Sink> m_sink{};
  std::chrono::milliseconds m_idle_timeout{};
  Completion m_on_complete{};

  std::atomic<bool> m_cancelled{};
  std::atomic<bool> m_delivering{};
  std::atomic<bool> m_done{};
  std::atomic<uint64_t> m_bytes_received{};

  Prelay_Proc m_proc;
};

} // namespace prelay

#endif // PRELAY_CONNECTION_HPP_
