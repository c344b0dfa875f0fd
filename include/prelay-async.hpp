/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-async.hpp
 * @brief Serial executor: tasks run one at a time, in submission order,
 *        on a dedicated thread.
 *
 * Prelay_Async owns a Prelay_Proc and a Prelay_Buffer of tasks. Any
 * number of threads may submit; the executor thread runs them in FIFO
 * order, so state touched only from inside tasks needs no further
 * locking. The relay uses it for event delivery (publisher and each
 * subscriber) and for joining finished connection handler threads.
 *
 * A task that throws does not stop the executor. With
 * addExecTaskWithWait() the exception is handed back to the waiter;
 * otherwise it is kept as the last thrown exception and reported through
 * PRELAY_DEBUG_PRINT.
 */

#ifndef PRELAY_ASYNC_HPP_
#define PRELAY_ASYNC_HPP_

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "prelay-buffer.hpp"
#include "prelay-proc.hpp"

#define PRELAY_ASYNC_CALL_WITH_COPY_CAPTURE(block)                             \
  do {                                                                         \
    this->addExecTask([=]() mutable -> void { block; });                       \
  } while (false)

#define PRELAY_ASYNC_CALL_WITH_REF_CAPTURE(block)                              \
  do {                                                                         \
    this->addExecTask([&]() mutable -> void { block; });                       \
  } while (false)

#define PRELAY_ASYNC_CALL_WITH_CAPTURE(block, ...)                             \
  do {                                                                         \
    this->addExecTask([__VA_ARGS__]() mutable -> void { block; });             \
  } while (false)

namespace prelay {

class Prelay_Async {
public:
  // Rendezvous returned by addExecTaskWithWait(); wait() blocks until the
  // task has run and rethrows what it threw.
  class Prelay_Async_Wait {
    friend class Prelay_Async;

  public:
    void wait();

  private:
    std::mutex m_mutex{};
    std::condition_variable m_cond_var{};

    bool m_done{};
    std::exception_ptr m_thrownException{};
  };

  explicit Prelay_Async(std::string_view name = "async");
  virtual ~Prelay_Async() noexcept;

  Prelay_Async(const Prelay_Async &obj) = delete;
  const Prelay_Async &operator=(const Prelay_Async &obj) = delete;
  Prelay_Async(Prelay_Async &&obj) = delete;
  Prelay_Async &operator=(Prelay_Async &&obj) = delete;

  /**
   * @brief Queue fnc for execution. Tasks submitted after shutdown() are
   *        dropped.
   */
  void addExecTask(std::function<void()> fnc);

  auto addExecTaskWithWait(std::function<void()> fnc)
      -> std::shared_ptr<Prelay_Async_Wait>;

  /**
   * @brief Block until every task submitted before the call has run.
   */
  void waitForEmpty();

  /**
   * @brief Run the queued tasks, then stop the executor thread. Called by
   *        the destructor; calling it earlier is allowed and idempotent.
   */
  void shutdown();

  auto getLastException() -> std::exception_ptr;

private:
  void runTasks();

  Prelay_Buffer<std::function<void()>> m_tasks{};
  Prelay_Proc m_proc;

  std::mutex m_mutex{};
  std::condition_variable m_ran_cond{};
  size_t m_submitted{};
  size_t m_ran{};
  std::exception_ptr m_thrownException{};
}; // class Prelay_Async

} // namespace prelay

#endif // PRELAY_ASYNC_HPP_
