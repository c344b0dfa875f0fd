/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-proc.hpp
 * @brief RAII owner of one POSIX thread running a task.
 *
 * Prelay_Proc runs a std::function<void()> in its own pthread. The relay
 * uses it for the accept loop, for every connection handler and for the
 * signal wait thread of the daemon. Behaviour is composed by handing a
 * task to the object rather than by subclassing.
 *
 * Cancellation is deferred: stopExec() (and the destructor of a still
 * running object) issues pthread_cancel() and joins, so the task must
 * reach a cancellation point (blocking socket calls, condition waits,
 * Prelay_Proc::yield()) for the join to complete. Tasks that should end
 * cooperatively (connection handlers) are instead unblocked by shutting
 * down their socket and then joined with wait().
 *
 * The helper macros below wrap pthread_cleanup_push/pop so that a mutex
 * held across a cancellation point is released when the thread is
 * cancelled inside the protected region.
 */

#ifndef PRELAY_PROC_HPP_
#define PRELAY_PROC_HPP_

#include <pthread.h>

#include <atomic>
#include <functional>
#include <string>
#include <string_view>

#define PRELAY_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(mutex)                         \
  pthread_cleanup_push(&prelay::cleanupFuncToUnlockPthreadMutex, (mutex))

#define PRELAY_PROC_EXIT_PTHREAD_MUTEX_CLEANUP(...) pthread_cleanup_pop(0)

namespace prelay {

/**
 * Cleanup handler for pthread_cleanup_push; arg is a pthread_mutex_t *.
 */
void cleanupFuncToUnlockPthreadMutex(void *arg);

class Prelay_Proc {
public:
  using Task = std::function<void()>;

  enum class State { kInvalid, kNew, kReady, kRunning };

  /**
   * @param name Diagnostic name, also applied as the native thread name
   *             (truncated to 15 characters).
   * @param fnc  Optional task; if empty a task must be passed to exec().
   */
  explicit Prelay_Proc(std::string_view name, const Prelay_Proc::Task &fnc = {});
  virtual ~Prelay_Proc() noexcept;

  Prelay_Proc(const Prelay_Proc &obj) = delete;
  const Prelay_Proc &operator=(const Prelay_Proc &obj) = delete;
  Prelay_Proc(Prelay_Proc &&obj) = delete;
  Prelay_Proc &operator=(Prelay_Proc &&obj) = delete;

  /**
   * @brief Start the thread running fnc, or the task set at construction.
   *
   * @return true if the thread was created.
   * @throws std::runtime_error if no task has been assigned or the
   *         thread is already running.
   */
  auto exec(const Prelay_Proc::Task &fnc = {}) -> bool;

  /**
   * @brief Join the thread.
   *
   * @throws std::runtime_error if the thread is not running or the join
   *         fails.
   */
  auto wait() -> bool;

  /**
   * @brief True once the task has returned (the thread may still need to
   *        be joined with wait()).
   */
  auto isDone() const -> bool;

  auto getName() const -> const std::string &;

  auto isRunning() const -> bool;

  static void testcancel();

  /**
   * @brief Cancellation point plus sched_yield(), for long running loops.
   */
  static void yield();

protected:
  auto getState() const -> Prelay_Proc::State;
  auto setState(Prelay_Proc::State state) -> Prelay_Proc::State;
  void setTask(Prelay_Proc::Task fnc);

  auto runExec() -> bool;
  auto stopExec() -> bool;

private:
  static auto runFnInThreadHelper(void *context) -> void *;
  static void markDoneHelper(void *context);

  const std::string m_name{};

  Prelay_Proc::Task m_fnc{};
  std::atomic<Prelay_Proc::State> m_state{};
  std::atomic<bool> m_done{};
  pthread_t m_th{};
}; // class Prelay_Proc

} // namespace prelay

#endif // PRELAY_PROC_HPP_
