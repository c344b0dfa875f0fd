/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-runtime.hpp
 * @brief Signal driven main loop for the relay daemon.
 *
 * Signals are not handled asynchronously. blockSignals() masks SIGINT,
 * SIGTERM, SIGHUP and SIGQUIT in the calling thread; it must run in main()
 * before any other thread is created so every thread inherits the mask.
 * A dedicated thread then sigwait()s for them and runs the registered
 * handlers, one at a time, on the runtime's executor, where they may call
 * into the relay server like any other thread.
 *
 * By default SIGINT and SIGTERM leave the main loop. Handlers registered
 * with registerSignalHandler() run before the default one.
 */

#ifndef PRELAY_RUNTIME_HPP_
#define PRELAY_RUNTIME_HPP_

#include <signal.h>

#include <atomic>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include "prelay-async.hpp"
#include "prelay-proc.hpp"

namespace prelay {

class Prelay_Runtime : private Prelay_Async {
public:
  using SignalHandler = std::function<void(int signo)>;

  /**
   * @brief Block the runtime's signals in the calling thread.
   *
   * @throws std::runtime_error if pthread_sigmask fails.
   */
  static void blockSignals();

  Prelay_Runtime();
  virtual ~Prelay_Runtime() noexcept;

  Prelay_Runtime(const Prelay_Runtime &obj) = delete;
  const Prelay_Runtime &operator=(const Prelay_Runtime &obj) = delete;
  Prelay_Runtime(Prelay_Runtime &&obj) = delete;
  Prelay_Runtime &operator=(Prelay_Runtime &&obj) = delete;

  /**
   * @brief Block the calling thread until exitMainLoop() or a terminating
   *        signal.
   */
  void enterMainLoop();
  void exitMainLoop();

  /**
   * @brief Add a handler for signo. SIGKILL and SIGSTOP can not be handled.
   */
  void registerSignalHandler(int signo, SignalHandler handler);

private:
  void exitMainLoopInternal();
  void registerSignalHandlerInternal(int signo, SignalHandler handler);
  void execSignalHandlerInternal(int signo);

  static auto signalMask() -> sigset_t;

  std::unique_ptr<Prelay_Proc> m_signal_wait_proc{};
  sigset_t m_mask{};
  std::unordered_map<int, SignalHandler> m_signal_handlers{};
  std::unordered_map<int, std::vector<SignalHandler>> m_ext_signal_handlers{};

  std::atomic_flag m_exit_atomic_flag{};
}; // class Prelay_Runtime

} // namespace prelay

#endif // PRELAY_RUNTIME_HPP_
