/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-runtime.cpp
 * @brief The source implementation file for prelay-runtime.
 */

#include "prelay-runtime.hpp"

#include <pthread.h>

#include <cstring>
#include <stdexcept>
#include <string>

#include "prelay-debug.hpp"

namespace prelay {

auto Prelay_Runtime::signalMask() -> sigset_t {
  sigset_t mask{};

  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  sigaddset(&mask, SIGHUP);
  sigaddset(&mask, SIGQUIT);

  return mask;
}

void Prelay_Runtime::blockSignals() {
  const sigset_t mask = signalMask();

  const int err = pthread_sigmask(SIG_BLOCK, &mask, nullptr);
  if (0 != err) {
    throw std::runtime_error("Error in pthread_sigmask: " +
                             std::string(strerror(err)));
  }
}

Prelay_Runtime::Prelay_Runtime()
    : Prelay_Async{"prelay-runtime"}, m_mask{signalMask()} {
  // default and to be overridden if needed
  m_signal_handlers[SIGTERM] = [this]([[maybe_unused]] int signo) {
    this->exitMainLoopInternal();
  };

  m_signal_handlers[SIGINT] = [this]([[maybe_unused]] int signo) {
    this->exitMainLoopInternal();
  };

  m_signal_wait_proc = std::make_unique<Prelay_Proc>("prelay-sigwait");

  m_signal_wait_proc->exec([this]() {
    while (true) {
      int signo{};

      const int err = sigwait(&m_mask, &signo);
      if (err) {
        PRELAY_DEBUG_PRINT(std::cerr << "sigwait: " << strerror(err) << "\n");
        continue;
      }

      PRELAY_ASYNC_CALL_WITH_CAPTURE({ this->execSignalHandlerInternal(signo); },
                                     this, signo);
    }
  });
}

Prelay_Runtime::~Prelay_Runtime() noexcept try {
  m_signal_wait_proc = {};

  // Run handlers still queued while the members they use are alive.
  Prelay_Async::shutdown();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Prelay_Runtime::exitMainLoop() {
  PRELAY_ASYNC_CALL_WITH_REF_CAPTURE({ this->exitMainLoopInternal(); });
}

void Prelay_Runtime::exitMainLoopInternal() {
  m_exit_atomic_flag.test_and_set();
  m_exit_atomic_flag.notify_all();
}

void Prelay_Runtime::enterMainLoop() {
  while (!m_exit_atomic_flag.test()) {
    m_exit_atomic_flag.wait(false);
  }
}

void Prelay_Runtime::execSignalHandlerInternal(int signo) {
  auto extHandlers = m_ext_signal_handlers.find(signo);
  if (m_ext_signal_handlers.end() != extHandlers) {
    for (auto &handler : extHandlers->second) {
      handler(signo);
    }
  }

  auto handler = m_signal_handlers.find(signo);
  if (m_signal_handlers.end() != handler) {
    handler->second(signo);
  }
}

void Prelay_Runtime::registerSignalHandler(int signo, SignalHandler handler) {
  PRELAY_ASYNC_CALL_WITH_CAPTURE(
      { this->registerSignalHandlerInternal(signo, handler); }, this, signo,
      handler);
}

void Prelay_Runtime::registerSignalHandlerInternal(int signo,
                                                   SignalHandler handler) {
  auto &extHandlers = m_ext_signal_handlers[signo];
  extHandlers.push_back(handler);
}

} // namespace prelay
