/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-proc.cpp
 * @brief Implementation of the pthread owner used by the relay threads.
 */

#include "prelay-proc.hpp"

#include <pthread.h>
#include <sched.h>

#include <cerrno>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace prelay {

void cleanupFuncToUnlockPthreadMutex(void *arg) {
  auto *mutex = static_cast<pthread_mutex_t *>(arg);

  pthread_mutex_unlock(mutex);
}

Prelay_Proc::Prelay_Proc(std::string_view name, const Prelay_Proc::Task &fnc)
    : m_name{name} {
  setState(State::kNew);

  if (fnc) {
    setTask(fnc);
  }
}

Prelay_Proc::~Prelay_Proc() noexcept try {
  if (getState() == State::kRunning) {
    stopExec();
  }

  setState(State::kInvalid);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Prelay_Proc::exec(const Prelay_Proc::Task &fnc) -> bool {
  if (fnc) {
    setTask(fnc);
  }

  return runExec();
}

auto Prelay_Proc::getName() const -> const std::string & { return m_name; }

auto Prelay_Proc::getState() const -> Prelay_Proc::State { return m_state; }

auto Prelay_Proc::isDone() const -> bool { return m_done.load(); }

auto Prelay_Proc::isRunning() const -> bool {
  return getState() == State::kRunning;
}

auto Prelay_Proc::setState(State state) -> Prelay_Proc::State {
  return m_state.exchange(state);
}

void Prelay_Proc::setTask(Prelay_Proc::Task fnc) {
  if (getState() != State::kNew && getState() != State::kReady) {
    throw std::runtime_error("Task of running Prelay_Proc (" + m_name +
                             ") can not be replaced");
  }

  m_fnc = std::move(fnc);
  setState(State::kReady);
}

auto Prelay_Proc::wait() -> bool {
  void *ret{};

  if (getState() != State::kRunning) {
    throw std::runtime_error("No task is exec in Prelay_Proc (" + m_name + ")");
  }

  const int err = pthread_join(m_th, &ret);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  setState(State::kReady);

  return true;
}

void Prelay_Proc::testcancel() { pthread_testcancel(); }

void Prelay_Proc::yield() {
  Prelay_Proc::testcancel();

  sched_yield();
}

auto Prelay_Proc::stopExec() -> bool {
  if (getState() != State::kRunning) {
    return true;
  }

  // ESRCH means the thread has already finished but is not joined yet.
  const int err = pthread_cancel(m_th);
  if (0 != err && ESRCH != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  return wait();
}

auto Prelay_Proc::runExec() -> bool {
  if (getState() != State::kReady) {
    throw std::runtime_error("No task is assigned to the Prelay_Proc (" +
                             m_name + ")");
  }

  m_done = false;

  const State old_state = setState(State::kRunning);
  const int err =
      pthread_create(&m_th, nullptr, &(Prelay_Proc::runFnInThreadHelper), this);
  if (0 != err) {
    setState(old_state);
    return false;
  }

  // Linux limits thread names to 15 characters plus the terminator.
  const std::string thread_name = m_name.substr(0, 15);
  pthread_setname_np(m_th, thread_name.c_str());

  return true;
}

void Prelay_Proc::markDoneHelper(void *context) {
  static_cast<Prelay_Proc *>(context)->m_done = true;
}

auto Prelay_Proc::runFnInThreadHelper(void *context) -> void * {
  int old_state{};

  pthread_setcancelstate(PTHREAD_CANCEL_ENABLE, &old_state);
  pthread_setcanceltype(PTHREAD_CANCEL_DEFERRED, &old_state);

  auto *proc = static_cast<Prelay_Proc *>(context);

  // m_done is set by a cleanup handler so it also flips when the thread
  // is cancelled.
  pthread_cleanup_push(&Prelay_Proc::markDoneHelper, proc);

  proc->m_fnc();

  pthread_cleanup_pop(1);

  return nullptr;
}

} // namespace prelay
