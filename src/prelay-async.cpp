/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-async.cpp
 * @brief Implementation of the serial executor.
 */

#include "prelay-async.hpp"

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

#include "prelay-debug.hpp"

namespace prelay {

void Prelay_Async::Prelay_Async_Wait::wait() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cond_var.wait(lock, [this]() -> bool { return m_done; });

  if (m_thrownException) {
    std::rethrow_exception(m_thrownException);
  }
}

Prelay_Async::Prelay_Async(std::string_view name) : m_proc{name} {
  m_proc.exec([this]() { this->runTasks(); });
}

Prelay_Async::~Prelay_Async() noexcept try { shutdown(); } catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Prelay_Async::runTasks() {
  while (true) {
    auto task = m_tasks.pop();
    if (!task) {
      break;
    }

    try {
      (*task)();
    } catch (const std::exception &e) {
      PRELAY_DEBUG_PRINT(std::cerr << m_proc.getName()
                                   << ": task failed: " << e.what() << "\n");

      const std::lock_guard<std::mutex> lock(m_mutex);
      m_thrownException = std::current_exception();
    }

    {
      const std::lock_guard<std::mutex> lock(m_mutex);
      ++m_ran;
    }

    m_ran_cond.notify_all();
  }
}

void Prelay_Async::addExecTask(std::function<void()> fnc) {
  const std::lock_guard<std::mutex> lock(m_mutex);

  if (m_tasks.push(std::move(fnc))) {
    ++m_submitted;
  }
}

auto Prelay_Async::addExecTaskWithWait(std::function<void()> fnc)
    -> std::shared_ptr<Prelay_Async::Prelay_Async_Wait> {
  auto wait_shared_ptr = std::make_shared<Prelay_Async_Wait>();

  this->addExecTask([wait_shared_ptr, fnc = std::move(fnc)]() -> void {
    try {
      fnc();
    } catch (const std::exception &) {
      wait_shared_ptr->m_thrownException = std::current_exception();
    }

    const std::lock_guard<std::mutex> lock(wait_shared_ptr->m_mutex);
    wait_shared_ptr->m_done = true;
    wait_shared_ptr->m_cond_var.notify_all();
  });

  return wait_shared_ptr;
}

void Prelay_Async::waitForEmpty() {
  std::unique_lock<std::mutex> lock(m_mutex);
  const size_t target = m_submitted;

  m_ran_cond.wait(lock, [this, target]() -> bool {
    return m_ran >= target || !m_proc.isRunning();
  });
}

void Prelay_Async::shutdown() {
  m_tasks.close();

  if (m_proc.isRunning()) {
    m_proc.wait();
  }

  m_ran_cond.notify_all();
}

auto Prelay_Async::getLastException() -> std::exception_ptr {
  const std::lock_guard<std::mutex> lock(m_mutex);

  return m_thrownException;
}

} // namespace prelay
