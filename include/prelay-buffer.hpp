/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-buffer.hpp
 * @brief Thread-safe FIFO with blocking, timed and non-blocking pop, and
 *        close semantics.
 *
 * Prelay_Buffer<T> is the queue underneath the serial executor
 * (Prelay_Async) and the event subscriptions. Producers push() items,
 * consumers pop() them in FIFO order. A consumer blocked in pop() is
 * woken when an item arrives or when the buffer is closed; once closed,
 * pushes are dropped and pops drain the remaining items and then return
 * std::nullopt, which is how an event subscription ends its sequence.
 *
 * The queue is protected by a pthread mutex and condition variables; all
 * waits are cancellation points and the mutex is released by a cleanup
 * handler if the waiting thread is cancelled.
 */

#ifndef PRELAY_BUFFER_HPP_
#define PRELAY_BUFFER_HPP_

#include <pthread.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>

#include "prelay-proc.hpp"

namespace prelay {

template <typename T> class Prelay_Buffer {
public:
  Prelay_Buffer();
  virtual ~Prelay_Buffer() noexcept;

  Prelay_Buffer(const Prelay_Buffer<T> &obj) = delete;
  const Prelay_Buffer<T> &operator=(const Prelay_Buffer<T> &obj) = delete;
  Prelay_Buffer(Prelay_Buffer<T> &&obj) = delete;
  Prelay_Buffer<T> &operator=(Prelay_Buffer<T> &&obj) = delete;

  /**
   * @brief Block until an item is available or the buffer is closed.
   *
   * @return the front item, or std::nullopt if the buffer is closed and
   *         drained.
   */
  virtual auto pop() -> std::optional<T>;

  /**
   * @brief Like pop() but wait at most timeout.
   *
   * @return the front item, or std::nullopt on timeout or when closed and
   *         drained.
   */
  virtual auto popFor(std::chrono::microseconds timeout) -> std::optional<T>;

  virtual auto popNoWait() -> std::optional<T>;

  /**
   * @brief Append an item. Returns false (and drops the item) if the
   *        buffer has been closed.
   */
  virtual auto push(T &&item) -> bool;
  virtual auto push(const T &item) -> bool;

  /**
   * @brief Close the buffer: wake every waiter, refuse further pushes.
   *        Items already queued can still be popped.
   */
  void close();

  auto isClosed() -> bool;

  auto size() -> size_t;

  /**
   * @brief Block until every item pushed so far has been popped.
   *
   * @return The number of items popped over the lifetime of the buffer.
   */
  virtual auto waitForEmpty() -> size_t;

protected:
  auto popOptional(bool wait, const struct timespec *deadline)
      -> std::optional<T>;

  void lock();
  void unlock();

private:
  std::deque<T> m_queue{};
  pthread_mutex_t m_mutex{};
  pthread_cond_t m_cond{};       // signalled on push and close
  pthread_cond_t m_empty_cond{}; // signalled when the queue drains
  size_t m_push_count{};
  size_t m_pop_count{};
  bool m_closed{};
}; // class Prelay_Buffer

template <typename T> Prelay_Buffer<T>::Prelay_Buffer() {
  int err{};

  err = pthread_mutex_init(&m_mutex, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_cond, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_empty_cond, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> Prelay_Buffer<T>::~Prelay_Buffer() noexcept try {
  pthread_cond_broadcast(&m_cond);
  pthread_cond_broadcast(&m_empty_cond);

  pthread_cond_destroy(&m_empty_cond);
  pthread_cond_destroy(&m_cond);
  pthread_mutex_destroy(&m_mutex);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> void Prelay_Buffer<T>::lock() {
  const int err = pthread_mutex_lock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> void Prelay_Buffer<T>::unlock() {
  const int err = pthread_mutex_unlock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> auto Prelay_Buffer<T>::pop() -> std::optional<T> {
  return popOptional(true, nullptr);
}

template <typename T>
auto Prelay_Buffer<T>::popFor(std::chrono::microseconds timeout)
    -> std::optional<T> {
  struct timespec deadline{};

  clock_gettime(CLOCK_REALTIME, &deadline);

  const long long usec = timeout.count() < 0 ? 0 : timeout.count();
  deadline.tv_sec += static_cast<time_t>(usec / 1000000LL);
  deadline.tv_nsec += static_cast<long>((usec % 1000000LL) * 1000LL);
  if (deadline.tv_nsec >= 1000000000L) {
    deadline.tv_sec += 1;
    deadline.tv_nsec -= 1000000000L;
  }

  return popOptional(true, &deadline);
}

template <typename T> auto Prelay_Buffer<T>::popNoWait() -> std::optional<T> {
  return popOptional(false, nullptr);
}

template <typename T> auto Prelay_Buffer<T>::push(const T &item) -> bool {
  T copied_item{item};

  return push(std::move(copied_item));
}

template <typename T> auto Prelay_Buffer<T>::push(T &&item) -> bool {
  bool pushed{};

  lock();

  PRELAY_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  if (!m_closed) {
    m_queue.push_back(std::move(item));
    ++m_push_count;
    pushed = true;

    pthread_cond_signal(&m_cond);
  }

  PRELAY_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return pushed;
}

template <typename T> void Prelay_Buffer<T>::close() {
  lock();

  m_closed = true;
  pthread_cond_broadcast(&m_cond);

  unlock();
}

template <typename T> auto Prelay_Buffer<T>::isClosed() -> bool {
  lock();
  const bool closed = m_closed;
  unlock();

  return closed;
}

template <typename T> auto Prelay_Buffer<T>::size() -> size_t {
  lock();
  const size_t count = m_queue.size();
  unlock();

  return count;
}

template <typename T> auto Prelay_Buffer<T>::waitForEmpty() -> size_t {
  size_t pop_count{};

  lock();

  PRELAY_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  while (!m_queue.empty()) {
    const int err = pthread_cond_wait(&m_empty_cond, &m_mutex);
    if (err) {
      throw std::runtime_error(strerror(err));
    }
  }

  pop_count = m_pop_count;

  PRELAY_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return pop_count;
}

template <typename T>
auto Prelay_Buffer<T>::popOptional(bool wait, const struct timespec *deadline)
    -> std::optional<T> {
  std::optional<T> val{};

  lock();

  PRELAY_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  bool timed_out{};

  while (wait && m_queue.empty() && !m_closed && !timed_out) {
    int err{};

    if (nullptr != deadline) {
      err = pthread_cond_timedwait(&m_cond, &m_mutex, deadline);
    } else {
      err = pthread_cond_wait(&m_cond, &m_mutex);
    }

    if (ETIMEDOUT == err) {
      timed_out = true;
    } else if (err) {
      throw std::runtime_error(strerror(err));
    }
  }

  if (!m_queue.empty()) {
    val = std::move(m_queue.front());
    m_queue.pop_front();
    ++m_pop_count;

    if (m_queue.empty()) {
      pthread_cond_broadcast(&m_empty_cond);
    }
  }

  PRELAY_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return val;
} // method popOptional()

} // namespace prelay

#endif // PRELAY_BUFFER_HPP_
