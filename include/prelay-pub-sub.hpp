/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-pub-sub.hpp
 * @brief Publish/subscribe built on Prelay_Async.
 *
 * Prelay_Pub<T> fans every published item out to the subscribers that are
 * registered at the time the item is dispatched. Delivery is asynchronous
 * in two steps: publish() queues the item on the publisher's executor,
 * which then queues one notify() call per subscriber on that subscriber's
 * own executor. Hence
 *  - publish() never blocks on a slow subscriber,
 *  - each subscriber sees items in publication order,
 *  - a subscriber only sees items published after it registered (there
 *    is no replay buffer).
 *
 * registerSubscriber()/unregisterSubscriber() are synchronous: the
 * subscriber list is guarded by a mutex so the caller knows the change is
 * in effect when the call returns.
 *
 * Lifetime: a subscriber subclass must call unsubscribe() from its own
 * destructor, which unregisters and drains already queued notify() calls
 * while the subclass is still intact. The Prelay_Sub destructor repeats
 * this as a last resort.
 */

#ifndef PRELAY_PUB_SUB_HPP_
#define PRELAY_PUB_SUB_HPP_

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "prelay-async.hpp"

namespace prelay {

template <typename T> class Prelay_Pub : public Prelay_Async {
public:
  class Prelay_Sub : public Prelay_Async {
  public:
    explicit Prelay_Sub(std::string_view name = "sub") : Prelay_Async{name} {}
    virtual ~Prelay_Sub() noexcept;

    Prelay_Sub(const Prelay_Sub &obj) = delete;
    const Prelay_Sub &operator=(const Prelay_Sub &obj) = delete;
    Prelay_Sub(Prelay_Sub &&obj) = delete;
    Prelay_Sub &operator=(Prelay_Sub &&obj) = delete;

    /**
     * @brief Called on the subscriber's executor thread for each item.
     */
    virtual void notify(const T &item) = 0;

    /**
     * @brief Unregister from the publisher (if any) and wait until every
     *        notify() already queued has returned.
     */
    void unsubscribe();

    friend class Prelay_Pub;

  private:
    void notifyInternal(const T &item);

    std::mutex m_pub_mutex{};
    Prelay_Pub *m_pub{};
  }; // class Prelay_Sub

  explicit Prelay_Pub(std::string_view name);
  virtual ~Prelay_Pub() noexcept;

  Prelay_Pub(const Prelay_Pub &obj) = delete;
  const Prelay_Pub &operator=(const Prelay_Pub &obj) = delete;
  Prelay_Pub(Prelay_Pub &&obj) = delete;
  Prelay_Pub &operator=(Prelay_Pub &&obj) = delete;

  /**
   * @brief Publish item to the current subscribers.
   *
   * @param item  The item, copied into the delivery task.
   * @param block If true, return only after the item has been handed to
   *              every subscriber's executor.
   */
  void publish(const T &item, bool block = false);

  void registerSubscriber(Prelay_Sub *sub);

  void unregisterSubscriber(Prelay_Sub *sub);

  auto subscriberCount() -> size_t;

protected:
  virtual void publishInternal(const T &item);

private:
  std::string m_name{};

  std::mutex m_mutex{}; // protects m_subscribers
  std::vector<Prelay_Sub *> m_subscribers{};
}; // class Prelay_Pub

// class Prelay_Pub::Prelay_Sub
template <typename T> Prelay_Pub<T>::Prelay_Sub::~Prelay_Sub() noexcept try {
  unsubscribe();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> void Prelay_Pub<T>::Prelay_Sub::unsubscribe() {
  Prelay_Pub *pub{};

  {
    const std::lock_guard<std::mutex> lock(m_pub_mutex);
    pub = m_pub;
  }

  if (nullptr != pub) {
    pub->unregisterSubscriber(this);
  }

  this->waitForEmpty();
}

template <typename T>
void Prelay_Pub<T>::Prelay_Sub::notifyInternal(const T &item) {
  PRELAY_ASYNC_CALL_WITH_CAPTURE({ this->notify(item); }, this, item);
}

// class Prelay_Pub
template <typename T>
Prelay_Pub<T>::Prelay_Pub(std::string_view name)
    : Prelay_Async{name}, m_name{name} {}

template <typename T> Prelay_Pub<T>::~Prelay_Pub() noexcept try {
  // Let pending publishes reach the subscribers before detaching them.
  this->waitForEmpty();

  const std::lock_guard<std::mutex> lock(m_mutex);

  for (auto *sub : m_subscribers) {
    const std::lock_guard<std::mutex> sub_lock(sub->m_pub_mutex);
    sub->m_pub = nullptr;
  }

  m_subscribers.clear();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> void Prelay_Pub<T>::publish(const T &item, bool block) {
  if (block) {
    auto waitHandler = this->addExecTaskWithWait(
        [this, item]() -> void { this->publishInternal(item); });

    waitHandler->wait();
  } else {
    PRELAY_ASYNC_CALL_WITH_CAPTURE({ this->publishInternal(item); }, this,
                                   item);
  }
}

template <typename T> void Prelay_Pub<T>::publishInternal(const T &item) {
  const std::lock_guard<std::mutex> lock(m_mutex);

  for (auto *sub : m_subscribers) {
    sub->notifyInternal(item);
  }
}

template <typename T> void Prelay_Pub<T>::registerSubscriber(Prelay_Sub *sub) {
  const std::lock_guard<std::mutex> lock(m_mutex);
  const std::lock_guard<std::mutex> sub_lock(sub->m_pub_mutex);

  if (this == sub->m_pub) {
    return;
  }

  if (nullptr != sub->m_pub) {
    throw std::runtime_error(
        "The subscriber has been registered with another publisher");
  }

  sub->m_pub = this;
  m_subscribers.push_back(sub);
}

template <typename T>
void Prelay_Pub<T>::unregisterSubscriber(Prelay_Sub *sub) {
  const std::lock_guard<std::mutex> lock(m_mutex);
  const std::lock_guard<std::mutex> sub_lock(sub->m_pub_mutex);

  if (this != sub->m_pub) {
    return;
  }

  sub->m_pub = nullptr;

  m_subscribers.erase(
      std::remove(m_subscribers.begin(), m_subscribers.end(), sub),
      m_subscribers.end());
}

template <typename T> auto Prelay_Pub<T>::subscriberCount() -> size_t {
  const std::lock_guard<std::mutex> lock(m_mutex);

  return m_subscribers.size();
}

} // namespace prelay

#endif // PRELAY_PUB_SUB_HPP_
