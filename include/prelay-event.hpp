/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-event.hpp
 * @brief The relay server's event feed: state changes and job outcomes.
 *
 * Prelay_Event_Feed is a Prelay_Pub<EventPb>. The server publishes one
 * STATE_CHANGE event per lifecycle transition and exactly one JOB_OUTCOME
 * event per job. Subscribers see events from the point they registered
 * onward, in publication order; nothing is replayed.
 *
 * Two ways to consume the feed:
 *  - derive from Prelay_Event_Subscriber and implement notify(), which
 *    runs on the subscriber's own executor thread;
 *  - take a Prelay_Event_Subscription, a subscriber that queues events
 *    for a reader calling read() / read(timeout) until close().
 */

#ifndef PRELAY_EVENT_HPP_
#define PRELAY_EVENT_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "prelay-buffer.hpp"
#include "prelay-job.hpp"
#include "prelay-pub-sub.hpp"

#include "proto/prelay-event.pb.h"

namespace prelay {

enum class ServerState { kStopped, kStarting, kListening, kStopping, kFailed };

auto toString(ServerState state) -> std::string_view;
auto toPb(ServerState state) -> ServerStatePb;
auto fromPb(ServerStatePb state) -> ServerState;

auto toPb(JobOutcome outcome) -> JobOutcomePb;
auto toPb(JobFailure failure) -> JobFailurePb;
auto fromPb(JobFailurePb failure) -> JobFailure;

using Prelay_Event_Subscriber = Prelay_Pub<EventPb>::Prelay_Sub;

class Prelay_Event_Feed : public Prelay_Pub<EventPb> {
public:
  explicit Prelay_Event_Feed(std::string_view name = "event-feed");
  virtual ~Prelay_Event_Feed() noexcept = default;

  Prelay_Event_Feed(const Prelay_Event_Feed &obj) = delete;
  const Prelay_Event_Feed &operator=(const Prelay_Event_Feed &obj) = delete;
  Prelay_Event_Feed(Prelay_Event_Feed &&obj) = delete;
  Prelay_Event_Feed &operator=(Prelay_Event_Feed &&obj) = delete;

  void publishStateChange(ServerState previous, ServerState current,
                          std::string_view reason, uint16_t port,
                          std::string_view printer_name);

  void publishJobOutcome(const Job &job);
};

class Prelay_Event_Subscription : public Prelay_Event_Subscriber {
public:
  explicit Prelay_Event_Subscription(std::string_view name = "event-sub");
  virtual ~Prelay_Event_Subscription() noexcept;

  Prelay_Event_Subscription(const Prelay_Event_Subscription &obj) = delete;
  const Prelay_Event_Subscription &
  operator=(const Prelay_Event_Subscription &obj) = delete;
  Prelay_Event_Subscription(Prelay_Event_Subscription &&obj) = delete;
  Prelay_Event_Subscription &
  operator=(Prelay_Event_Subscription &&obj) = delete;

  /**
   * @brief Block for the next event; std::nullopt once closed and drained.
   */
  auto read() -> std::optional<EventPb>;

  /**
   * @brief Wait at most timeout for the next event.
   */
  auto read(std::chrono::milliseconds timeout) -> std::optional<EventPb>;

  /**
   * @brief Stop receiving; queued events stay readable, then reads return
   *        std::nullopt.
   */
  void close();

  void notify(const EventPb &event) override;

private:
  Prelay_Buffer<EventPb> m_events{};
};

} // namespace prelay

#endif // PRELAY_EVENT_HPP_
