/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-event.cpp
 * @brief The unit test for the event feed and event subscriptions.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "prelay-event.hpp"

class Kind_Counter : public prelay::Prelay_Event_Subscriber {
public:
  Kind_Counter() : prelay::Prelay_Event_Subscriber{"kind-counter"} {}
  ~Kind_Counter() noexcept override { unsubscribe(); }

  void notify(const prelay::EventPb &event) override {
    const std::lock_guard<std::mutex> lock(m_mutex);
    m_kinds.push_back(event.kind());
  }

  auto kinds() -> std::vector<prelay::EventKindPb> {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_kinds;
  }

private:
  std::mutex m_mutex{};
  std::vector<prelay::EventKindPb> m_kinds{};
};

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  const std::chrono::milliseconds wait{2000};

  prelay::Prelay_Event_Feed feed{};
  auto subscription = std::make_unique<prelay::Prelay_Event_Subscription>();
  Kind_Counter counter{};

  feed.registerSubscriber(subscription.get());
  feed.registerSubscriber(&counter);

  feed.publishStateChange(prelay::ServerState::kStarting,
                          prelay::ServerState::kListening, "", 9100, "lp0");

  auto stateEvent = subscription->read(wait);
  EXPECT_TRUE(stateEvent.has_value());

  if (stateEvent) {
    EXPECT_TRUE(prelay::STATE_CHANGE == stateEvent->kind());
    EXPECT_TRUE(stateEvent->has_state_change());
    EXPECT_TRUE(prelay::STARTING == stateEvent->state_change().previous());
    EXPECT_TRUE(prelay::LISTENING == stateEvent->state_change().current());
    EXPECT_TRUE(9100 == stateEvent->state_change().port());
    EXPECT_TRUE("lp0" == stateEvent->state_change().printer_name());
    EXPECT_TRUE(stateEvent->timestamp().seconds() > 0);
  }

  prelay::Job job{};
  job.id = 7;
  job.remote_address = "10.0.0.2:50000";
  job.byte_count = 11;
  job.outcome = prelay::JobOutcome::kFailed;
  job.failure = prelay::JobFailure::kCancelled;
  job.failure_reason = "cancelled by server shutdown";
  job.printer_name = "lp0";
  job.accepted = prelay::Job::Clock::now() - std::chrono::seconds{2};
  job.completed = prelay::Job::Clock::now();

  feed.publishJobOutcome(job);

  auto jobEvent = subscription->read(wait);
  EXPECT_TRUE(jobEvent.has_value());

  if (jobEvent) {
    const auto &payload = jobEvent->job_outcome();

    EXPECT_TRUE(prelay::JOB_OUTCOME == jobEvent->kind());
    EXPECT_TRUE(7 == payload.job_id());
    EXPECT_TRUE("10.0.0.2:50000" == payload.remote_address());
    EXPECT_TRUE(11 == payload.byte_count());
    EXPECT_TRUE(prelay::FAILED_OUTCOME == payload.outcome());
    EXPECT_TRUE(prelay::CANCELLED == payload.failure());
    EXPECT_TRUE("lp0" == payload.printer_name());
    EXPECT_TRUE(payload.completed().seconds() - payload.accepted().seconds() >=
                1);
  }

  // nothing more queued
  EXPECT_TRUE(!subscription->read(std::chrono::milliseconds{100}));

  counter.waitForEmpty();
  auto kinds = counter.kinds();
  EXPECT_TRUE(2 == kinds.size());
  EXPECT_TRUE(2 == kinds.size() && prelay::STATE_CHANGE == kinds[0] &&
              prelay::JOB_OUTCOME == kinds[1]);

  // close ends the sequence
  subscription->close();
  feed.publishStateChange(prelay::ServerState::kListening,
                          prelay::ServerState::kStopping, "", 9100, "lp0");
  EXPECT_TRUE(!subscription->read(std::chrono::milliseconds{200}));
  EXPECT_TRUE(!subscription->read());
  EXPECT_TRUE(1 == feed.subscriberCount());

  // conversions
  EXPECT_TRUE(prelay::ServerState::kStopped == prelay::fromPb(prelay::STOPPED));
  EXPECT_TRUE(prelay::FAILED == prelay::toPb(prelay::ServerState::kFailed));
  EXPECT_TRUE(prelay::REJECTED == prelay::toPb(prelay::JobFailure::kRejected));
  EXPECT_TRUE(prelay::JobFailure::kSinkNotFound ==
              prelay::toJobFailure(prelay::SinkErrorCode::kNotFound));
  EXPECT_TRUE(prelay::JobFailure::kEmptyJob ==
              prelay::toJobFailure(prelay::ConnectionErrorCode::kEmptyJob));
  EXPECT_TRUE("Listening" == prelay::toString(prelay::ServerState::kListening));

  return RUN_ALL_TESTS();
}
