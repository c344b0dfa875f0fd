/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-server.cpp
 * @brief The unit test for the relay server lifecycle and job relay.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "prelay-server.hpp"
#include "prelay-socket.hpp"
#include "prelay-test-sink.hpp"

static auto nextEvent(prelay::Prelay_Event_Subscription &subscription,
                      prelay::EventKindPb kind)
    -> std::optional<prelay::EventPb> {
  while (auto event = subscription.read(std::chrono::milliseconds{5000})) {
    if (kind == event->kind()) {
      return event;
    }
  }

  return {};
}

static auto nextState(prelay::Prelay_Event_Subscription &subscription)
    -> prelay::ServerStatePb {
  auto event = nextEvent(subscription, prelay::STATE_CHANGE);

  return event ? event->state_change().current() : prelay::STOPPED;
}

static void sendJob(uint16_t port, const std::string &data) {
  prelay::Prelay_Tcp_Stream client{"127.0.0.1", port,
                                   std::chrono::milliseconds{5000}};

  client.write(std::string{data});
  client.shutdownWrite();

  // the server closes the connection once the job is printed
  while (client.read()) {
  }
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  auto sink = std::make_shared<Prelay_Recording_Sink>();
  prelay::Prelay_Relay_Server server{sink};
  auto subscription = server.subscribe();

  prelay::ServerConfig config{};
  config.printer_name = "lp0";
  config.port = 0;
  config.bind_address = "127.0.0.1";
  config.grace_period_ms = 1000;

  EXPECT_TRUE(prelay::ServerState::kStopped == server.status());
  EXPECT_TRUE(0 == server.port());

  // start
  auto started = server.start(config);
  EXPECT_TRUE(started.has_value());
  EXPECT_TRUE(prelay::ServerState::kListening == server.status());
  EXPECT_TRUE(server.port() > 0);
  EXPECT_TRUE("lp0" == server.config().printer_name);

  EXPECT_TRUE(prelay::STARTING == nextState(*subscription));

  auto listening = nextEvent(*subscription, prelay::STATE_CHANGE);
  EXPECT_TRUE(listening &&
              prelay::LISTENING == listening->state_change().current());
  EXPECT_TRUE(listening && server.port() == listening->state_change().port());
  EXPECT_TRUE(listening &&
              "lp0" == listening->state_change().printer_name());

  // a second start leaves the running server alone
  auto again = server.start(config);
  EXPECT_TRUE(!again &&
              prelay::StartErrorCode::kAlreadyRunning == again.error().code);
  EXPECT_TRUE(prelay::ServerState::kListening == server.status());

  // one job
  sendJob(server.port(), "Hello World");

  auto outcome = nextEvent(*subscription, prelay::JOB_OUTCOME);
  EXPECT_TRUE(outcome.has_value());

  if (outcome) {
    const auto &job = outcome->job_outcome();

    EXPECT_TRUE(prelay::SUCCESS == job.outcome());
    EXPECT_TRUE(11 == job.byte_count());
    EXPECT_TRUE("lp0" == job.printer_name());
    EXPECT_TRUE(job.remote_address().starts_with("127.0.0.1:"));
    EXPECT_TRUE(job.job_id() > 0);
  }

  auto deliveries = sink->deliveries();
  EXPECT_TRUE(1 == deliveries.size());
  EXPECT_TRUE(!deliveries.empty() && "Hello World" == deliveries[0].data);
  EXPECT_TRUE(!deliveries.empty() && "lp0" == deliveries[0].printer_name);

  // concurrent clients are relayed independently and byte for byte
  constexpr int kClients{8};
  std::set<std::string> payloads{};
  std::vector<std::thread> clients{};

  for (int i = 0; i < kClients; ++i) {
    std::string payload(4096 * (i + 1), static_cast<char>('a' + i));
    payload += "\x1b" "E" + std::to_string(i);

    payloads.insert(payload);
    clients.emplace_back(sendJob, server.port(), payload);
  }

  for (auto &client : clients) {
    client.join();
  }

  std::set<uint64_t> jobIds{};
  for (int i = 0; i < kClients; ++i) {
    auto event = nextEvent(*subscription, prelay::JOB_OUTCOME);
    EXPECT_TRUE(event && prelay::SUCCESS == event->job_outcome().outcome());

    if (event) {
      jobIds.insert(event->job_outcome().job_id());
    }
  }

  EXPECT_TRUE(kClients == jobIds.size());

  deliveries = sink->deliveries();
  EXPECT_TRUE(kClients + 1 == deliveries.size());

  std::set<std::string> received{};
  for (size_t i = 1; i < deliveries.size(); ++i) {
    received.insert(deliveries[i].data);
  }

  EXPECT_TRUE(payloads == received);

  // stop
  auto stopped = server.stop();
  EXPECT_TRUE(stopped.has_value());
  EXPECT_TRUE(prelay::ServerState::kStopped == server.status());
  EXPECT_TRUE(0 == server.port());
  EXPECT_TRUE(0 == server.activeJobs());

  EXPECT_TRUE(prelay::STOPPING == nextState(*subscription));
  EXPECT_TRUE(prelay::STOPPED == nextState(*subscription));

  auto stoppedAgain = server.stop();
  EXPECT_TRUE(!stoppedAgain &&
              prelay::StopErrorCode::kNotRunning == stoppedAgain.error().code);

  // restart works from Stopped and from Listening
  auto restarted = server.restart(config);
  EXPECT_TRUE(restarted.has_value());
  EXPECT_TRUE(prelay::ServerState::kListening == server.status());

  config.printer_name = "lp1";
  restarted = server.restart(config);
  EXPECT_TRUE(restarted.has_value());
  EXPECT_TRUE(prelay::ServerState::kListening == server.status());
  EXPECT_TRUE("lp1" == server.config().printer_name);

  sendJob(server.port(), "after restart");

  auto restartedJob = nextEvent(*subscription, prelay::JOB_OUTCOME);
  EXPECT_TRUE(restartedJob &&
              "lp1" == restartedJob->job_outcome().printer_name());

  EXPECT_TRUE(server.stop().has_value());

  // an invalid configuration fails the start and leaves the server stopped
  prelay::ServerConfig invalid = config;
  invalid.max_jobs = 0;

  auto subscriptionInvalid = server.subscribe();
  auto failed = server.start(invalid);
  EXPECT_TRUE(!failed &&
              prelay::StartErrorCode::kInvalidConfig == failed.error().code);
  EXPECT_TRUE(prelay::ServerState::kStopped == server.status());

  EXPECT_TRUE(prelay::STARTING == nextState(*subscriptionInvalid));

  auto failedEvent = nextEvent(*subscriptionInvalid, prelay::STATE_CHANGE);
  EXPECT_TRUE(failedEvent &&
              prelay::FAILED == failedEvent->state_change().current());
  EXPECT_TRUE(failedEvent && !failedEvent->state_change().reason().empty());

  EXPECT_TRUE(prelay::STOPPED == nextState(*subscriptionInvalid));

  // a bind address that is not local fails to bind
  invalid = config;
  invalid.bind_address = "192.0.2.1";

  failed = server.start(invalid);
  EXPECT_TRUE(!failed &&
              prelay::StartErrorCode::kBindError == failed.error().code);
  EXPECT_TRUE(prelay::ServerState::kStopped == server.status());

  return RUN_ALL_TESTS();
}
