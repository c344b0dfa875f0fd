/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-event.cpp
 */

#include "prelay-event.hpp"

#include <string>

#include "prelay-event-pb-util.hpp"

namespace prelay {

auto toString(ServerState state) -> std::string_view {
  switch (state) {
  case ServerState::kStopped:
    return "Stopped";
  case ServerState::kStarting:
    return "Starting";
  case ServerState::kListening:
    return "Listening";
  case ServerState::kStopping:
    return "Stopping";
  case ServerState::kFailed:
    return "Failed";
  }

  return "Unknown";
}

auto toPb(ServerState state) -> ServerStatePb {
  switch (state) {
  case ServerState::kStopped:
    return STOPPED;
  case ServerState::kStarting:
    return STARTING;
  case ServerState::kListening:
    return LISTENING;
  case ServerState::kStopping:
    return STOPPING;
  case ServerState::kFailed:
    return FAILED;
  }

  return FAILED;
}

auto fromPb(ServerStatePb state) -> ServerState {
  switch (state) {
  case STOPPED:
    return ServerState::kStopped;
  case STARTING:
    return ServerState::kStarting;
  case LISTENING:
    return ServerState::kListening;
  case STOPPING:
    return ServerState::kStopping;
  default:
    return ServerState::kFailed;
  }
}

auto toPb(JobOutcome outcome) -> JobOutcomePb {
  switch (outcome) {
  case JobOutcome::kInProgress:
    return IN_PROGRESS;
  case JobOutcome::kSuccess:
    return SUCCESS;
  case JobOutcome::kFailed:
    return FAILED_OUTCOME;
  }

  return FAILED_OUTCOME;
}

auto toPb(JobFailure failure) -> JobFailurePb {
  switch (failure) {
  case JobFailure::kNone:
    return NONE;
  case JobFailure::kReadError:
    return READ_ERROR;
  case JobFailure::kCancelled:
    return CANCELLED;
  case JobFailure::kRejected:
    return REJECTED;
  case JobFailure::kEmptyJob:
    return EMPTY_JOB;
  case JobFailure::kSinkNotFound:
    return SINK_NOT_FOUND;
  case JobFailure::kSinkDeliveryFailed:
    return SINK_DELIVERY_FAILED;
  }

  return SINK_DELIVERY_FAILED;
}

auto fromPb(JobFailurePb failure) -> JobFailure {
  switch (failure) {
  case NONE:
    return JobFailure::kNone;
  case READ_ERROR:
    return JobFailure::kReadError;
  case CANCELLED:
    return JobFailure::kCancelled;
  case REJECTED:
    return JobFailure::kRejected;
  case EMPTY_JOB:
    return JobFailure::kEmptyJob;
  case SINK_NOT_FOUND:
    return JobFailure::kSinkNotFound;
  default:
    return JobFailure::kSinkDeliveryFailed;
  }
}

// class Prelay_Event_Feed
Prelay_Event_Feed::Prelay_Event_Feed(std::string_view name)
    : Prelay_Pub<EventPb>{name} {}

void Prelay_Event_Feed::publishStateChange(ServerState previous,
                                           ServerState current,
                                           std::string_view reason,
                                           uint16_t port,
                                           std::string_view printer_name) {
  EventPb event{};

  PRELAY_PB_SET_MSG_TIMESTAMP_FROM_TIMEPOINT(event, Job::Clock::now());
  PRELAY_PB_SET_MSG_KIND(event, STATE_CHANGE);
  PRELAY_PB_SET_STATE_CHANGE_PREVIOUS(event, toPb(previous));
  PRELAY_PB_SET_STATE_CHANGE_CURRENT(event, toPb(current));
  PRELAY_PB_SET_STATE_CHANGE_REASON(event, std::string{reason});
  event.mutable_state_change()->set_port(port);
  event.mutable_state_change()->set_printer_name(std::string{printer_name});

  publish(event);
}

void Prelay_Event_Feed::publishJobOutcome(const Job &job) {
  EventPb event{};

  PRELAY_PB_SET_MSG_TIMESTAMP_FROM_TIMEPOINT(event, Job::Clock::now());
  PRELAY_PB_SET_MSG_KIND(event, JOB_OUTCOME);

  auto *payload = event.mutable_job_outcome();
  payload->set_job_id(job.id);
  payload->set_remote_address(job.remote_address);
  payload->set_byte_count(job.byte_count);
  payload->set_outcome(toPb(job.outcome));
  payload->set_failure(toPb(job.failure));
  payload->set_failure_reason(job.failure_reason);
  payload->set_printer_name(job.printer_name);

  PRELAY_PB_SET_JOB_OUTCOME_ACCEPTED_FROM_TIMEPOINT(event, job.accepted);
  PRELAY_PB_SET_JOB_OUTCOME_COMPLETED_FROM_TIMEPOINT(event, job.completed);

  publish(event);
}

// class Prelay_Event_Subscription
Prelay_Event_Subscription::Prelay_Event_Subscription(std::string_view name)
    : Prelay_Event_Subscriber{name} {}

Prelay_Event_Subscription::~Prelay_Event_Subscription() noexcept try {
  unsubscribe();
  m_events.close();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Prelay_Event_Subscription::read() -> std::optional<EventPb> {
  return m_events.pop();
}

auto Prelay_Event_Subscription::read(std::chrono::milliseconds timeout)
    -> std::optional<EventPb> {
  return m_events.popFor(timeout);
}

void Prelay_Event_Subscription::close() {
  unsubscribe();
  m_events.close();
}

void Prelay_Event_Subscription::notify(const EventPb &event) {
  m_events.push(event);
}

} // namespace prelay
