/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-event-pb-util.hpp
 * @brief Utility macros to populate fields of the event feed protobuf
 *        messages (proto/prelay-event.pb.h).
 *
 * The macros are thin wrappers around the generated setters and behave
 * like statements. Arguments may be evaluated more than once.
 *
 * Example:
 *  prelay::EventPb event{};
 *  PRELAY_PB_SET_MSG_TIMESTAMP_FROM_TIMEPOINT(event, Job::Clock::now());
 *  PRELAY_PB_SET_MSG_KIND(event, prelay::JOB_OUTCOME);
 */

#ifndef PRELAY_EVENT_PB_UTIL_HPP_
#define PRELAY_EVENT_PB_UTIL_HPP_

#include <chrono>

#include "proto/prelay-event.pb.h"

#define PRELAY_PB_SET_TIMESTAMP_SECONDS(ts, val) (ts)->set_seconds(val)

#define PRELAY_PB_SET_TIMESTAMP_NANOS(ts, val) (ts)->set_nanos(val)

#define PRELAY_PB_SET_TIMESTAMP_FROM_TIMEPOINT(ts, tp)                         \
  do {                                                                         \
    const auto prelay_pb_ns_ =                                                 \
        std::chrono::duration_cast<std::chrono::nanoseconds>(                  \
            (tp).time_since_epoch())                                           \
            .count();                                                          \
    PRELAY_PB_SET_TIMESTAMP_SECONDS(ts, prelay_pb_ns_ / 1000000000);           \
    PRELAY_PB_SET_TIMESTAMP_NANOS(                                             \
        ts, static_cast<int32_t>(prelay_pb_ns_ % 1000000000));                 \
  } while (false)

/**
 * EventPb setters
 */
#define PRELAY_PB_SET_MSG_TIMESTAMP_FROM_TIMEPOINT(pb, tp)                     \
  PRELAY_PB_SET_TIMESTAMP_FROM_TIMEPOINT((pb).mutable_timestamp(), tp)

#define PRELAY_PB_SET_MSG_KIND(pb, val) ((pb).set_kind((val)))

/**
 * StateChangePb setters
 */
#define PRELAY_PB_SET_STATE_CHANGE_PREVIOUS(pb, val)                           \
  ((pb).mutable_state_change()->set_previous((val)))

#define PRELAY_PB_SET_STATE_CHANGE_CURRENT(pb, val)                            \
  ((pb).mutable_state_change()->set_current((val)))

#define PRELAY_PB_SET_STATE_CHANGE_REASON(pb, val)                             \
  ((pb).mutable_state_change()->set_reason((val)))

/**
 * JobOutcomePayloadPb setters
 */
#define PRELAY_PB_SET_JOB_OUTCOME_ACCEPTED_FROM_TIMEPOINT(pb, tp)              \
  PRELAY_PB_SET_TIMESTAMP_FROM_TIMEPOINT(                                      \
      (pb).mutable_job_outcome()->mutable_accepted(), tp)

#define PRELAY_PB_SET_JOB_OUTCOME_COMPLETED_FROM_TIMEPOINT(pb, tp)             \
  PRELAY_PB_SET_TIMESTAMP_FROM_TIMEPOINT(                                      \
      (pb).mutable_job_outcome()->mutable_completed(), tp)

#endif // PRELAY_EVENT_PB_UTIL_HPP_
