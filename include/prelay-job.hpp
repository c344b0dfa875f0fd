/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-job.hpp
 * @brief One accepted connection's unit of work, from accept to outcome.
 *
 * A Job is created by the accept loop, filled in by the connection handler
 * that owns it, and published once on the event feed when it reaches a
 * terminal outcome. It is not changed after that.
 */

#ifndef PRELAY_JOB_HPP_
#define PRELAY_JOB_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "prelay-error.hpp"

namespace prelay {

enum class JobOutcome { kInProgress, kSuccess, kFailed };

enum class JobFailure {
  kNone,
  kReadError,
  kCancelled,
  kRejected,
  kEmptyJob,
  kSinkNotFound,
  kSinkDeliveryFailed
};

struct Job {
  using Clock = std::chrono::system_clock;

  uint64_t id{};
  std::string remote_address{};
  uint64_t byte_count{};
  JobOutcome outcome{JobOutcome::kInProgress};
  JobFailure failure{JobFailure::kNone};
  std::string failure_reason{};
  std::string printer_name{};
  Clock::time_point accepted{};
  Clock::time_point completed{};

  auto isTerminal() const -> bool { return JobOutcome::kInProgress != outcome; }
};

auto toJobFailure(ConnectionErrorCode code) -> JobFailure;
auto toJobFailure(SinkErrorCode code) -> JobFailure;

auto toString(JobOutcome outcome) -> std::string_view;
auto toString(JobFailure failure) -> std::string_view;

} // namespace prelay

#endif // PRELAY_JOB_HPP_
