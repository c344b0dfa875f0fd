/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-job.cpp
 */

#include "prelay-job.hpp"

namespace prelay {

auto toJobFailure(ConnectionErrorCode code) -> JobFailure {
  switch (code) {
  case ConnectionErrorCode::kReadError:
    return JobFailure::kReadError;
  case ConnectionErrorCode::kCancelled:
    return JobFailure::kCancelled;
  case ConnectionErrorCode::kRejected:
    return JobFailure::kRejected;
  case ConnectionErrorCode::kEmptyJob:
    return JobFailure::kEmptyJob;
  }

  return JobFailure::kReadError;
}

auto toJobFailure(SinkErrorCode code) -> JobFailure {
  switch (code) {
  case SinkErrorCode::kNotFound:
    return JobFailure::kSinkNotFound;
  case SinkErrorCode::kDeliveryFailed:
    return JobFailure::kSinkDeliveryFailed;
  }

  return JobFailure::kSinkDeliveryFailed;
}

auto toString(JobOutcome outcome) -> std::string_view {
  switch (outcome) {
  case JobOutcome::kInProgress:
    return "InProgress";
  case JobOutcome::kSuccess:
    return "Success";
  case JobOutcome::kFailed:
    return "Failed";
  }

  return "Unknown";
}

auto toString(JobFailure failure) -> std::string_view {
  switch (failure) {
  case JobFailure::kNone:
    return "None";
  case JobFailure::kReadError:
    return "ReadError";
  case JobFailure::kCancelled:
    return "Cancelled";
  case JobFailure::kRejected:
    return "Rejected";
  case JobFailure::kEmptyJob:
    return "EmptyJob";
  case JobFailure::kSinkNotFound:
    return "SinkNotFound";
  case JobFailure::kSinkDeliveryFailed:
    return "SinkDeliveryFailed";
  }

  return "Unknown";
}

} // namespace prelay
