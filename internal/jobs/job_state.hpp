#pragma once

#include "artifact/manager/v1.hpp"

namespace artifact::jobs {

using artifact::manager::v1::JobStatus;

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::JOB_STATUS_COMPLETED || status == JobStatus::JOB_STATUS_FAILED;
}

// queued -> running -> completed | failed. Nothing skips running and
// terminal jobs never move again.
constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case JobStatus::JOB_STATUS_QUEUED:
      return to == JobStatus::JOB_STATUS_RUNNING;
    case JobStatus::JOB_STATUS_RUNNING:
      return to == JobStatus::JOB_STATUS_COMPLETED || to == JobStatus::JOB_STATUS_FAILED;
    default:
      return false;
  }
}

constexpr const char* StatusName(JobStatus status) {
  switch (status) {
    case JobStatus::JOB_STATUS_QUEUED:
      return "queued";
    case JobStatus::JOB_STATUS_RUNNING:
      return "running";
    case JobStatus::JOB_STATUS_COMPLETED:
      return "completed";
    case JobStatus::JOB_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace artifact::jobs
