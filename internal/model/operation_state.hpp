#pragma once

#include <optional>
#include <string_view>

#include "muse/autonomous/v1.hpp"

namespace muse::model {

using OperationStatus = muse::autonomous::v1::OperationStatus;

constexpr bool IsTerminal(OperationStatus status) {
  return status == muse::autonomous::v1::OPERATION_STATUS_COMPLETED || status == muse::autonomous::v1::OPERATION_STATUS_FAILED ||
         status == muse::autonomous::v1::OPERATION_STATUS_CANCELLED;
}

// pending -> running -> {completed, failed, cancelled}; pending may be
// cancelled directly. Terminal states never move.
constexpr bool CanTransition(OperationStatus from, OperationStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == muse::autonomous::v1::OPERATION_STATUS_UNSPECIFIED || to == muse::autonomous::v1::OPERATION_STATUS_PENDING) {
    return false;
  }
  if (from == muse::autonomous::v1::OPERATION_STATUS_PENDING) {
    return to == muse::autonomous::v1::OPERATION_STATUS_RUNNING || to == muse::autonomous::v1::OPERATION_STATUS_CANCELLED;
  }
  return from == muse::autonomous::v1::OPERATION_STATUS_RUNNING && IsTerminal(to);
}

constexpr std::string_view ToString(OperationStatus status) {
  switch (status) {
    case muse::autonomous::v1::OPERATION_STATUS_PENDING:
      return "pending";
    case muse::autonomous::v1::OPERATION_STATUS_RUNNING:
      return "running";
    case muse::autonomous::v1::OPERATION_STATUS_COMPLETED:
      return "completed";
    case muse::autonomous::v1::OPERATION_STATUS_FAILED:
      return "failed";
    case muse::autonomous::v1::OPERATION_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

inline std::optional<OperationStatus> ParseOperationStatus(std::string_view name) {
  for (auto status : {muse::autonomous::v1::OPERATION_STATUS_PENDING, muse::autonomous::v1::OPERATION_STATUS_RUNNING,
                      muse::autonomous::v1::OPERATION_STATUS_COMPLETED, muse::autonomous::v1::OPERATION_STATUS_FAILED,
                      muse::autonomous::v1::OPERATION_STATUS_CANCELLED}) {
    if (ToString(status) == name) return status;
  }
  return std::nullopt;
}

} // namespace muse::model
