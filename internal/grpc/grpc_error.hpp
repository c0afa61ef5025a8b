#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace muse::grpc {

/*
  Converts a failed RPC status into GenerationError.

  RESOURCE_EXHAUSTED, DEADLINE_EXCEEDED, UNAVAILABLE and ABORTED are
  retryable; every other non-OK code is permanent.
*/

bool IsRetryable(::grpc::StatusCode code);

void ThrowIfFailed(const ::grpc::Status& status, std::string_view action);

} // namespace muse::grpc
