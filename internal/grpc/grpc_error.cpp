#include "grpc_error.hpp"

#include <string>

namespace muse::grpc {

bool IsRetryable(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::ABORTED:
      return true;
    default:
      return false;
  }
}

void ThrowIfFailed(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) return;
  throw util::GenerationError(std::string(action) + " failed (" + std::to_string(static_cast<int>(status.error_code())) + "): " +
                                  status.error_message(),
                              IsRetryable(status.error_code()));
}

} // namespace muse::grpc
