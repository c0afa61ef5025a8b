#include "grpc_generation_client.hpp"

#include <grpcpp/grpcpp.h>

#include <utility>

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace muse::generation {

GrpcGenerationClient::GrpcGenerationClient(GrpcGenerationOptions options)
    : GrpcGenerationClient(::grpc::CreateChannel(options.endpoint, ::grpc::InsecureChannelCredentials()), options) {
}

GrpcGenerationClient::GrpcGenerationClient(std::shared_ptr<::grpc::Channel> channel, GrpcGenerationOptions options)
    : options_(std::move(options)), stub_(muse::generation::v1::GenerationService::NewStub(std::move(channel))) {
}

muse::generation::v1::CompletionResponse GrpcGenerationClient::Complete(const muse::generation::v1::CompletionRequest& request) {
  observability::SpanScope span("generation.complete");
  span.SetAttribute("endpoint", options_.endpoint);

  muse::generation::v1::CompletionRequest outgoing = request;
  if (outgoing.model().empty()) outgoing.set_model(options_.model);

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + options_.timeout);

  muse::generation::v1::CompletionResponse response;
  const auto status = stub_->Complete(&ctx, outgoing, &response);
  if (!status.ok()) {
    span.RecordException(status.error_message());
    MUSE_LOG_WARN("generation call failed", {observability::StringField("endpoint", options_.endpoint),
                                             observability::IntField("code", static_cast<int>(status.error_code())),
                                             observability::StringField("error", status.error_message())});
  }
  grpc::ThrowIfFailed(status, "GenerationService.Complete");

  span.SetAttribute("tokens", static_cast<std::int64_t>(TotalTokens(response)));
  return response;
}

} // namespace muse::generation
