#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/generation/generation_client.hpp"

namespace muse::generation {

struct GrpcGenerationOptions {
  std::string               endpoint;
  std::chrono::milliseconds timeout{60000};
  // Used when the request leaves model empty.
  std::string               model;
};

// GenerationService/Complete over an insecure channel with a per-call deadline.
class GrpcGenerationClient final : public GenerationClient {
 public:
  explicit GrpcGenerationClient(GrpcGenerationOptions options);
  GrpcGenerationClient(std::shared_ptr<::grpc::Channel> channel, GrpcGenerationOptions options);

  std::string Name() const override {
    return "grpc:" + options_.endpoint;
  }

  muse::generation::v1::CompletionResponse Complete(const muse::generation::v1::CompletionRequest& request) override;

 private:
  GrpcGenerationOptions                                        options_;
  std::unique_ptr<muse::generation::v1::GenerationService::Stub> stub_;
};

} // namespace muse::generation
