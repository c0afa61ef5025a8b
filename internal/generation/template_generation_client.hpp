#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include "internal/generation/generation_client.hpp"

namespace muse::generation {

/*
  Offline generator used when no endpoint is configured.

  Prompts that ask for an <evaluation> block get one line per listed
  criterion ("- Name" lines in the prompt) with a pseudo-random score.
  Any other prompt gets a short templated passage built around the last
  quoted phrase of the prompt. Output is reproducible for a given seed.
*/
class TemplateGenerationClient final : public GenerationClient {
 public:
  explicit TemplateGenerationClient(uint64_t seed = 0);

  std::string Name() const override {
    return "template";
  }

  muse::generation::v1::CompletionResponse Complete(const muse::generation::v1::CompletionRequest& request) override;

 private:
  std::string Evaluate(const std::string& prompt);
  std::string Compose(const std::string& prompt);

  std::mutex      mutex_;
  std::mt19937_64 rng_;
};

} // namespace muse::generation
