#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "internal/generation/generation_client.hpp"
#include "internal/model/content_type.hpp"
#include "internal/util/circuit_breaker.hpp"
#include "internal/util/retry.hpp"

namespace muse::autonomous {

struct ContentGeneratorOptions {
  util::RetryOptions            retry;
  util::CircuitBreaker::Options breaker;
  // 0 seeds from std::random_device.
  uint64_t seed        = 0;
  double   temperature = 0.8;
};

/*
  ContentGenerator

  Produces one artifact per call through the generation collaborator.

    plot           writer draft, editor critique, writer revision on a theme
    character      draft and refinement around a trait
    world_setting  draft and refinement around a concept
    inspiration    one note combining a few seed motifs

  Every call goes through the retry policy and a breaker dedicated to
  generation. The token budget is shared by all calls of one artifact;
  later rounds are skipped once it is spent. checkpoint runs before each
  call and may throw to abandon the artifact.
*/
class ContentGenerator {
 public:
  using Checkpoint = std::function<void()>;

  ContentGenerator(std::shared_ptr<generation::GenerationClient> client, ContentGeneratorOptions options);

  muse::autonomous::v1::GeneratedContent Generate(model::ContentType type, uint32_t token_budget, const Checkpoint& checkpoint = {});

  // Confidence attached to results of this type.
  static double Confidence(model::ContentType type);

  util::CircuitBreaker& Breaker() {
    return breaker_;
  }

 private:
  struct Round {
    std::string text;
    uint32_t    tokens = 0;
  };

  // One guarded call. False when the budget was spent and nothing ran.
  bool Call(const std::string& system_prompt, const std::string& user_prompt, uint32_t budget, const Checkpoint& checkpoint,
            muse::autonomous::v1::GeneratedContent& content, Round& out);

  std::string Pick(const std::vector<std::string>& options);

  std::shared_ptr<generation::GenerationClient> client_;
  ContentGeneratorOptions                       options_;
  util::CircuitBreaker                          breaker_;

  std::mutex      rng_mutex_;
  std::mt19937_64 rng_;
};

} // namespace muse::autonomous
