#pragma once

#include <cstdint>
#include <string>

#include "muse/autonomous/v1.hpp"

namespace muse::generation {

/*
  Text generation collaborator.

  Complete blocks until the model answers. Failures are GenerationError;
  Retryable() marks rate limits, timeouts and unavailability.
*/
class GenerationClient {
 public:
  virtual ~GenerationClient() = default;

  virtual std::string Name() const = 0;

  virtual muse::generation::v1::CompletionResponse Complete(const muse::generation::v1::CompletionRequest& request) = 0;
};

muse::generation::v1::CompletionRequest MakeRequest(const std::string& system_prompt,
                                                     const std::string& user_prompt,
                                                     uint32_t           max_tokens,
                                                     double             temperature = 0.7);

inline uint32_t TotalTokens(const muse::generation::v1::CompletionResponse& response) {
  return response.prompt_tokens() + response.completion_tokens();
}

} // namespace muse::generation
