#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/generation/generation_client.hpp"
#include "internal/model/content_type.hpp"
#include "internal/quality/criteria.hpp"
#include "internal/util/circuit_breaker.hpp"
#include "internal/util/retry.hpp"

namespace muse::quality {

inline constexpr int32_t kSaveScore     = 70;
inline constexpr int32_t kReviewScore   = 50;
inline constexpr int32_t kFallbackScore = 50;

struct QualityGateOptions {
  util::RetryOptions             retry;
  util::CircuitBreaker::Options  breaker;
  uint32_t                       max_tokens  = 1000;
  double                         temperature = 0.3;
};

/*
  QualityGate

  One assessment request per artifact, parsed into per-criterion scores
  and folded into a weighted verdict.

  Assess never throws: a failed request, an open breaker or an unknown
  content type all yield the degraded assessment (score 50, review).
*/
class QualityGate {
 public:
  QualityGate(std::shared_ptr<generation::GenerationClient> assessor, QualityGateOptions options);

  muse::autonomous::v1::QualityAssessment Assess(const muse::autonomous::v1::GeneratedContent& content, model::ContentType type);

  util::CircuitBreaker& Breaker() {
    return breaker_;
  }

 private:
  std::shared_ptr<generation::GenerationClient> assessor_;
  QualityGateOptions                            options_;
  util::CircuitBreaker                          breaker_;
};

std::string BuildAssessmentPrompt(const muse::autonomous::v1::GeneratedContent& content,
                                  model::ContentType                            type,
                                  const std::vector<CriterionSpec>&             criteria);

// Reads "Name: score" lines, preferring the <evaluation> block. Criteria
// missing from the response score kFallbackScore.
std::map<std::string, int32_t> ParseScores(const std::string& response, const std::vector<CriterionSpec>& criteria);

muse::autonomous::v1::QualityAssessment Compile(const std::map<std::string, int32_t>& scores, const std::vector<CriterionSpec>& criteria);

muse::autonomous::v1::QualityAssessment DegradedAssessment(const std::string& error);

muse::autonomous::v1::Recommendation Recommend(int32_t overall_score);

// The persistence decision: recommendation save and score at or above threshold.
bool ShouldSave(const muse::autonomous::v1::QualityAssessment& assessment, uint32_t quality_threshold);

} // namespace muse::quality
