#include "quality_gate.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/json.hpp"

namespace muse::quality {

namespace v1 = muse::autonomous::v1;

namespace {

std::string EscapeRegex(const std::string& text) {
  static const std::regex kSpecial(R"([.^$|()\[\]{}*+?\\])");
  return std::regex_replace(text, kSpecial, R"(\$&)");
}

std::string Describe(const v1::QualityCriterion& criterion) {
  return criterion.name() + " (" + std::to_string(criterion.score()) + ")";
}

std::string Join(const std::vector<std::string>& parts) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += " and ";
    out += parts[i];
  }
  return out;
}

std::string Reasoning(const v1::QualityAssessment& assessment) {
  std::vector<v1::QualityCriterion> ranked(assessment.criteria().begin(), assessment.criteria().end());
  std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.score() > b.score(); });

  std::vector<std::string> top;
  std::vector<std::string> bottom;
  for (std::size_t i = 0; i < ranked.size() && i < 2; ++i) top.push_back(Describe(ranked[i]));
  for (std::size_t i = 0; i < ranked.size() && i < 2; ++i) bottom.push_back(Describe(ranked[ranked.size() - 1 - i]));

  std::string reasoning = "Overall score " + std::to_string(assessment.overall_score()) + ". ";
  switch (assessment.recommendation()) {
    case v1::RECOMMENDATION_SAVE:
      reasoning += "High quality, strongest in " + Join(top) + ". Worth keeping.";
      break;
    case v1::RECOMMENDATION_REVIEW:
      reasoning += "Moderate quality. " + Join(top) + " hold up; " + Join(bottom) + " need work. Human review recommended.";
      break;
    default:
      reasoning += "Below the bar, weakest in " + Join(bottom) + ". Regenerate.";
      break;
  }
  return reasoning;
}

} // namespace

QualityGate::QualityGate(std::shared_ptr<generation::GenerationClient> assessor, QualityGateOptions options)
    : assessor_(std::move(assessor)), options_(std::move(options)), breaker_(options_.breaker) {
  options_.retry.should_retry = [](const std::exception& e, uint32_t) { return util::IsRetryableGenerationError(e); };
}

v1::QualityAssessment QualityGate::Assess(const v1::GeneratedContent& content, model::ContentType type) {
  observability::SpanScope span("quality.assess");
  span.SetAttribute("content_type", model::ToString(type));

  try {
    const auto& criteria = CriteriaFor(type);
    const auto  request  = generation::MakeRequest("You are a strict, consistent reviewer of fiction material.",
                                                   BuildAssessmentPrompt(content, type, criteria), options_.max_tokens, options_.temperature);

    const auto response = util::Retry([&] { return breaker_.Execute([&] { return assessor_->Complete(request); }); }, options_.retry);

    auto assessment = Compile(ParseScores(response.text(), criteria), criteria);
    span.SetAttribute("overall_score", static_cast<std::int64_t>(assessment.overall_score()));
    return assessment;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    MUSE_LOG_WARN("quality assessment degraded",
                  {observability::StringField("content_type", model::ToString(type)), observability::StringField("error", e.what())});
    return DegradedAssessment(e.what());
  }
}

std::string BuildAssessmentPrompt(const v1::GeneratedContent& content, model::ContentType type, const std::vector<CriterionSpec>& criteria) {
  std::ostringstream out;
  out << "Assess the following " << model::ToString(type) << " for quality.\n\n";
  out << "[Material]\n" << util::ToJson(content) << "\n\n";
  out << "[Criteria]\n";
  for (const auto& criterion : criteria) out << "- " << criterion.name << "\n";
  out << "\nScore each criterion from 0 to 100 and answer in exactly this form:\n\n";
  out << "<evaluation>\n";
  for (const auto& criterion : criteria) out << criterion.name << ": [score] - [reason]\n";
  out << "</evaluation>\n";
  return out.str();
}

std::map<std::string, int32_t> ParseScores(const std::string& response, const std::vector<CriterionSpec>& criteria) {
  static const std::regex kBlock(R"(<evaluation>([\s\S]*?)</evaluation>)");

  std::smatch block;
  const bool  structured = std::regex_search(response, block, kBlock);
  std::string haystack   = structured ? block[1].str() : response;

  std::map<std::string, int32_t> scores;
  for (const auto& criterion : criteria) {
    const std::regex pattern(EscapeRegex(criterion.name) + R"(\s*:\s*(\d+))", std::regex::icase);
    std::smatch      match;
    if (std::regex_search(haystack, match, pattern)) {
      try {
        scores[criterion.name] = static_cast<int32_t>(std::min<long>(std::stol(match[1].str()), 1000));
      } catch (const std::out_of_range&) {
        scores[criterion.name] = 100;
      }
    } else {
      scores[criterion.name] = kFallbackScore;
    }
  }
  return scores;
}

v1::QualityAssessment Compile(const std::map<std::string, int32_t>& scores, const std::vector<CriterionSpec>& criteria) {
  v1::QualityAssessment assessment;

  double weighted     = 0.0;
  double total_weight = 0.0;
  for (const auto& entry : criteria) {
    const auto it    = scores.find(entry.name);
    const auto raw   = it == scores.end() ? kFallbackScore : it->second;
    const auto score = std::clamp<int32_t>(raw, 0, 100);

    auto* criterion = assessment.add_criteria();
    criterion->set_name(entry.name);
    criterion->set_score(score);
    criterion->set_weight(entry.weight);
    criterion->set_details("score " + std::to_string(score) + "/100");

    weighted += score * entry.weight;
    total_weight += entry.weight;
  }

  const auto overall = total_weight > 0.0 ? static_cast<int32_t>(std::lround(weighted / total_weight)) : kFallbackScore;
  assessment.set_overall_score(overall);
  assessment.set_recommendation(Recommend(overall));
  assessment.set_reasoning(Reasoning(assessment));
  return assessment;
}

v1::QualityAssessment DegradedAssessment(const std::string& error) {
  v1::QualityAssessment assessment;
  assessment.set_overall_score(kFallbackScore);
  assessment.set_recommendation(v1::RECOMMENDATION_REVIEW);
  assessment.set_reasoning("Assessment unavailable; human review required.");
  assessment.set_degraded(true);

  auto* criterion = assessment.add_criteria();
  criterion->set_name("System Error");
  criterion->set_score(kFallbackScore);
  criterion->set_weight(1.0);
  criterion->set_details("assessment failed: " + error);
  return assessment;
}

v1::Recommendation Recommend(int32_t overall_score) {
  if (overall_score >= kSaveScore) return v1::RECOMMENDATION_SAVE;
  if (overall_score >= kReviewScore) return v1::RECOMMENDATION_REVIEW;
  return v1::RECOMMENDATION_DISCARD;
}

bool ShouldSave(const v1::QualityAssessment& assessment, uint32_t quality_threshold) {
  return assessment.recommendation() == v1::RECOMMENDATION_SAVE && assessment.overall_score() >= static_cast<int32_t>(quality_threshold);
}

} // namespace muse::quality
