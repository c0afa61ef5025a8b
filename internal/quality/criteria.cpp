#include "criteria.hpp"

#include "internal/util/errors.hpp"

namespace muse::quality {

const std::vector<CriterionSpec>& CriteriaFor(model::ContentType type) {
  static const std::vector<CriterionSpec> kPlot = {
      {"Originality", 1.0}, {"Story Structure", 1.2}, {"Emotional Arc", 0.8},
      {"Logic", 1.0},       {"Reader Appeal", 1.1},   {"Marketability", 0.7},
  };
  static const std::vector<CriterionSpec> kCharacter = {
      {"Distinct Personality", 1.2}, {"Background Consistency", 1.0}, {"Natural Dialogue", 1.1},
      {"Growth Potential", 0.9},     {"Reader Empathy", 1.0},         {"Uniqueness", 0.8},
  };
  static const std::vector<CriterionSpec> kWorldSetting = {
      {"Internal Consistency", 1.3}, {"Level of Detail", 1.0},       {"Originality", 1.1},
      {"Story Potential", 1.2},      {"Reader Comprehension", 0.9}, {"Feasibility", 0.7},
  };
  static const std::vector<CriterionSpec> kInspiration = {
      {"Serendipity", 1.4}, {"Creative Applicability", 1.2}, {"Uniqueness", 1.0}, {"Memorability", 0.8}, {"Combination Quality", 1.1},
  };

  switch (type) {
    case muse::autonomous::v1::CONTENT_TYPE_PLOT:
      return kPlot;
    case muse::autonomous::v1::CONTENT_TYPE_CHARACTER:
      return kCharacter;
    case muse::autonomous::v1::CONTENT_TYPE_WORLD_SETTING:
      return kWorldSetting;
    case muse::autonomous::v1::CONTENT_TYPE_INSPIRATION:
      return kInspiration;
    default:
      throw util::ValidationError("no quality criteria for content type " + std::to_string(static_cast<int>(type)));
  }
}

} // namespace muse::quality
