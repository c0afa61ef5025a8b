#pragma once

#include <string>
#include <vector>

#include "internal/model/content_type.hpp"

namespace muse::quality {

struct CriterionSpec {
  std::string name;
  double      weight = 1.0;
};

// Ordered, fixed per content type. Throws ValidationError for an unknown type.
const std::vector<CriterionSpec>& CriteriaFor(model::ContentType type);

} // namespace muse::quality
