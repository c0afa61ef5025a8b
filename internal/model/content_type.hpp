#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "muse/autonomous/v1.hpp"

namespace muse::model {

using ContentType = muse::autonomous::v1::ContentType;

inline constexpr std::array<ContentType, 4> kAllContentTypes = {
    muse::autonomous::v1::CONTENT_TYPE_PLOT,
    muse::autonomous::v1::CONTENT_TYPE_CHARACTER,
    muse::autonomous::v1::CONTENT_TYPE_WORLD_SETTING,
    muse::autonomous::v1::CONTENT_TYPE_INSPIRATION,
};

constexpr std::string_view ToString(ContentType type) {
  switch (type) {
    case muse::autonomous::v1::CONTENT_TYPE_PLOT:
      return "plot";
    case muse::autonomous::v1::CONTENT_TYPE_CHARACTER:
      return "character";
    case muse::autonomous::v1::CONTENT_TYPE_WORLD_SETTING:
      return "world_setting";
    case muse::autonomous::v1::CONTENT_TYPE_INSPIRATION:
      return "inspiration";
    default:
      return "unspecified";
  }
}

inline std::optional<ContentType> ParseContentType(std::string_view name) {
  for (auto type : kAllContentTypes) {
    if (ToString(type) == name) return type;
  }
  return std::nullopt;
}

constexpr bool IsKnown(ContentType type) {
  return type == muse::autonomous::v1::CONTENT_TYPE_PLOT || type == muse::autonomous::v1::CONTENT_TYPE_CHARACTER ||
         type == muse::autonomous::v1::CONTENT_TYPE_WORLD_SETTING || type == muse::autonomous::v1::CONTENT_TYPE_INSPIRATION;
}

} // namespace muse::model
