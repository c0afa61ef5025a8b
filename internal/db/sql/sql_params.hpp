#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace muse::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so repositories write '?' and the
  Postgres driver renumbers.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

inline Param OptionalText(const std::optional<std::string>& value) {
  if (value) return *value;
  return nullptr;
}

inline Param OptionalInt64(const std::optional<int64_t>& value) {
  if (value) return *value;
  return nullptr;
}

}
