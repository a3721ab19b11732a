#pragma once

#include <type_traits>

namespace partplan::util {

// Keyed lookups against plant master data treat a missing key as "contributes
// nothing". These helpers are the single place that policy lives.

// Returns the mapped value, or a value-initialized one (0, 0.0, empty) when
// `key` is absent.
template <typename Map, typename Key>
inline typename Map::mapped_type value_or_zero(const Map& m, const Key& key) {
  const auto it = m.find(key);
  if (it == m.end()) return typename Map::mapped_type{};
  return it->second;
}

// Returns a reference to the mapped container, or to a shared empty one when
// `key` is absent. Intended for maps of vectors (BOM lines per parent, order
// lines per part).
template <typename Map, typename Key>
inline const typename Map::mapped_type& find_or_empty(const Map& m, const Key& key) {
  static const typename Map::mapped_type kEmpty{};
  const auto it = m.find(key);
  if (it == m.end()) return kEmpty;
  return it->second;
}

// Adds `qty` to the entry for `key`, creating it at zero first.
template <typename Map, typename Key>
inline void accumulate(Map& m, const Key& key, typename Map::mapped_type qty) {
  static_assert(std::is_arithmetic_v<typename Map::mapped_type>, "accumulate() needs a numeric map");
  m[key] += qty;
}

} // namespace partplan::util
