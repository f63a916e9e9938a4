#pragma once

#include <ankerl/unordered_dense.h>

namespace conduit::core {

// Hash containers backed by ankerl::unordered_dense.
//
// Dense storage keeps key-value pairs contiguous, so iteration is cheap and
// follows insertion order until the first erase (erase swaps the last
// element into the hole). Code that needs a stable order across removals
// must carry its own sequence number.
//
// Usage:
//   conduit::core::fast_map<std::string, UnitMetadata> metadata;
//   conduit::core::fast_set<std::string> present;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace conduit::core
