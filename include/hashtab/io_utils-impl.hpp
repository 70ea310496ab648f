/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_IO_UTILS_IMPL_H_
#define HASHTAB_IO_UTILS_IMPL_H_

#include <algorithm>
#include <sstream>

#include "hashtab/io_utils.hpp"

namespace hashtab {

namespace io_utils {

// Renders each entry of the map as "key: value" and sorts the results.
template <class Map>
std::vector<std::string> SortedEntryStrings(const Map& map) {
  std::vector<std::string> pairs;
  pairs.reserve(map.Size());
  map.ForEach([&pairs](const auto& key, const auto& value) {
    std::ostringstream os;
    os << key << ": " << value;
    pairs.push_back(os.str());
  });
  std::sort(pairs.begin(), pairs.end());
  return pairs;
}

template <class Map>
std::ostream& PrintEntries(std::ostream& os, const Map& map) {
  const std::vector<std::string> pairs = SortedEntryStrings(map);
  os << "{";
  for (std::size_t i = 0; i < pairs.size(); ++i) {
    if (i > 0) {
      os << ", ";
    }
    os << pairs[i];
  }
  os << "}";
  return os;
}

}  // namespace io_utils

template <typename KeyType, typename ValueType>
std::ostream& operator<<(
    std::ostream& os, const Slot<KeyType, ValueType>& slot) {
  switch (slot.State()) {
    case kEmptySlot:
      os << "BLANK";
      break;
    case kTombstoneSlot:
      os << "TOMBSTONE";
      break;
    case kOccupiedSlot:
      os << "(" << slot.Key() << ", " << slot.Value() << ")";
      break;
  }
  return os;
}

template <typename KeyType, typename ValueType>
std::string BucketString(
    const std::optional<std::vector<std::pair<KeyType, ValueType>>>& bucket) {
  if (!bucket) {
    return "BLANK";
  }
  std::ostringstream os;
  os << "[";
  for (std::size_t i = 0; i < bucket->size(); ++i) {
    if (i > 0) {
      os << ", ";
    }
    os << "(" << (*bucket)[i].first << ", " << (*bucket)[i].second << ")";
  }
  os << "]";
  return os.str();
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
std::ostream& operator<<(
    std::ostream& os,
    const OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>&
        map) {
  return io_utils::PrintEntries(os, map);
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
std::ostream& operator<<(
    std::ostream& os,
    const ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>& map) {
  return io_utils::PrintEntries(os, map);
}

template <class Map>
void Print(const Map& map, const std::string& msg, std::ostream& os) {
  os << msg << ": ";
  os << map << std::endl;
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_IO_UTILS_IMPL_H_
