/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_MEMORY_USAGE_IMPL_H_
#define HASHTAB_MEMORY_USAGE_IMPL_H_

#include <type_traits>

#include "hashtab/memory_usage.hpp"

namespace hashtab {

template <typename T>
std::size_t HeapSizeOf(const T& /* value */) {
  static_assert(std::is_trivially_copyable<T>::value,
                "HeapSizeOf has no overload for this type.");
  return 0;
}

inline std::size_t HeapSizeOf(const std::string& str) {
  const char* data = str.data();
  const char* begin = reinterpret_cast<const char*>(&str);
  const char* end = begin + sizeof(std::string);
  if (data >= begin && data < end) {
    return 0;
  }
  // Include the null terminator.
  return str.capacity() + 1;
}

template <typename First, typename Second>
std::size_t HeapSizeOf(const std::pair<First, Second>& pair) {
  return HeapSizeOf(pair.first) + HeapSizeOf(pair.second);
}

template <typename T>
std::size_t HeapSizeOf(const std::optional<T>& optional) {
  return optional ? HeapSizeOf(*optional) : 0;
}

template <typename T>
std::size_t HeapSizeOf(const std::vector<T>& vec) {
  std::size_t num_bytes = vec.capacity() * sizeof(T);
  for (const T& value : vec) {
    num_bytes += HeapSizeOf(value);
  }
  return num_bytes;
}

template <typename KeyType, typename ValueType>
std::size_t HeapSizeOf(const Slot<KeyType, ValueType>& slot) {
  return slot.IsOccupied() ? HeapSizeOf(slot.GetEntry()) : 0;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
std::size_t HeapSizeOf(
    const OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>&
        map) {
  typedef typename OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                                         KeyEqual>::SlotType SlotType;
  std::size_t num_bytes = map.Slots().capacity() * sizeof(SlotType);
  map.ForEach([&num_bytes](const KeyType& key, const ValueType& value) {
    num_bytes += HeapSizeOf(key) + HeapSizeOf(value);
  });
  return num_bytes;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
std::size_t HeapSizeOf(
    const ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>& map) {
  typedef ChainingHashMap<KeyType, ValueType, Hash, KeyEqual> Map;
  const std::vector<typename Map::Bucket>& buckets = map.Buckets();
  std::size_t num_bytes = buckets.capacity() * sizeof(typename Map::Bucket);
  for (const typename Map::Bucket& bucket : buckets) {
    if (bucket) {
      num_bytes += bucket->capacity() * sizeof(typename Map::Entry);
    }
  }
  map.ForEach([&num_bytes](const KeyType& key, const ValueType& value) {
    num_bytes += HeapSizeOf(key) + HeapSizeOf(value);
  });
  return num_bytes;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
std::size_t HeapSizeOf(
    const std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>&
        map) {
  typedef typename std::unordered_map<KeyType, ValueType, Hash, KeyEqual,
                                      Allocator>::value_type Entry;
  std::size_t num_bytes = map.bucket_count() * sizeof(void*);
  num_bytes += map.size() *
      (sizeof(Entry) + sizeof(void*) + sizeof(std::size_t));
  for (const Entry& entry : map) {
    num_bytes += HeapSizeOf(entry.first) + HeapSizeOf(entry.second);
  }
  return num_bytes;
}

template <typename T>
std::size_t DeepSizeOf(const T& value) {
  return sizeof(T) + HeapSizeOf(value);
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_MEMORY_USAGE_IMPL_H_
