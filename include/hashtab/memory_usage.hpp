/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_MEMORY_USAGE_H_
#define HASHTAB_MEMORY_USAGE_H_

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "hashtab/chaining_hash_map.hpp"
#include "hashtab/open_addressing_hash_map.hpp"
#include "hashtab/slot.hpp"

namespace hashtab {

// The number of bytes an object owns outside of its own footprint, counted
// recursively through its members and elements. All overloads are declared
// here, before any definition, so that each can see the others when nested
// containers are instantiated.

// Trivially copyable objects own no external storage.
template <typename T>
std::size_t HeapSizeOf(const T& value);

// Only strings which have outgrown the small-string buffer own heap storage.
std::size_t HeapSizeOf(const std::string& str);

template <typename First, typename Second>
std::size_t HeapSizeOf(const std::pair<First, Second>& pair);

template <typename T>
std::size_t HeapSizeOf(const std::optional<T>& optional);

// The full allocated capacity is charged, not just the used prefix.
template <typename T>
std::size_t HeapSizeOf(const std::vector<T>& vec);

template <typename KeyType, typename ValueType>
std::size_t HeapSizeOf(const Slot<KeyType, ValueType>& slot);

// The slot array plus the external storage of every live entry, obtained by
// enumerating the map. Empty and tombstoned slots only cost their footprint.
template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
std::size_t HeapSizeOf(
    const OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>&
        map);

// The bucket array, the storage of each engaged chain, and the external
// storage of every entry, obtained by enumerating the map.
template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
std::size_t HeapSizeOf(
    const ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>& map);

// An estimate for the node-based standard library map: one pointer per
// bucket plus, per entry, a node holding the entry, a next pointer and a
// cached hash.
template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
std::size_t HeapSizeOf(
    const std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>&
        map);

// Returns sizeof(value) plus HeapSizeOf(value).
template <typename T>
std::size_t DeepSizeOf(const T& value);

}  // namespace hashtab

#include "hashtab/memory_usage-impl.hpp"

#endif  // ifndef HASHTAB_MEMORY_USAGE_H_
