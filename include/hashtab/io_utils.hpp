/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_IO_UTILS_H_
#define HASHTAB_IO_UTILS_H_

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "hashtab/chaining_hash_map.hpp"
#include "hashtab/open_addressing_hash_map.hpp"
#include "hashtab/slot.hpp"

namespace hashtab {

// Pretty-prints a slot as "BLANK", "TOMBSTONE", or "(key, value)".
template <typename KeyType, typename ValueType>
std::ostream& operator<<(
    std::ostream& os, const Slot<KeyType, ValueType>& slot);

// Returns "BLANK" for a disengaged chaining bucket and
// "[(key0, value0), (key1, value1), ...]" otherwise.
template <typename KeyType, typename ValueType>
std::string BucketString(
    const std::optional<std::vector<std::pair<KeyType, ValueType>>>& bucket);

// Pretty-prints a map as "{key0: value0, key1: value1, ...}". The entries are
// sorted by their printed form so that the output does not depend upon the
// table layout.
template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
std::ostream& operator<<(
    std::ostream& os,
    const OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>&
        map);
template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
std::ostream& operator<<(
    std::ostream& os,
    const ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>& map);

// Prints "msg: " followed by the map and a newline.
template <class Map>
void Print(const Map& map, const std::string& msg, std::ostream& os);

}  // namespace hashtab

#include "hashtab/io_utils-impl.hpp"

#endif  // ifndef HASHTAB_IO_UTILS_H_
