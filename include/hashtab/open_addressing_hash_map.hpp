/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_OPEN_ADDRESSING_HASH_MAP_H_
#define HASHTAB_OPEN_ADDRESSING_HASH_MAP_H_

#include <cstddef>
#include <functional>
#include <vector>

#include "hashtab/errors.hpp"
#include "hashtab/hash_map_base.hpp"
#include "hashtab/hash_map_control.hpp"
#include "hashtab/macros.hpp"
#include "hashtab/probe_sequence.hpp"
#include "hashtab/slot.hpp"

namespace hashtab {

// A hash map which stores at most one entry per table position and resolves
// collisions by walking the probe sequence defined by 'Stride' (see
// probe_sequence.hpp) from the home index hash(key) mod capacity.
//
// Deletions leave tombstones behind so that the probe sequences of other
// keys are not cut short. For every live key, each slot visited before its
// own on its probe sequence is either a tombstone or occupied by a different
// key; an empty slot therefore proves absence.
//
// For example, with an identity hash, the code block:
//
//   hashtab::LinearProbingHashMap<int, int, IdentityHash> map(4, 0.8);
//   map.Insert(2, 100);
//   map.Insert(3, 101);
//   map.Insert(6, 102);
//
// places (2, 100) in slot 2 and (3, 101) in slot 3, while key 6 probes slots
// 2 and 3 before landing in slot 0.
template <typename KeyType, typename ValueType, class Stride,
          class Hash = std::hash<KeyType>,
          class KeyEqual = std::equal_to<KeyType>>
class OpenAddressingHashMap
    : public HashMapBase<
          OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>> {
 public:
  typedef Slot<KeyType, ValueType> SlotType;
  typedef ProbeSequence<Stride> ProbeSequenceType;

  // Constructs an empty map with the given number of slots.
  explicit OpenAddressingHashMap(
      std::size_t initial_capacity = kDefaultInitialCapacity,
      double max_load_factor = kDefaultOpenAddressingLoadFactor);

  // Constructs an empty map from a full control structure.
  explicit OpenAddressingHashMap(const HashMapControl& control,
                                 const Hash& hash = Hash(),
                                 const KeyEqual& key_equal = KeyEqual());

  // Maps 'key' to 'value', overwriting the value of an existing entry. May
  // trigger a resize afterwards. Throws TableFullError if the probe sequence
  // holds neither the key nor a free slot.
  void Insert(const KeyType& key, const ValueType& value);

  // Returns the value mapped to 'key'. Throws KeyNotFoundError if absent.
  const ValueType& Get(const KeyType& key) const;
  ValueType& Get(const KeyType& key);

  // Returns a pointer to the value mapped to 'key', or nullptr if absent.
  const ValueType* Find(const KeyType& key) const;
  ValueType* Find(const KeyType& key);

  // Returns true if 'key' is mapped.
  bool Contains(const KeyType& key) const;

  // Replaces the entry of 'key' with a tombstone. Throws KeyNotFoundError if
  // absent.
  void Erase(const KeyType& key);

  // Removes all entries and tombstones while keeping the capacity.
  void Clear();

  // Calls 'functor(key, value)' on each live entry in slot order.
  template <typename Functor>
  void ForEach(Functor&& functor) const;

  // Returns the keys in the order visited by 'ForEach'.
  std::vector<KeyType> Keys() const;

  // Returns the slot array.
  const std::vector<SlotType>& Slots() const HASHTAB_NOEXCEPT;

  // Returns hash(key) mod Capacity().
  std::size_t HomeIndex(const KeyType& key) const;

  const Hash& HashFunction() const HASHTAB_NOEXCEPT;
  const KeyEqual& KeyEquality() const HASHTAB_NOEXCEPT;

 private:
  friend class HashMapBase<OpenAddressingHashMap>;

  // The hash functor.
  Hash hash_;

  // The key equality predicate.
  KeyEqual key_equal_;

  // The table storage, of length 'capacity_'.
  std::vector<SlotType> slots_;

  // Returns the index of the slot holding 'key', or 'capacity_' if absent.
  std::size_t FindIndex(const KeyType& key) const;

  // The body of 'Insert' without the trailing load factor check.
  void InsertWithoutResize(const KeyType& key, const ValueType& value);
};

template <typename KeyType, typename ValueType,
          class Hash = std::hash<KeyType>,
          class KeyEqual = std::equal_to<KeyType>>
using LinearProbingHashMap =
    OpenAddressingHashMap<KeyType, ValueType, LinearProbing, Hash, KeyEqual>;

template <typename KeyType, typename ValueType,
          class Hash = std::hash<KeyType>,
          class KeyEqual = std::equal_to<KeyType>>
using QuadraticProbingHashMap =
    OpenAddressingHashMap<KeyType, ValueType, QuadraticProbing, Hash,
                          KeyEqual>;

}  // namespace hashtab

#include "hashtab/open_addressing_hash_map-impl.hpp"

#endif  // ifndef HASHTAB_OPEN_ADDRESSING_HASH_MAP_H_
