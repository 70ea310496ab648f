/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_CHAINING_HASH_MAP_H_
#define HASHTAB_CHAINING_HASH_MAP_H_

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "hashtab/errors.hpp"
#include "hashtab/hash_map_base.hpp"
#include "hashtab/hash_map_control.hpp"
#include "hashtab/macros.hpp"

namespace hashtab {

// A hash map which resolves collisions by keeping every entry whose home
// index is 'i' in the chain of bucket 'i'.
//
// A bucket which has never held an entry, or whose last entry was erased, is
// disengaged and owns no chain. Chains are kept in insertion order; an
// overwrite updates the existing entry in place. Erasures are local to a
// bucket, so no tombstones are needed.
//
// For example, with an identity hash and four buckets, inserting the keys 2
// and 6 places both in bucket 2, in that order. Erasing 6 leaves a single
// entry in the chain and subsequently erasing 2 disengages the bucket.
template <typename KeyType, typename ValueType,
          class Hash = std::hash<KeyType>,
          class KeyEqual = std::equal_to<KeyType>>
class ChainingHashMap
    : public HashMapBase<ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>> {
 public:
  typedef std::pair<KeyType, ValueType> Entry;
  typedef std::vector<Entry> Chain;
  typedef std::optional<Chain> Bucket;

  // Constructs an empty map with the given number of buckets.
  explicit ChainingHashMap(
      std::size_t initial_capacity = kDefaultInitialCapacity,
      double max_load_factor = kDefaultChainingLoadFactor);

  // Constructs an empty map from a full control structure.
  explicit ChainingHashMap(const HashMapControl& control,
                           const Hash& hash = Hash(),
                           const KeyEqual& key_equal = KeyEqual());

  // Maps 'key' to 'value', overwriting the value of an existing entry. May
  // trigger a resize afterwards.
  void Insert(const KeyType& key, const ValueType& value);

  // Returns the value mapped to 'key'. Throws KeyNotFoundError if absent.
  const ValueType& Get(const KeyType& key) const;
  ValueType& Get(const KeyType& key);

  // Returns a pointer to the value mapped to 'key', or nullptr if absent.
  const ValueType* Find(const KeyType& key) const;
  ValueType* Find(const KeyType& key);

  // Returns true if 'key' is mapped.
  bool Contains(const KeyType& key) const;

  // Removes the entry of 'key', disengaging its bucket if the chain becomes
  // empty. Throws KeyNotFoundError if absent.
  void Erase(const KeyType& key);

  // Removes all entries while keeping the number of buckets.
  void Clear();

  // Calls 'functor(key, value)' on each entry, bucket by bucket.
  template <typename Functor>
  void ForEach(Functor&& functor) const;

  // Returns the keys in the order visited by 'ForEach'.
  std::vector<KeyType> Keys() const;

  // Returns the bucket array.
  const std::vector<Bucket>& Buckets() const HASHTAB_NOEXCEPT;

  // Returns hash(key) mod Capacity().
  std::size_t HomeIndex(const KeyType& key) const;

  const Hash& HashFunction() const HASHTAB_NOEXCEPT;
  const KeyEqual& KeyEquality() const HASHTAB_NOEXCEPT;

 private:
  friend class HashMapBase<ChainingHashMap>;

  // The hash functor.
  Hash hash_;

  // The key equality predicate.
  KeyEqual key_equal_;

  // The table storage, of length 'capacity_'.
  std::vector<Bucket> buckets_;

  // The body of 'Insert' without the trailing load factor check.
  void InsertWithoutResize(const KeyType& key, const ValueType& value);
};

}  // namespace hashtab

#include "hashtab/chaining_hash_map-impl.hpp"

#endif  // ifndef HASHTAB_CHAINING_HASH_MAP_H_
