/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_HASH_MAP_BASE_H_
#define HASHTAB_HASH_MAP_BASE_H_

#include <cstddef>

#include "hashtab/hash_map_control.hpp"
#include "hashtab/macros.hpp"

namespace hashtab {

// The sizing contract shared by every collision-resolution strategy: the
// element and tombstone counters, the load factor, and the grow-and-rehash
// protocol.
//
// 'Derived' must provide:
//   * a constructor 'Derived(const HashMapControl&, const Hash&,
//     const KeyEqual&)' which allocates 'control.initial_capacity' empty
//     slots or buckets,
//   * 'HashFunction()' and 'KeyEquality()' returning those functors,
//   * 'ForEach(functor)', which calls 'functor(key, value)' for each live
//     entry, and
//   * 'InsertWithoutResize(key, value)', accessible to this class.
//
// Tombstones are only ever created by the open-addressing maps; the count
// stays at zero for chaining, so the load factor
//
//   (num_elements + num_tombstones) / capacity
//
// reduces to num_elements / capacity there.
template <class Derived>
class HashMapBase {
 public:
  // Returns the number of live entries.
  std::size_t Size() const HASHTAB_NOEXCEPT;

  // Returns true if there are no live entries.
  bool Empty() const HASHTAB_NOEXCEPT;

  // Returns the number of slots (or buckets).
  std::size_t Capacity() const HASHTAB_NOEXCEPT;

  // Returns the number of tombstones currently in the table.
  std::size_t NumTombstones() const HASHTAB_NOEXCEPT;

  // Returns (Size() + NumTombstones()) / Capacity().
  double LoadFactor() const HASHTAB_NOEXCEPT;

  // Returns the threshold which the load factor may not exceed after an
  // insertion completes.
  double MaxLoadFactor() const HASHTAB_NOEXCEPT;

  // Returns the multiplicative capacity increase of a resize.
  std::size_t GrowthFactor() const HASHTAB_NOEXCEPT;

 protected:
  // Validates the control and records its capacity.
  explicit HashMapBase(const HashMapControl& control);

  // Resizes if the load factor exceeds the maximum. This is only checked
  // once an insertion has completed, so the table may briefly sit above its
  // maximum load factor. Returns true if a resize occurred.
  bool MaybeResize();

  // Rebuilds the table with 'GrowthFactor()' times the capacity by
  // re-inserting every live entry. Tombstones are not carried over. The new
  // table is built on the side and moved in once complete, so an exception
  // thrown during the rebuild leaves this table untouched.
  void Resize();

  // The sizing parameters. The 'initial_capacity' member is the capacity the
  // current storage was allocated with.
  HashMapControl control_;

  // The number of slots (or buckets).
  std::size_t capacity_;

  // The number of live entries.
  std::size_t num_elements_;

  // The number of tombstones.
  std::size_t num_tombstones_;
};

}  // namespace hashtab

#include "hashtab/hash_map_base-impl.hpp"

#endif  // ifndef HASHTAB_HASH_MAP_BASE_H_
