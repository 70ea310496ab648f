/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_HASH_MAP_CONTROL_H_
#define HASHTAB_HASH_MAP_CONTROL_H_

#include <cstddef>

namespace hashtab {

// The default number of slots (or buckets) of a freshly constructed map.
static constexpr std::size_t kDefaultInitialCapacity = 8;

// The default maximum load factor of the open-addressing maps.
static constexpr double kDefaultOpenAddressingLoadFactor = 0.6;

// The default maximum load factor of the chaining map. Unlike the
// open-addressing maps, a chaining map can hold more entries than buckets.
static constexpr double kDefaultChainingLoadFactor = 1.0;

// A data structure for controlling the sizing policy of a hash map.
struct HashMapControl {
  // The number of slots (or buckets) allocated at construction. Must be
  // positive.
  std::size_t initial_capacity = kDefaultInitialCapacity;

  // Once an insertion leaves the load factor strictly above this value, the
  // table grows by 'growth_factor'. The open-addressing maps require a value
  // below one; this is not enforced.
  double max_load_factor = kDefaultOpenAddressingLoadFactor;

  // The multiplicative factor applied to the capacity on each resize.
  std::size_t growth_factor = 2;

  // Whether each resize should be reported on std::cout.
  bool print_resizes = false;
};

// Returns a control with the given capacity and maximum load factor and the
// default growth policy.
HashMapControl MakeHashMapControl(
    std::size_t initial_capacity, double max_load_factor);

// Throws std::invalid_argument if the control cannot describe a usable map.
void CheckHashMapControl(const HashMapControl& control);

}  // namespace hashtab

#include "hashtab/hash_map_control-impl.hpp"

#endif  // ifndef HASHTAB_HASH_MAP_CONTROL_H_
