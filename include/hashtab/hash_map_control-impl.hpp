/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_HASH_MAP_CONTROL_IMPL_H_
#define HASHTAB_HASH_MAP_CONTROL_IMPL_H_

#include <stdexcept>

#include "hashtab/hash_map_control.hpp"

namespace hashtab {

inline HashMapControl MakeHashMapControl(
    std::size_t initial_capacity, double max_load_factor) {
  HashMapControl control;
  control.initial_capacity = initial_capacity;
  control.max_load_factor = max_load_factor;
  return control;
}

inline void CheckHashMapControl(const HashMapControl& control) {
  if (control.initial_capacity == 0) {
    throw std::invalid_argument("The initial capacity must be positive.");
  }
  if (!(control.max_load_factor > 0.)) {
    throw std::invalid_argument("The maximum load factor must be positive.");
  }
  if (control.growth_factor < 2) {
    throw std::invalid_argument("The growth factor must be at least two.");
  }
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_HASH_MAP_CONTROL_IMPL_H_
