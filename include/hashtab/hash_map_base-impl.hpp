/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_HASH_MAP_BASE_IMPL_H_
#define HASHTAB_HASH_MAP_BASE_IMPL_H_

#include <iostream>
#include <utility>

#include "hashtab/hash_map_base.hpp"

namespace hashtab {

template <class Derived>
HashMapBase<Derived>::HashMapBase(const HashMapControl& control)
: control_(control),
  capacity_(control.initial_capacity),
  num_elements_(0),
  num_tombstones_(0) {
  CheckHashMapControl(control);
}

template <class Derived>
std::size_t HashMapBase<Derived>::Size() const HASHTAB_NOEXCEPT {
  return num_elements_;
}

template <class Derived>
bool HashMapBase<Derived>::Empty() const HASHTAB_NOEXCEPT {
  return num_elements_ == 0;
}

template <class Derived>
std::size_t HashMapBase<Derived>::Capacity() const HASHTAB_NOEXCEPT {
  return capacity_;
}

template <class Derived>
std::size_t HashMapBase<Derived>::NumTombstones() const HASHTAB_NOEXCEPT {
  return num_tombstones_;
}

template <class Derived>
double HashMapBase<Derived>::LoadFactor() const HASHTAB_NOEXCEPT {
  return static_cast<double>(num_elements_ + num_tombstones_) / capacity_;
}

template <class Derived>
double HashMapBase<Derived>::MaxLoadFactor() const HASHTAB_NOEXCEPT {
  return control_.max_load_factor;
}

template <class Derived>
std::size_t HashMapBase<Derived>::GrowthFactor() const HASHTAB_NOEXCEPT {
  return control_.growth_factor;
}

template <class Derived>
bool HashMapBase<Derived>::MaybeResize() {
  if (LoadFactor() > control_.max_load_factor) {
    Resize();
    return true;
  }
  return false;
}

template <class Derived>
void HashMapBase<Derived>::Resize() {
  Derived& derived = static_cast<Derived&>(*this);

  HashMapControl control = control_;
  control.initial_capacity = capacity_ * control_.growth_factor;
  Derived grown(control, derived.HashFunction(), derived.KeyEquality());

  // A single growth step suffices, so the re-insertions skip the load check.
  derived.ForEach([&grown](const auto& key, const auto& value) {
    grown.InsertWithoutResize(key, value);
  });
  HASHTAB_ASSERT(grown.Size() == num_elements_,
                 "Resize changed the number of live entries.");
  HASHTAB_ASSERT(grown.NumTombstones() == 0,
                 "Resize carried over tombstones.");

  if (control_.print_resizes) {
    std::cout << "Resizing from " << capacity_ << " to " << grown.Capacity()
              << " slots with " << num_elements_ << " entries and "
              << num_tombstones_ << " tombstones." << std::endl;
  }

  derived = std::move(grown);
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_HASH_MAP_BASE_IMPL_H_
