/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_PROBE_SEQUENCE_IMPL_H_
#define HASHTAB_PROBE_SEQUENCE_IMPL_H_

#include "hashtab/probe_sequence.hpp"

namespace hashtab {

inline std::size_t LinearProbing::Increment(
    std::size_t /* step */) HASHTAB_NOEXCEPT {
  return 1;
}

inline std::size_t QuadraticProbing::Increment(
    std::size_t step) HASHTAB_NOEXCEPT {
  // T(i) - T(i - 1) = i for the triangular numbers T(i) = i (i + 1) / 2.
  return step;
}

template <class Stride>
ProbeSequence<Stride>::ProbeSequence(
    std::size_t start_index, std::size_t capacity) HASHTAB_NOEXCEPT
: start_index_(start_index % capacity),
  capacity_(capacity),
  step_(0),
  index_(start_index % capacity) { }

template <class Stride>
std::size_t ProbeSequence<Stride>::Index() const HASHTAB_NOEXCEPT {
  return index_;
}

template <class Stride>
std::size_t ProbeSequence<Stride>::Step() const HASHTAB_NOEXCEPT {
  return step_;
}

template <class Stride>
void ProbeSequence<Stride>::Next() HASHTAB_NOEXCEPT {
  ++step_;
  // Both summands are below 'capacity_', so the sum cannot overflow.
  index_ = (index_ + Stride::Increment(step_) % capacity_) % capacity_;
}

template <class Stride>
void ProbeSequence<Stride>::Restart() HASHTAB_NOEXCEPT {
  step_ = 0;
  index_ = start_index_;
}

template <class Stride>
std::vector<std::size_t> ProbeIndices(
    std::size_t start_index, std::size_t capacity, std::size_t num_indices) {
  std::vector<std::size_t> indices;
  indices.reserve(num_indices);
  ProbeSequence<Stride> sequence(start_index, capacity);
  for (std::size_t i = 0; i < num_indices; ++i, sequence.Next()) {
    indices.push_back(sequence.Index());
  }
  return indices;
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_PROBE_SEQUENCE_IMPL_H_
