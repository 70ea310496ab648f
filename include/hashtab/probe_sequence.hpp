/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_PROBE_SEQUENCE_H_
#define HASHTAB_PROBE_SEQUENCE_H_

#include <cstddef>
#include <vector>

#include "hashtab/macros.hpp"

namespace hashtab {

// The stride policies below describe a probe sequence through the distance
// between consecutive indices, i.e.,
//
//   index_i = (index_{i - 1} + Increment(i)) mod capacity.
//
// Starting from index_0 = start_index, this yields
//
//   index_i = (start_index + \sum_{j = 1}^{i} Increment(j)) mod capacity.

// index_i = (start_index + i) mod capacity.
struct LinearProbing {
  static std::size_t Increment(std::size_t step) HASHTAB_NOEXCEPT;
};

// index_i = (start_index + i (i + 1) / 2) mod capacity.
//
// The triangular-number stride breaks up the primary clusters of linear
// probing. The first 'capacity' indices cover the entire table when the
// capacity is a power of two, but not in general: for example, a capacity of
// five only ever visits offsets {0, 1, 3} from the start.
struct QuadraticProbing {
  static std::size_t Increment(std::size_t step) HASHTAB_NOEXCEPT;
};

// A lazy, unbounded sequence of candidate table indices. Callers take as
// many indices as they need (the maps take at most 'capacity' of them per
// operation) and may rewind with 'Restart'.
//
// For example, the code block:
//
//   hashtab::ProbeSequence<hashtab::QuadraticProbing> sequence(6, 8);
//   for (int i = 0; i < 8; ++i, sequence.Next()) {
//     std::cout << sequence.Index() << " ";
//   }
//
// would print "6 7 1 4 0 5 3 2".
template <class Stride>
class ProbeSequence {
 public:
  // Constructs the sequence starting at 'start_index' (reduced modulo
  // 'capacity') within a table of the given positive capacity.
  ProbeSequence(std::size_t start_index, std::size_t capacity)
      HASHTAB_NOEXCEPT;

  // Returns the current index.
  std::size_t Index() const HASHTAB_NOEXCEPT;

  // Returns the number of times the sequence has been advanced.
  std::size_t Step() const HASHTAB_NOEXCEPT;

  // Advances to the next index.
  void Next() HASHTAB_NOEXCEPT;

  // Rewinds to the starting index.
  void Restart() HASHTAB_NOEXCEPT;

 private:
  std::size_t start_index_;
  std::size_t capacity_;
  std::size_t step_;
  std::size_t index_;
};

// Returns the first 'num_indices' members of the probe sequence.
template <class Stride>
std::vector<std::size_t> ProbeIndices(
    std::size_t start_index, std::size_t capacity, std::size_t num_indices);

}  // namespace hashtab

#include "hashtab/probe_sequence-impl.hpp"

#endif  // ifndef HASHTAB_PROBE_SEQUENCE_H_
