/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_ERRORS_H_
#define HASHTAB_ERRORS_H_

#include <stdexcept>
#include <string>

namespace hashtab {

// Thrown when a lookup or an erasure references a key which is not stored in
// the map. The map is left unmodified.
class KeyNotFoundError : public std::out_of_range {
 public:
  explicit KeyNotFoundError(const std::string& what)
  : std::out_of_range(what) { }
};

// Thrown when an open-addressing insertion visits 'capacity' slots without
// finding either the key or a free slot. This only happens when the maximum
// load factor is not below one or when the probe sequence does not cover the
// table. The map is left unmodified.
class TableFullError : public std::runtime_error {
 public:
  explicit TableFullError(const std::string& what)
  : std::runtime_error(what) { }
};

}  // namespace hashtab

#endif  // ifndef HASHTAB_ERRORS_H_
