/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_SLOT_H_
#define HASHTAB_SLOT_H_

#include <optional>
#include <utility>

#include "hashtab/macros.hpp"

namespace hashtab {

// The three states a position of an open-addressing table can be in.
enum SlotState {
  // Never occupied since the table storage was (re)allocated. A probe which
  // reaches an empty slot proves that the searched key is absent.
  kEmptySlot,

  // Previously occupied, now deleted. Probes must continue past it.
  kTombstoneSlot,

  // Holds a live (key, value) entry.
  kOccupiedSlot,
};

// A single position of an open-addressing table. The entry is only stored
// while the slot is occupied, so keys and values need not be
// default-constructible.
template <typename KeyType, typename ValueType>
class Slot {
 public:
  typedef std::pair<KeyType, ValueType> Entry;

  // Constructs an empty slot.
  Slot() HASHTAB_NOEXCEPT;

  // Constructs an occupied slot.
  Slot(const KeyType& key, const ValueType& value);

  // Returns a tombstone slot.
  static Slot Tombstone();

  // Returns the state of the slot.
  SlotState State() const HASHTAB_NOEXCEPT;

  bool IsEmpty() const HASHTAB_NOEXCEPT;
  bool IsTombstone() const HASHTAB_NOEXCEPT;
  bool IsOccupied() const HASHTAB_NOEXCEPT;

  // Accessors for the stored entry. Only valid for occupied slots.
  const KeyType& Key() const HASHTAB_NOEXCEPT;
  const ValueType& Value() const HASHTAB_NOEXCEPT;
  ValueType& MutableValue() HASHTAB_NOEXCEPT;
  const Entry& GetEntry() const HASHTAB_NOEXCEPT;

  // Stores the given entry, regardless of the previous state.
  void Occupy(const KeyType& key, const ValueType& value);

  // Converts an occupied slot into a tombstone, destroying its entry.
  void Bury() HASHTAB_NOEXCEPT;

  // Two slots are equal if they share a state and, when occupied, an entry.
  bool operator==(const Slot& slot) const;
  bool operator!=(const Slot& slot) const;

 private:
  SlotState state_;

  // Engaged if and only if 'state_' is 'kOccupiedSlot'.
  std::optional<Entry> entry_;
};

}  // namespace hashtab

#include "hashtab/slot-impl.hpp"

#endif  // ifndef HASHTAB_SLOT_H_
