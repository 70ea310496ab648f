/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_SLOT_IMPL_H_
#define HASHTAB_SLOT_IMPL_H_

#include "hashtab/slot.hpp"

namespace hashtab {

template <typename KeyType, typename ValueType>
Slot<KeyType, ValueType>::Slot() HASHTAB_NOEXCEPT : state_(kEmptySlot) { }

template <typename KeyType, typename ValueType>
Slot<KeyType, ValueType>::Slot(const KeyType& key, const ValueType& value)
: state_(kOccupiedSlot), entry_(std::in_place, key, value) { }

template <typename KeyType, typename ValueType>
Slot<KeyType, ValueType> Slot<KeyType, ValueType>::Tombstone() {
  Slot slot;
  slot.state_ = kTombstoneSlot;
  return slot;
}

template <typename KeyType, typename ValueType>
SlotState Slot<KeyType, ValueType>::State() const HASHTAB_NOEXCEPT {
  return state_;
}

template <typename KeyType, typename ValueType>
bool Slot<KeyType, ValueType>::IsEmpty() const HASHTAB_NOEXCEPT {
  return state_ == kEmptySlot;
}

template <typename KeyType, typename ValueType>
bool Slot<KeyType, ValueType>::IsTombstone() const HASHTAB_NOEXCEPT {
  return state_ == kTombstoneSlot;
}

template <typename KeyType, typename ValueType>
bool Slot<KeyType, ValueType>::IsOccupied() const HASHTAB_NOEXCEPT {
  return state_ == kOccupiedSlot;
}

template <typename KeyType, typename ValueType>
const KeyType& Slot<KeyType, ValueType>::Key() const HASHTAB_NOEXCEPT {
  HASHTAB_ASSERT(IsOccupied(), "Requested the key of an unoccupied slot.");
  return entry_->first;
}

template <typename KeyType, typename ValueType>
const ValueType& Slot<KeyType, ValueType>::Value() const HASHTAB_NOEXCEPT {
  HASHTAB_ASSERT(IsOccupied(), "Requested the value of an unoccupied slot.");
  return entry_->second;
}

template <typename KeyType, typename ValueType>
ValueType& Slot<KeyType, ValueType>::MutableValue() HASHTAB_NOEXCEPT {
  HASHTAB_ASSERT(IsOccupied(), "Requested the value of an unoccupied slot.");
  return entry_->second;
}

template <typename KeyType, typename ValueType>
const typename Slot<KeyType, ValueType>::Entry&
Slot<KeyType, ValueType>::GetEntry() const HASHTAB_NOEXCEPT {
  HASHTAB_ASSERT(IsOccupied(), "Requested the entry of an unoccupied slot.");
  return *entry_;
}

template <typename KeyType, typename ValueType>
void Slot<KeyType, ValueType>::Occupy(
    const KeyType& key, const ValueType& value) {
  entry_.emplace(key, value);
  state_ = kOccupiedSlot;
}

template <typename KeyType, typename ValueType>
void Slot<KeyType, ValueType>::Bury() HASHTAB_NOEXCEPT {
  HASHTAB_ASSERT(IsOccupied(), "Only occupied slots can become tombstones.");
  entry_.reset();
  state_ = kTombstoneSlot;
}

template <typename KeyType, typename ValueType>
bool Slot<KeyType, ValueType>::operator==(const Slot& slot) const {
  if (state_ != slot.state_) {
    return false;
  }
  if (state_ != kOccupiedSlot) {
    return true;
  }
  return *entry_ == *slot.entry_;
}

template <typename KeyType, typename ValueType>
bool Slot<KeyType, ValueType>::operator!=(const Slot& slot) const {
  return !operator==(slot);
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_SLOT_IMPL_H_
