/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_OPEN_ADDRESSING_HASH_MAP_IMPL_H_
#define HASHTAB_OPEN_ADDRESSING_HASH_MAP_IMPL_H_

#include <string>

#include "hashtab/open_addressing_hash_map.hpp"

namespace hashtab {

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::
    OpenAddressingHashMap(std::size_t initial_capacity,
                          double max_load_factor)
: OpenAddressingHashMap(
      MakeHashMapControl(initial_capacity, max_load_factor)) { }

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::
    OpenAddressingHashMap(const HashMapControl& control, const Hash& hash,
                          const KeyEqual& key_equal)
: HashMapBase<OpenAddressingHashMap>(control),
  hash_(hash),
  key_equal_(key_equal),
  slots_(control.initial_capacity) { }

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
void OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::Insert(
    const KeyType& key, const ValueType& value) {
  InsertWithoutResize(key, value);
  this->MaybeResize();
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
void OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::
    InsertWithoutResize(const KeyType& key, const ValueType& value) {
  const std::size_t capacity = this->capacity_;

  // The first tombstone on the probe sequence is where a new key would be
  // placed, but the walk has to continue past it: the key may already live
  // further along.
  std::size_t first_tombstone = capacity;

  ProbeSequenceType sequence(HomeIndex(key), capacity);
  for (std::size_t probe = 0; probe < capacity; ++probe, sequence.Next()) {
    SlotType& slot = slots_[sequence.Index()];
    if (slot.IsOccupied()) {
      if (key_equal_(slot.Key(), key)) {
        slot.MutableValue() = value;
        return;
      }
    } else if (slot.IsTombstone()) {
      if (first_tombstone == capacity) {
        first_tombstone = sequence.Index();
      }
    } else {
      if (first_tombstone != capacity) {
        slots_[first_tombstone].Occupy(key, value);
        --this->num_tombstones_;
      } else {
        slot.Occupy(key, value);
      }
      ++this->num_elements_;
      return;
    }
  }

  // Every slot on the sequence was inspected without a match, so a
  // remembered tombstone is still a valid home for the key.
  if (first_tombstone != capacity) {
    slots_[first_tombstone].Occupy(key, value);
    --this->num_tombstones_;
    ++this->num_elements_;
    return;
  }

  throw TableFullError(
      "Exhausted the probe sequence of a table with " +
      std::to_string(capacity) + " slots without finding a free slot.");
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
std::size_t
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::FindIndex(
    const KeyType& key) const {
  const std::size_t capacity = this->capacity_;
  ProbeSequenceType sequence(HomeIndex(key), capacity);
  for (std::size_t probe = 0; probe < capacity; ++probe, sequence.Next()) {
    const SlotType& slot = slots_[sequence.Index()];
    if (slot.IsEmpty()) {
      return capacity;
    }
    if (slot.IsOccupied() && key_equal_(slot.Key(), key)) {
      return sequence.Index();
    }
  }
  return capacity;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
const ValueType&
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::Get(
    const KeyType& key) const {
  const ValueType* value = Find(key);
  if (!value) {
    throw KeyNotFoundError("The requested key is not in the map.");
  }
  return *value;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
ValueType& OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                                 KeyEqual>::Get(const KeyType& key) {
  ValueType* value = Find(key);
  if (!value) {
    throw KeyNotFoundError("The requested key is not in the map.");
  }
  return *value;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
const ValueType*
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::Find(
    const KeyType& key) const {
  const std::size_t index = FindIndex(key);
  if (index == this->capacity_) {
    return nullptr;
  }
  return &slots_[index].Value();
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
ValueType* OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                                 KeyEqual>::Find(const KeyType& key) {
  const std::size_t index = FindIndex(key);
  if (index == this->capacity_) {
    return nullptr;
  }
  return &slots_[index].MutableValue();
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
bool OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                           KeyEqual>::Contains(const KeyType& key) const {
  return FindIndex(key) != this->capacity_;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
void OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::Erase(
    const KeyType& key) {
  const std::size_t index = FindIndex(key);
  if (index == this->capacity_) {
    throw KeyNotFoundError("The key to be erased is not in the map.");
  }
  slots_[index].Bury();
  --this->num_elements_;
  ++this->num_tombstones_;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
void OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                           KeyEqual>::Clear() {
  slots_.assign(this->capacity_, SlotType());
  this->num_elements_ = 0;
  this->num_tombstones_ = 0;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
template <typename Functor>
void OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                           KeyEqual>::ForEach(Functor&& functor) const {
  for (const SlotType& slot : slots_) {
    if (slot.IsOccupied()) {
      functor(slot.Key(), slot.Value());
    }
  }
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
std::vector<KeyType>
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::Keys()
    const {
  std::vector<KeyType> keys;
  keys.reserve(this->num_elements_);
  ForEach([&keys](const KeyType& key, const ValueType& /* value */) {
    keys.push_back(key);
  });
  return keys;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
const std::vector<typename OpenAddressingHashMap<KeyType, ValueType, Stride,
                                                 Hash, KeyEqual>::SlotType>&
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::Slots()
    const HASHTAB_NOEXCEPT {
  return slots_;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
std::size_t
OpenAddressingHashMap<KeyType, ValueType, Stride, Hash, KeyEqual>::HomeIndex(
    const KeyType& key) const {
  return hash_(key) % this->capacity_;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
const Hash& OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                                  KeyEqual>::HashFunction() const
    HASHTAB_NOEXCEPT {
  return hash_;
}

template <typename KeyType, typename ValueType, class Stride, class Hash,
          class KeyEqual>
const KeyEqual& OpenAddressingHashMap<KeyType, ValueType, Stride, Hash,
                                      KeyEqual>::KeyEquality() const
    HASHTAB_NOEXCEPT {
  return key_equal_;
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_OPEN_ADDRESSING_HASH_MAP_IMPL_H_
