/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_CHAINING_HASH_MAP_IMPL_H_
#define HASHTAB_CHAINING_HASH_MAP_IMPL_H_

#include "hashtab/chaining_hash_map.hpp"

namespace hashtab {

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::ChainingHashMap(
    std::size_t initial_capacity, double max_load_factor)
: ChainingHashMap(MakeHashMapControl(initial_capacity, max_load_factor)) { }

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::ChainingHashMap(
    const HashMapControl& control, const Hash& hash,
    const KeyEqual& key_equal)
: HashMapBase<ChainingHashMap>(control),
  hash_(hash),
  key_equal_(key_equal),
  buckets_(control.initial_capacity) { }

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
void ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Insert(
    const KeyType& key, const ValueType& value) {
  InsertWithoutResize(key, value);
  this->MaybeResize();
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
void ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::InsertWithoutResize(
    const KeyType& key, const ValueType& value) {
  Bucket& bucket = buckets_[HomeIndex(key)];
  if (bucket) {
    for (Entry& entry : *bucket) {
      if (key_equal_(entry.first, key)) {
        entry.second = value;
        return;
      }
    }
  } else {
    bucket.emplace();
  }
  bucket->emplace_back(key, value);
  ++this->num_elements_;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
const ValueType& ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Get(
    const KeyType& key) const {
  const ValueType* value = Find(key);
  if (!value) {
    throw KeyNotFoundError("The requested key is not in the map.");
  }
  return *value;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
ValueType& ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Get(
    const KeyType& key) {
  ValueType* value = Find(key);
  if (!value) {
    throw KeyNotFoundError("The requested key is not in the map.");
  }
  return *value;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
const ValueType* ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Find(
    const KeyType& key) const {
  const Bucket& bucket = buckets_[HomeIndex(key)];
  if (!bucket) {
    return nullptr;
  }
  for (const Entry& entry : *bucket) {
    if (key_equal_(entry.first, key)) {
      return &entry.second;
    }
  }
  return nullptr;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
ValueType* ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Find(
    const KeyType& key) {
  Bucket& bucket = buckets_[HomeIndex(key)];
  if (!bucket) {
    return nullptr;
  }
  for (Entry& entry : *bucket) {
    if (key_equal_(entry.first, key)) {
      return &entry.second;
    }
  }
  return nullptr;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
bool ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Contains(
    const KeyType& key) const {
  return Find(key) != nullptr;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
void ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Erase(
    const KeyType& key) {
  Bucket& bucket = buckets_[HomeIndex(key)];
  if (!bucket) {
    throw KeyNotFoundError("The key to be erased is not in the map.");
  }

  auto iter = bucket->begin();
  for (; iter != bucket->end(); ++iter) {
    if (key_equal_(iter->first, key)) {
      break;
    }
  }
  if (iter == bucket->end()) {
    throw KeyNotFoundError("The key to be erased is not in the map.");
  }

  bucket->erase(iter);
  if (bucket->empty()) {
    bucket.reset();
  }
  --this->num_elements_;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
void ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Clear() {
  for (Bucket& bucket : buckets_) {
    bucket.reset();
  }
  this->num_elements_ = 0;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
template <typename Functor>
void ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::ForEach(
    Functor&& functor) const {
  for (const Bucket& bucket : buckets_) {
    if (!bucket) {
      continue;
    }
    for (const Entry& entry : *bucket) {
      functor(entry.first, entry.second);
    }
  }
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
std::vector<KeyType> ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Keys()
    const {
  std::vector<KeyType> keys;
  keys.reserve(this->num_elements_);
  ForEach([&keys](const KeyType& key, const ValueType& /* value */) {
    keys.push_back(key);
  });
  return keys;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
const std::vector<
    typename ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Bucket>&
ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::Buckets() const
    HASHTAB_NOEXCEPT {
  return buckets_;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
std::size_t ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::HomeIndex(
    const KeyType& key) const {
  return hash_(key) % this->capacity_;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
const Hash& ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::HashFunction()
    const HASHTAB_NOEXCEPT {
  return hash_;
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual>
const KeyEqual&
ChainingHashMap<KeyType, ValueType, Hash, KeyEqual>::KeyEquality() const
    HASHTAB_NOEXCEPT {
  return key_equal_;
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_CHAINING_HASH_MAP_IMPL_H_
