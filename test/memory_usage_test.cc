/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#define CATCH_CONFIG_MAIN
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "hashtab.hpp"
#include "catch2/catch.hpp"

// Long enough to never fit in a small-string buffer.
static const std::string kLongString(100, 'x');

TEST_CASE("Scalars", "[scalars]") {
  REQUIRE(hashtab::HeapSizeOf(3) == 0);
  REQUIRE(hashtab::HeapSizeOf(2.5) == 0);
  REQUIRE(hashtab::DeepSizeOf(3) == sizeof(int));
  REQUIRE(hashtab::DeepSizeOf(std::make_pair(1, 2.)) ==
          sizeof(std::pair<int, double>));
}

TEST_CASE("Strings", "[strings]") {
  const std::string short_string = "abc";
  REQUIRE(hashtab::HeapSizeOf(short_string) == 0);
  REQUIRE(hashtab::DeepSizeOf(short_string) == sizeof(std::string));

  REQUIRE(hashtab::HeapSizeOf(kLongString) == kLongString.capacity() + 1);
  REQUIRE(hashtab::HeapSizeOf(kLongString) > kLongString.size());
}

TEST_CASE("Containers", "[containers]") {
  std::vector<int> ints(10);
  REQUIRE(hashtab::HeapSizeOf(ints) == ints.capacity() * sizeof(int));

  std::vector<std::string> strings{kLongString, "abc"};
  REQUIRE(hashtab::HeapSizeOf(strings) ==
          strings.capacity() * sizeof(std::string) +
              hashtab::HeapSizeOf(kLongString));

  std::optional<std::vector<int>> disengaged;
  REQUIRE(hashtab::HeapSizeOf(disengaged) == 0);
  std::optional<std::vector<int>> engaged(ints);
  REQUIRE(hashtab::HeapSizeOf(engaged) == engaged->capacity() * sizeof(int));
}

TEST_CASE("Open addressing", "[open-addressing]") {
  typedef hashtab::LinearProbingHashMap<int, std::string> Map;
  Map map(8);
  const std::size_t empty_bytes =
      map.Slots().capacity() * sizeof(Map::SlotType);
  REQUIRE(hashtab::HeapSizeOf(map) == empty_bytes);
  REQUIRE(hashtab::DeepSizeOf(map) == sizeof(Map) + empty_bytes);

  map.Insert(1, kLongString);
  map.Insert(2, "abc");
  REQUIRE(map.Capacity() == 8);
  REQUIRE(hashtab::HeapSizeOf(map) ==
          empty_bytes + hashtab::HeapSizeOf(kLongString));

  // Tombstones own no entry.
  map.Erase(1);
  REQUIRE(map.NumTombstones() == 1);
  REQUIRE(hashtab::HeapSizeOf(map) == empty_bytes);
}

TEST_CASE("Chaining", "[chaining]") {
  typedef hashtab::ChainingHashMap<int, std::string> Map;
  Map map(8);
  const std::size_t empty_bytes =
      map.Buckets().capacity() * sizeof(Map::Bucket);
  REQUIRE(hashtab::HeapSizeOf(map) == empty_bytes);

  map.Insert(3, kLongString);
  const std::size_t chain_bytes =
      map.Buckets()[map.HomeIndex(3)]->capacity() * sizeof(Map::Entry);
  REQUIRE(hashtab::HeapSizeOf(map) ==
          empty_bytes + chain_bytes + hashtab::HeapSizeOf(kLongString));

  // The chain is released along with its last entry.
  map.Erase(3);
  REQUIRE(hashtab::HeapSizeOf(map) == empty_bytes);
}

TEST_CASE("Growth is charged", "[growth]") {
  hashtab::QuadraticProbingHashMap<int, int> map(8);
  const std::size_t initial_bytes = hashtab::DeepSizeOf(map);
  for (int key = 0; key < 100; ++key) {
    map.Insert(key, key);
  }
  REQUIRE(map.Capacity() > 8);
  REQUIRE(hashtab::DeepSizeOf(map) > initial_bytes);
}

TEST_CASE("Standard library map", "[unordered-map]") {
  std::unordered_map<std::string, double> map;
  const std::size_t empty_bytes = hashtab::HeapSizeOf(map);
  map[kLongString] = 1.;
  map["abc"] = 2.;
  REQUIRE(hashtab::HeapSizeOf(map) >
          empty_bytes + hashtab::HeapSizeOf(kLongString));
}
