/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#define CATCH_CONFIG_MAIN
#include <vector>
#include "hashtab.hpp"
#include "catch2/catch.hpp"

// Maps each integer key to itself so that table layouts are predictable.
struct IdentityHash {
  std::size_t operator()(int key) const { return static_cast<std::size_t>(key); }
};

typedef hashtab::QuadraticProbingHashMap<int, int, IdentityHash> Map;
typedef Map::SlotType Slot;

static const Slot kBlank;
static const Slot kTombstone = Slot::Tombstone();

TEST_CASE("Generate indices", "[generate-indices]") {
  const Map map(8);
  const std::vector<std::size_t> indices =
      hashtab::ProbeIndices<hashtab::QuadraticProbing>(map.HomeIndex(6),
                                                       map.Capacity(), 15);
  const std::vector<std::size_t> expected{
      6, 7, 1, 4, 0, 5, 3, 2, 2, 3, 5, 0, 4, 1, 7,
  };
  REQUIRE(indices == expected);
}

TEST_CASE("Insertions", "[insertions]") {
  Map map(8, 0.49);

  map.Insert(6, 100);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, kBlank, kBlank, kBlank,
                                           kBlank, kBlank, Slot(6, 100),
                                           kBlank});
  REQUIRE(map.Size() == 1);
  map.Insert(7, 101);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, kBlank, kBlank, kBlank,
                                           kBlank, kBlank, Slot(6, 100),
                                           Slot(7, 101)});
  REQUIRE(map.Size() == 2);

  // Key 14 probes 6, 7, and then 1.
  map.Insert(14, 102);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(14, 102), kBlank,
                                           kBlank, kBlank, kBlank,
                                           Slot(6, 100), Slot(7, 101)});
  REQUIRE(map.Size() == 3);

  map.Insert(6, 90);
  map.Insert(14, 201);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(14, 201), kBlank,
                                           kBlank, kBlank, kBlank,
                                           Slot(6, 90), Slot(7, 101)});
  REQUIRE(map.Size() == 3);

  // A load factor of 4 / 8 exceeds 0.49.
  map.Insert(5, 75);
  REQUIRE(map.Capacity() == 16);
  REQUIRE(map.Size() == 4);
  REQUIRE(map.Get(5) == 75);
  REQUIRE(map.Get(6) == 90);
  REQUIRE(map.Get(7) == 101);
  REQUIRE(map.Get(14) == 201);
}

TEST_CASE("Lookups", "[lookups]") {
  Map map(8, 0.49);
  map.Insert(6, 100);
  REQUIRE(map.Get(6) == 100);
  map.Insert(7, 101);
  REQUIRE(map.Get(7) == 101);
  map.Insert(14, 102);
  REQUIRE(map.Get(14) == 102);

  REQUIRE_THROWS_AS(map.Get(0), hashtab::KeyNotFoundError);
  REQUIRE(!map.Contains(0));
}

TEST_CASE("Delete", "[delete]") {
  Map map(8, 0.49);
  map.Insert(6, 100);
  map.Insert(7, 101);
  map.Insert(14, 102);

  map.Erase(6);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(14, 102), kBlank,
                                           kBlank, kBlank, kBlank, kTombstone,
                                           Slot(7, 101)});
  REQUIRE(map.Size() == 2);
  REQUIRE(map.NumTombstones() == 1);

  map.Erase(7);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(14, 102), kBlank,
                                           kBlank, kBlank, kBlank, kTombstone,
                                           kTombstone});
  REQUIRE(map.Size() == 1);
  REQUIRE(map.NumTombstones() == 2);

  REQUIRE_THROWS_AS(map.Get(7), hashtab::KeyNotFoundError);
  REQUIRE(map.Get(14) == 102);

  map.Insert(22, 103);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(14, 102), kBlank,
                                           kBlank, kBlank, kBlank,
                                           Slot(22, 103), kTombstone});
  REQUIRE(map.Size() == 2);
  REQUIRE(map.NumTombstones() == 1);

  map.Insert(30, 104);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(14, 102), kBlank,
                                           kBlank, kBlank, kBlank,
                                           Slot(22, 103), Slot(30, 104)});
  REQUIRE(map.Size() == 3);
  REQUIRE(map.NumTombstones() == 0);

  REQUIRE_THROWS_AS(map.Erase(0), hashtab::KeyNotFoundError);
  REQUIRE(map.Size() == 3);
}

TEST_CASE("Iteration", "[iteration]") {
  Map map(4, 0.8);
  map.Insert(2, 100);
  map.Insert(3, 101);
  REQUIRE(map.Keys() == std::vector<int>{2, 3});
}

TEST_CASE("Update past a tombstone", "[delete-update]") {
  Map map(4, 0.49);
  map.Insert(1, 100);
  map.Insert(9, 101);
  map.Insert(17, 102);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), Slot(9, 101),
                                           kBlank, Slot(17, 102), kBlank,
                                           kBlank, kBlank});

  map.Erase(9);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), kTombstone,
                                           kBlank, Slot(17, 102), kBlank,
                                           kBlank, kBlank});

  map.Insert(17, 202);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), kTombstone,
                                           kBlank, Slot(17, 202), kBlank,
                                           kBlank, kBlank});
  REQUIRE(map.Size() == 2);

  map.Insert(25, 103);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), Slot(25, 103),
                                           kBlank, Slot(17, 202), kBlank,
                                           kBlank, kBlank});
  REQUIRE(map.NumTombstones() == 0);
}
