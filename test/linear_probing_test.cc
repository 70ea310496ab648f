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

typedef hashtab::LinearProbingHashMap<int, int, IdentityHash> Map;
typedef Map::SlotType Slot;

static const Slot kBlank;
static const Slot kTombstone = Slot::Tombstone();

TEST_CASE("Generate indices", "[generate-indices]") {
  const Map map(8);
  const std::vector<std::size_t> indices =
      hashtab::ProbeIndices<hashtab::LinearProbing>(map.HomeIndex(6),
                                                    map.Capacity(), 10);
  const std::vector<std::size_t> expected{6, 7, 0, 1, 2, 3, 4, 5, 6, 7};
  REQUIRE(indices == expected);
}

TEST_CASE("Insertions", "[insertions]") {
  Map map(4, 0.8);

  map.Insert(2, 100);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, kBlank, Slot(2, 100),
                                           kBlank});
  REQUIRE(map.Size() == 1);
  map.Insert(3, 101);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, kBlank, Slot(2, 100),
                                           Slot(3, 101)});
  REQUIRE(map.Size() == 2);

  // Key 6 collides with 2 and 3 and wraps around.
  map.Insert(6, 102);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 102), kBlank, Slot(2, 100),
                                           Slot(3, 101)});

  map.Insert(2, 90);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 102), kBlank, Slot(2, 90),
                                           Slot(3, 101)});
  REQUIRE(map.Size() == 3);
  map.Insert(6, 201);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 201), kBlank, Slot(2, 90),
                                           Slot(3, 101)});
  REQUIRE(map.Size() == 3);

  // A load factor of 4 / 4 exceeds 0.8.
  map.Insert(5, 75);
  REQUIRE(map.Capacity() == 8);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, kBlank, Slot(2, 90),
                                           Slot(3, 101), kBlank, Slot(5, 75),
                                           Slot(6, 201), kBlank});
  REQUIRE(map.Size() == 4);
  REQUIRE(map.NumTombstones() == 0);
}

TEST_CASE("Lookups", "[lookups]") {
  Map map(4, 0.8);

  map.Insert(2, 100);
  REQUIRE(map.Get(2) == 100);
  map.Insert(3, 101);
  REQUIRE(map.Get(3) == 101);
  map.Insert(6, 102);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 102), kBlank, Slot(2, 100),
                                           Slot(3, 101)});
  REQUIRE(map.Get(6) == 102);

  REQUIRE_THROWS_AS(map.Get(0), hashtab::KeyNotFoundError);
  REQUIRE(map.Find(0) == nullptr);
  REQUIRE(!map.Contains(0));
  REQUIRE(map.Contains(6));
}

TEST_CASE("Delete", "[delete]") {
  Map map(4, 0.8);
  map.Insert(2, 100);
  map.Insert(3, 101);
  map.Insert(6, 102);

  map.Erase(2);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 102), kBlank, kTombstone,
                                           Slot(3, 101)});
  REQUIRE(map.Size() == 2);
  REQUIRE(map.NumTombstones() == 1);

  map.Erase(3);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 102), kBlank, kTombstone,
                                           kTombstone});
  REQUIRE(map.Size() == 1);
  REQUIRE(map.NumTombstones() == 2);

  // Probes continue across tombstones.
  REQUIRE_THROWS_AS(map.Get(10), hashtab::KeyNotFoundError);
  REQUIRE(map.Get(6) == 102);

  // New keys reuse the first tombstone on their probe sequence.
  map.Insert(14, 103);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 102), kBlank, Slot(14, 103),
                                           kTombstone});
  REQUIRE(map.Size() == 2);
  REQUIRE(map.NumTombstones() == 1);

  map.Insert(18, 104);
  REQUIRE(map.Slots() == std::vector<Slot>{Slot(6, 102), kBlank, Slot(14, 103),
                                           Slot(18, 104)});
  REQUIRE(map.Size() == 3);
  REQUIRE(map.NumTombstones() == 0);

  const std::vector<Slot> before = map.Slots();
  REQUIRE_THROWS_AS(map.Erase(0), hashtab::KeyNotFoundError);
  REQUIRE(map.Slots() == before);
  REQUIRE(map.Size() == 3);
}

TEST_CASE("Iteration", "[iteration]") {
  Map map(4, 0.8);
  map.Insert(2, 100);
  map.Insert(3, 101);
  REQUIRE(map.Keys() == std::vector<int>{2, 3});

  std::vector<int> values;
  map.ForEach([&values](int /* key */, int value) { values.push_back(value); });
  REQUIRE(values == std::vector<int>{100, 101});
}

TEST_CASE("Update past a tombstone", "[delete-update]") {
  Map map(4, 0.8);
  map.Insert(1, 100);
  map.Insert(5, 101);
  map.Insert(9, 102);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), Slot(5, 101),
                                           Slot(9, 102)});

  map.Erase(5);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), kTombstone,
                                           Slot(9, 102)});

  // The existing entry of 9 lies beyond the tombstone and must be updated in
  // place rather than duplicated into the tombstone.
  map.Insert(9, 202);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), kTombstone,
                                           Slot(9, 202)});
  REQUIRE(map.Size() == 2);

  map.Insert(13, 103);
  REQUIRE(map.Slots() == std::vector<Slot>{kBlank, Slot(1, 100), Slot(13, 103),
                                           Slot(9, 202)});
  REQUIRE(map.Size() == 3);
  REQUIRE(map.NumTombstones() == 0);
}
