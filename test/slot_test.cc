/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#define CATCH_CONFIG_MAIN
#include <string>
#include "hashtab.hpp"
#include "catch2/catch.hpp"

typedef hashtab::Slot<std::string, int> Slot;

TEST_CASE("State transitions", "[states]") {
  Slot slot;
  REQUIRE(slot.IsEmpty());
  REQUIRE(slot.State() == hashtab::kEmptySlot);

  slot.Occupy("apple", 100);
  REQUIRE(slot.IsOccupied());
  REQUIRE(slot.Key() == "apple");
  REQUIRE(slot.Value() == 100);

  slot.MutableValue() = 200;
  REQUIRE(slot.GetEntry() == std::make_pair(std::string("apple"), 200));

  slot.Bury();
  REQUIRE(slot.IsTombstone());
  REQUIRE(!slot.IsOccupied());
  REQUIRE(slot == Slot::Tombstone());

  slot.Occupy("banana", 7);
  REQUIRE(slot.IsOccupied());
  REQUIRE(slot.Key() == "banana");
}

TEST_CASE("Equality", "[equality]") {
  REQUIRE(Slot() == Slot());
  REQUIRE(Slot() != Slot::Tombstone());
  REQUIRE(Slot("a", 1) == Slot("a", 1));
  REQUIRE(Slot("a", 1) != Slot("a", 2));
  REQUIRE(Slot("a", 1) != Slot("b", 1));
  REQUIRE(Slot("a", 1) != Slot());
}
