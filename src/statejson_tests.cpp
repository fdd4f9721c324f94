/*
    Kitties - breeding and trading collectibles on XAYA
    Copyright (C) 2021  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "statejson.hpp"

#include "genesis.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

namespace kitties
{
namespace
{

class StateJsonTests : public DBTest
{

protected:

  StateJson state;

  StateJsonTests ()
    : state(db)
  {}

};

TEST_F (StateJsonTests, EmptyState)
{
  EXPECT_EQ (state.FullState (), ParseJson (R"({
    "nextid": 0,
    "assets": [],
    "listings": {},
    "balances": {}
  })"));
}

TEST_F (StateJsonTests, FullState)
{
  InsertAsset (3, "domob", GenomeFrom ("0102030405060708090a0b0c0d0e0f10"));
  InsertAsset (1, "andy", GenomeFrom ("00ffffffffffffffffffffffffffffff"));
  SetNextId (4);

  Genesis g;
  ASSERT_TRUE (g.Parse (ParseJson (R"({
    "balances": {"domob": 1000, "andy": 5},
    "listings": {"3": 100}
  })")));
  g.Apply (db);

  EXPECT_EQ (state.FullState (), ParseJson (R"({
    "nextid": 4,
    "assets":
      [
        {
          "id": 1,
          "owner": "andy",
          "genome": "00ffffffffffffffffffffffffffffff",
          "gender": "male"
        },
        {
          "id": 3,
          "owner": "domob",
          "genome": "0102030405060708090a0b0c0d0e0f10",
          "gender": "female"
        }
      ],
    "listings": {"3": 100},
    "balances": {"andy": 5, "domob": 1000}
  })"));
}

TEST_F (StateJsonTests, GetAsset)
{
  InsertAsset (3, "domob", GenomeFrom ("0102030405060708090a0b0c0d0e0f10"));

  EXPECT_EQ (state.GetAsset (3), ParseJson (R"({
    "id": 3,
    "owner": "domob",
    "genome": "0102030405060708090a0b0c0d0e0f10",
    "gender": "female"
  })"));
  EXPECT_TRUE (state.GetAsset (4).isNull ());
}

TEST_F (StateJsonTests, GetAssetsOf)
{
  InsertAsset (5, "domob", GenomeWithFirstByte (2));
  InsertAsset (1, "andy", GenomeWithFirstByte (1));
  InsertAsset (2, "domob", GenomeWithFirstByte (1));

  const auto res = state.GetAssetsOf ("domob");
  ASSERT_TRUE (res.isArray ());
  ASSERT_EQ (res.size (), 2);
  EXPECT_EQ (res[0]["id"].asInt (), 2);
  EXPECT_EQ (res[1]["id"].asInt (), 5);

  EXPECT_EQ (state.GetAssetsOf ("bob"), ParseJson ("[]"));
}

TEST_F (StateJsonTests, ListingAndBalance)
{
  Genesis g;
  ASSERT_TRUE (g.Parse (ParseJson (R"({
    "balances": {"domob": 1000},
    "listings": {"3": 100}
  })")));
  g.Apply (db);

  EXPECT_EQ (state.GetListing (3), ParseJson ("100"));
  EXPECT_TRUE (state.GetListing (4).isNull ());
  EXPECT_EQ (state.GetBalance ("domob"), ParseJson ("1000"));
  EXPECT_TRUE (state.GetBalance ("andy").isNull ());
}

} // anonymous namespace
} // namespace kitties
