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

#include "private/marketplace.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace kitties
{
namespace
{

class MarketplaceTests : public DBTest
{

protected:

  TestRandomness rnd;
  IdAllocator ids;
  OwnershipLedger ownership;
  MarketplaceLedger market;

  MarketplaceTests ()
    : ids(db), ownership(db, ids, rnd), market(db, ownership)
  {}

  /**
   * Expects that the given asset is listed at the given price.
   */
  void
  ExpectListing (const AssetId id, const Balance expected)
  {
    Balance price;
    ASSERT_TRUE (market.GetPrice (id, price));
    EXPECT_EQ (price, expected);
  }

  /**
   * Expects that the given asset is not listed.
   */
  void
  ExpectNoListing (const AssetId id)
  {
    Balance price;
    EXPECT_FALSE (market.GetPrice (id, price));
  }

  /**
   * Expects that the account has the given balance.
   */
  void
  ExpectBalance (const std::string& account, const Balance expected)
  {
    Balance balance;
    ASSERT_TRUE (market.GetBalance (account, balance));
    EXPECT_EQ (balance, expected);
  }

  /**
   * Expects that the account has no balance entry.
   */
  void
  ExpectNoBalance (const std::string& account)
  {
    Balance balance;
    EXPECT_FALSE (market.GetBalance (account, balance));
  }

};

/* ************************************************************************** */

TEST_F (MarketplaceTests, ListingsAndBalances)
{
  ExpectNoListing (1);
  ExpectNoBalance ("domob");

  market.SetListing (1, 50);
  market.SetBalance ("domob", 100);
  ExpectListing (1, 50);
  ExpectBalance ("domob", 100);

  market.SetListing (1, 0);
  market.SetBalance ("domob", 0);
  ExpectListing (1, 0);
  ExpectBalance ("domob", 0);
}

/* ************************************************************************** */

TEST_F (MarketplaceTests, SetPriceUpdatesListing)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);

  Balance oldPrice;
  ASSERT_EQ (market.SetPrice ("domob", 1, 70, oldPrice), ErrorCode::OK);
  EXPECT_EQ (oldPrice, 50);
  ExpectListing (1, 70);

  ASSERT_EQ (market.SetPrice ("domob", 1, 0, oldPrice), ErrorCode::OK);
  EXPECT_EQ (oldPrice, 70);
  ExpectListing (1, 0);
}

TEST_F (MarketplaceTests, SetPriceNotOwned)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetListing (2, 50);

  Balance oldPrice;
  EXPECT_EQ (market.SetPrice ("andy", 1, 70, oldPrice),
             ErrorCode::INVALID_ASSET_ID);
  EXPECT_EQ (market.SetPrice ("domob", 2, 70, oldPrice),
             ErrorCode::INVALID_ASSET_ID);
  ExpectListing (1, 50);
  ExpectListing (2, 50);
}

TEST_F (MarketplaceTests, SetPriceWithoutListing)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));

  Balance oldPrice;
  EXPECT_EQ (market.SetPrice ("domob", 1, 70, oldPrice),
             ErrorCode::NOT_FOR_SALE);
  ExpectNoListing (1);
}

/* ************************************************************************** */

TEST_F (MarketplaceTests, ExchangeWithSelf)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetBalance ("domob", 100);

  Balance price;
  EXPECT_EQ (market.Exchange ("domob", "domob", 1, price),
             ErrorCode::SELF_EXCHANGE);
  ExpectListing (1, 50);
  ExpectBalance ("domob", 100);
  EXPECT_TRUE (ownership.Exists ("domob", 1));
}

TEST_F (MarketplaceTests, ExchangeNotListed)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetBalance ("domob", 100);
  market.SetBalance ("andy", 100);

  Balance price;
  EXPECT_EQ (market.Exchange ("domob", "andy", 1, price),
             ErrorCode::NOT_FOR_SALE);
  ExpectBalance ("domob", 100);
  ExpectBalance ("andy", 100);
  EXPECT_TRUE (ownership.Exists ("domob", 1));
}

TEST_F (MarketplaceTests, ExchangeCounterpartyWithoutBalance)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetBalance ("domob", 100);

  Balance price;
  EXPECT_EQ (market.Exchange ("domob", "andy", 1, price),
             ErrorCode::NOT_FOR_SALE);

  ExpectNoListing (1);
  ExpectBalance ("domob", 100);
  ExpectNoBalance ("andy");
  EXPECT_TRUE (ownership.Exists ("domob", 1));
}

TEST_F (MarketplaceTests, ExchangeInsufficientBalance)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetBalance ("domob", 1'000);
  market.SetBalance ("andy", 50);

  Balance price;
  EXPECT_EQ (market.Exchange ("domob", "andy", 1, price),
             ErrorCode::INSUFFICIENT_BALANCE);

  ExpectNoListing (1);
  ExpectBalance ("domob", 1'000);
  ExpectBalance ("andy", 50);
  EXPECT_TRUE (ownership.Exists ("domob", 1));

  /* The listing is gone, so a retry fails differently.  */
  market.SetBalance ("andy", 51);
  EXPECT_EQ (market.Exchange ("domob", "andy", 1, price),
             ErrorCode::NOT_FOR_SALE);
}

TEST_F (MarketplaceTests, ExchangeSuccess)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  InsertAsset (2, "domob", GenomeWithFirstByte (2));
  market.SetListing (1, 50);
  market.SetBalance ("domob", 100);
  market.SetBalance ("andy", 51);

  Balance price;
  ASSERT_EQ (market.Exchange ("domob", "andy", 1, price), ErrorCode::OK);
  EXPECT_EQ (price, 50);

  ExpectNoListing (1);
  ExpectBalance ("domob", 50);
  ExpectBalance ("andy", 101);

  /* The asset is removed from the initiator, but nobody gets it.  */
  EXPECT_FALSE (ownership.Exists ("domob", 1));
  EXPECT_FALSE (ownership.Exists ("andy", 1));
  std::string owner;
  EXPECT_FALSE (ownership.GetOwner (1, owner));
  EXPECT_TRUE (ownership.Exists ("domob", 2));
}

TEST_F (MarketplaceTests, ExchangeInitiatorWithoutBalance)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetBalance ("andy", 100);

  Balance price;
  ASSERT_EQ (market.Exchange ("domob", "andy", 1, price), ErrorCode::OK);

  ExpectNoBalance ("domob");
  ExpectBalance ("andy", 150);
  EXPECT_FALSE (ownership.Exists ("domob", 1));
}

TEST_F (MarketplaceTests, ExchangeInitiatorUnderflow)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetBalance ("domob", 49);
  market.SetBalance ("andy", 100);

  Balance price;
  EXPECT_EQ (market.Exchange ("domob", "andy", 1, price),
             ErrorCode::INSUFFICIENT_BALANCE);

  ExpectNoListing (1);
  ExpectBalance ("domob", 49);
  ExpectBalance ("andy", 100);
  EXPECT_TRUE (ownership.Exists ("domob", 1));
}

TEST_F (MarketplaceTests, ExchangeInitiatorExactBalance)
{
  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetBalance ("domob", 50);
  market.SetBalance ("andy", 100);

  Balance price;
  ASSERT_EQ (market.Exchange ("domob", "andy", 1, price), ErrorCode::OK);
  ExpectBalance ("domob", 0);
  ExpectBalance ("andy", 150);
}

TEST_F (MarketplaceTests, ExchangeCounterpartyOverflow)
{
  constexpr Balance maxBalance = std::numeric_limits<Balance>::max ();

  InsertAsset (1, "domob", GenomeWithFirstByte (1));
  market.SetListing (1, 1);
  market.SetBalance ("domob", 100);
  market.SetBalance ("andy", maxBalance);

  Balance price;
  EXPECT_EQ (market.Exchange ("domob", "andy", 1, price),
             ErrorCode::BALANCE_OVERFLOW);

  ExpectNoListing (1);
  ExpectBalance ("domob", 100);
  ExpectBalance ("andy", maxBalance);
  EXPECT_TRUE (ownership.Exists ("domob", 1));
}

TEST_F (MarketplaceTests, ExchangeAssetNotOwnedByInitiator)
{
  InsertAsset (1, "bob", GenomeWithFirstByte (1));
  market.SetListing (1, 50);
  market.SetListing (2, 50);
  market.SetBalance ("domob", 100);
  market.SetBalance ("andy", 100);

  Balance price;
  EXPECT_EQ (market.Exchange ("domob", "andy", 1, price),
             ErrorCode::INVALID_ASSET_ID);
  EXPECT_EQ (market.Exchange ("domob", "andy", 2, price),
             ErrorCode::INVALID_ASSET_ID);

  ExpectNoListing (1);
  ExpectNoListing (2);
  ExpectBalance ("domob", 100);
  ExpectBalance ("andy", 100);
  EXPECT_TRUE (ownership.Exists ("bob", 1));
}

} // anonymous namespace
} // namespace kitties
