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

#ifndef KITTIES_MARKETPLACE_HPP
#define KITTIES_MARKETPLACE_HPP

#include "private/ownership.hpp"
#include "types.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <string>

namespace kitties
{

/**
 * The marketplace, consisting of price listings for assets and the
 * internal balances of accounts.
 *
 * There is no operation that creates a listing or a balance entry from
 * scratch; both are only ever set up through the genesis data.  SetPrice
 * can only change an existing listing.
 */
class MarketplaceLedger
{

private:

  /** The database holding listings and balances.  */
  xaya::SQLiteDatabase& db;

  /** The asset ownership, needed to check and remove assets.  */
  OwnershipLedger& ownership;

  /**
   * Removes the listing of an asset and returns its price.  Returns false
   * if there is no listing.
   */
  bool TakeListing (AssetId id, Balance& price);

public:

  explicit MarketplaceLedger (xaya::SQLiteDatabase& d, OwnershipLedger& o)
    : db(d), ownership(o)
  {}

  MarketplaceLedger () = delete;
  MarketplaceLedger (const MarketplaceLedger&) = delete;
  void operator= (const MarketplaceLedger&) = delete;

  /**
   * Changes the price of an existing listing.  The caller must own
   * the asset.  On success, the previous price is returned in oldPrice.
   */
  ErrorCode SetPrice (const std::string& caller, AssetId id,
                      Balance newPrice, Balance& oldPrice);

  /**
   * Performs an exchange of the listed asset between the initiator
   * and counterparty.
   *
   * The listing is consumed as soon as it has been read, even if the
   * exchange fails later on.  The balance checked is the one of the
   * counterparty, which must be strictly larger than the price.  On success,
   * the price is debited from the initiator and credited to the
   * counterparty (for those that have a balance entry), and the asset
   * is removed from the initiator without being given to anyone.
   *
   * All balance changes are checked for underflow and overflow before
   * anything is changed.  The price of the consumed listing is returned
   * in price on success.
   */
  ErrorCode Exchange (const std::string& initiator,
                      const std::string& counterparty,
                      AssetId id, Balance& price);

  /**
   * Looks up the listing price of an asset.  Returns false if it is
   * not listed.
   */
  bool GetPrice (AssetId id, Balance& price) const;

  /**
   * Looks up the balance of an account.  Returns false if the account
   * has no balance entry.
   */
  bool GetBalance (const std::string& account, Balance& balance) const;

  /**
   * Stores a listing for the given asset, replacing any previous one.
   * This is used for initialising the state.
   */
  void SetListing (AssetId id, Balance price);

  /**
   * Stores the balance for an account.  This is used for initialising
   * the state and for the exchange updates.
   */
  void SetBalance (const std::string& account, Balance balance);

};

} // namespace kitties

#endif // KITTIES_MARKETPLACE_HPP
