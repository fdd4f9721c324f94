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

#include "genesis.hpp"

#include "private/idallocator.hpp"
#include "private/jsonparse.hpp"
#include "private/marketplace.hpp"
#include "private/ownership.hpp"

#include <glog/logging.h>

#include <fstream>

namespace kitties
{

namespace
{

/**
 * Randomness source that must not be used.  The genesis data does not
 * create any assets, so the ledgers set up for it never need randomness.
 */
class NoRandomness : public RandomnessSource
{

public:

  Genome
  GetValue (const std::string& caller) override
  {
    LOG (FATAL) << "Randomness requested during genesis";
  }

};

} // anonymous namespace

bool
Genesis::Parse (const Json::Value& val)
{
  balances.clear ();
  listings.clear ();

  if (!val.isObject ())
    return false;

  for (const auto& key : val.getMemberNames ())
    if (key != "balances" && key != "listings")
      {
        LOG (WARNING) << "Unknown field in genesis data: " << key;
        return false;
      }

  std::map<std::string, Balance> newBalances;
  if (val.isMember ("balances"))
    {
      const auto& obj = val["balances"];
      if (!obj.isObject ())
        return false;

      for (auto it = obj.begin (); it != obj.end (); ++it)
        {
          const std::string account = it.name ();
          Balance amount;
          if (account.empty () || !BalanceFromJson (*it, amount))
            {
              LOG (WARNING) << "Invalid genesis balance for '" << account << "'";
              return false;
            }
          newBalances.emplace (account, amount);
        }
    }

  std::map<AssetId, Balance> newListings;
  if (val.isMember ("listings"))
    {
      const auto& obj = val["listings"];
      if (!obj.isObject ())
        return false;

      for (auto it = obj.begin (); it != obj.end (); ++it)
        {
          AssetId id;
          Balance price;
          if (!AssetIdFromString (it.name (), id)
                || !BalanceFromJson (*it, price))
            {
              LOG (WARNING) << "Invalid genesis listing: " << it.name ();
              return false;
            }
          newListings.emplace (id, price);
        }
    }

  balances = std::move (newBalances);
  listings = std::move (newListings);

  return true;
}

bool
Genesis::ReadFile (const std::string& path)
{
  std::ifstream in(path);
  if (!in)
    {
      LOG (WARNING) << "Could not open genesis file " << path;
      return false;
    }

  Json::Value val;
  Json::CharReaderBuilder rbuilder;
  std::string errs;
  if (!Json::parseFromStream (rbuilder, in, &val, &errs))
    {
      LOG (WARNING) << "Failed to parse genesis file " << path << ": " << errs;
      return false;
    }

  return Parse (val);
}

void
Genesis::Apply (xaya::SQLiteDatabase& db) const
{
  NoRandomness rnd;
  IdAllocator ids(db);
  OwnershipLedger ownership(db, ids, rnd);
  MarketplaceLedger market(db, ownership);

  for (const auto& entry : balances)
    market.SetBalance (entry.first, entry.second);
  for (const auto& entry : listings)
    market.SetListing (entry.first, entry.second);

  LOG (INFO)
      << "Initialised " << balances.size () << " balances and "
      << listings.size () << " listings from genesis data";
}

} // namespace kitties
