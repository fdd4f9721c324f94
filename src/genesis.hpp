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

#ifndef KITTIES_GENESIS_HPP
#define KITTIES_GENESIS_HPP

#include "types.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <map>
#include <string>

namespace kitties
{

/**
 * Initial data for the marketplace, which is put into the game state
 * when it is initialised.  Balances and listings cannot be created through
 * moves, so this is the only way to set them up.
 *
 * The data is given in JSON form like this:
 *
 *  {
 *    "balances": {"domob": 1000, "andy": 50},
 *    "listings": {"0": 100, "5": 20}
 *  }
 *
 * Both fields are optional.  Listings are keyed by asset ID and may refer
 * to assets that do not exist yet.
 */
class Genesis
{

private:

  /** Initial balances by account.  */
  std::map<std::string, Balance> balances;

  /** Initial listings by asset ID.  */
  std::map<AssetId, Balance> listings;

public:

  Genesis () = default;

  Genesis (const Genesis&) = default;
  Genesis& operator= (const Genesis&) = default;

  /**
   * Parses the genesis data from JSON.  Returns false if the format is
   * invalid, in which case the instance is left empty.
   */
  bool Parse (const Json::Value& val);

  /**
   * Reads and parses genesis data from a JSON file.  Returns false if the
   * file cannot be read or the data is invalid.
   */
  bool ReadFile (const std::string& path);

  /**
   * Writes the genesis data into a freshly set-up database.
   */
  void Apply (xaya::SQLiteDatabase& db) const;

  const std::map<std::string, Balance>&
  GetBalances () const
  {
    return balances;
  }

  const std::map<AssetId, Balance>&
  GetListings () const
  {
    return listings;
  }

};

} // namespace kitties

#endif // KITTIES_GENESIS_HPP
