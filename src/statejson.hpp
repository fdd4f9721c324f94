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

#ifndef KITTIES_STATEJSON_HPP
#define KITTIES_STATEJSON_HPP

#include "types.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <string>

namespace kitties
{

/**
 * Read-only queries of the game state that return JSON, as used for
 * the full game state and the custom RPC methods.
 */
class StateJson
{

private:

  /** The database to read from.  */
  const xaya::SQLiteDatabase& db;

  /**
   * Converts an asset row (id, owner, genome) of a query result to JSON.
   */
  static Json::Value AssetRowToJson (xaya::SQLiteDatabase::Statement& stmt);

public:

  explicit StateJson (const xaya::SQLiteDatabase& d)
    : db(d)
  {}

  StateJson () = delete;
  StateJson (const StateJson&) = delete;
  void operator= (const StateJson&) = delete;

  /**
   * Returns the full game state.
   */
  Json::Value FullState () const;

  /**
   * Returns the data for a single asset, or null if it does not exist.
   */
  Json::Value GetAsset (AssetId id) const;

  /**
   * Returns all assets of an owner as array, ordered by ID.
   */
  Json::Value GetAssetsOf (const std::string& owner) const;

  /**
   * Returns the listing price of an asset, or null if it is not listed.
   */
  Json::Value GetListing (AssetId id) const;

  /**
   * Returns the balance of an account, or null if it has none.
   */
  Json::Value GetBalance (const std::string& account) const;

};

} // namespace kitties

#endif // KITTIES_STATEJSON_HPP
