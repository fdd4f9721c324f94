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

#ifndef KITTIES_GSP_GAME_HPP
#define KITTIES_GSP_GAME_HPP

#include "genesis.hpp"
#include "notifications.hpp"
#include "pending.hpp"
#include "statejson.hpp"

#include <xayagame/game.hpp>
#include <xayagame/sqlitegame.hpp>

#include <json/json.h>

#include <string>

namespace kitties
{

/**
 * SQLiteGame instance for the kitties GSP.  The game state are the
 * assets, the marketplace listings and the balances.  Each move is one
 * call into the ledgers.
 */
class KittiesGame : public xaya::SQLiteGame
{

private:

  /** Initial data for the marketplace.  */
  const Genesis genesis;

  /** Where notifications about processed moves go.  */
  NotificationSink& sink;

protected:

  void SetupSchema (xaya::SQLiteDatabase& db) override;
  void GetInitialStateBlock (unsigned& height,
                             std::string& hashHex) const override;

  void InitialiseState (xaya::SQLiteDatabase& db) override;
  void UpdateState (xaya::SQLiteDatabase& db,
                    const Json::Value& blockData) override;

  Json::Value GetStateAsJson (const xaya::SQLiteDatabase& db) override;

public:

  explicit KittiesGame (const Genesis& g, NotificationSink& s)
    : genesis(g), sink(s)
  {}

  KittiesGame () = delete;
  KittiesGame (const KittiesGame&) = delete;
  void operator= (const KittiesGame&) = delete;

  /**
   * Runs a read-only query against the current state, using a
   * StateJson instance.  The query's result is returned as "data",
   * together with the usual block hash and height.
   */
  template <typename Fcn>
    Json::Value
    Query (const xaya::Game& g, const Fcn& f)
  {
    return GetCustomStateData (g, "data",
        [&f] (const xaya::SQLiteDatabase& db) -> Json::Value
        {
          const StateJson state(db);
          return f (state);
        });
  }

};

} // namespace kitties

#endif // KITTIES_GSP_GAME_HPP
