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

#include "game.hpp"

#include "moves.hpp"
#include "randomness.hpp"
#include "schema.hpp"

#include <xayautil/uint256.hpp>

#include <glog/logging.h>

namespace kitties
{

void
KittiesGame::SetupSchema (xaya::SQLiteDatabase& db)
{
  kitties::SetupSchema (db);
}

void
KittiesGame::GetInitialStateBlock (unsigned& height,
                                   std::string& hashHex) const
{
  const xaya::Chain chain = GetChain ();
  switch (chain)
    {
    case xaya::Chain::MAIN:
      height = 2'350'000;
      hashHex
          = "c66f30db579e0aad429648f4cb7dd67648d007ae4313f265a406b88f043b3d93";
      break;

    case xaya::Chain::TEST:
      height = 109'000;
      hashHex
          = "ebc9c179a6a9700777851d2b5452fa1c4b14aaa194a646e2a37cec8ca410e62a";
      break;

    case xaya::Chain::REGTEST:
      height = 0;
      hashHex
          = "6f750b36d22f1dc3d0a6e483af45301022646dfc3b3ba2187865f5a7d6d83ab1";
      break;

    default:
      LOG (FATAL) << "Invalid chain value: " << static_cast<int> (chain);
    }
}

void
KittiesGame::InitialiseState (xaya::SQLiteDatabase& db)
{
  /* The asset counter starts at zero implicitly (with no row in the
     counters table), and there are no assets.  Only the marketplace
     can have initial data.  */
  genesis.Apply (db);
}

void
KittiesGame::UpdateState (xaya::SQLiteDatabase& db,
                          const Json::Value& blockData)
{
  const auto& blk = blockData["block"];
  const unsigned height = blk["height"].asUInt ();

  xaya::uint256 seed;
  CHECK (blk["rngseed"].isString ()) << "Block data without rngseed";
  CHECK (seed.FromHex (blk["rngseed"].asString ()))
      << "Invalid rngseed: " << blk["rngseed"];

  BlockRandomness rnd(seed);
  MoveProcessor proc(db, rnd, sink);
  proc.ProcessAll (blockData["moves"], height);
}

Json::Value
KittiesGame::GetStateAsJson (const xaya::SQLiteDatabase& db)
{
  const StateJson state(db);
  return state.FullState ();
}

} // namespace kitties
