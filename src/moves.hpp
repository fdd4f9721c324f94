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

#ifndef KITTIES_MOVES_HPP
#define KITTIES_MOVES_HPP

#include "notifications.hpp"
#include "private/idallocator.hpp"
#include "private/marketplace.hpp"
#include "private/ownership.hpp"
#include "randomness.hpp"
#include "types.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <string>

namespace kitties
{

/**
 * A single parsed move, i.e. one call into the ledgers.
 */
struct Move
{

  enum class Type
  {
    CREATE,
    BREED,
    TRANSFER,
    SET_PRICE,
    EXCHANGE,
  };

  /** The type of action.  */
  Type type;

  /** The name that sent the move, i.e. the caller.  */
  std::string name;

  /** The move's txid, if known.  */
  std::string txid;

  /**
   * The asset this refers to.  For breeding, this is the first parent.
   */
  AssetId id = 0;

  /** For breeding, the second parent.  */
  AssetId other = 0;

  /** The recipient of a transfer or the counterparty of an exchange.  */
  std::string account;

  /** The new price for SET_PRICE.  */
  Balance price = 0;

};

/**
 * Processor for the moves of a block.  It parses each move and executes
 * it on the ledgers, one after the other in block order.  Invalid moves
 * are logged and ignored.
 *
 * The format of the moves is a JSON object with exactly one action:
 *
 *  {"c": {}}
 *  {"b": {"a": 1, "b": 2}}
 *  {"t": {"id": 5, "to": "domob"}}
 *  {"p": {"id": 5, "price": 100}}
 *  {"x": {"id": 5, "with": "andy"}}
 */
class MoveProcessor
{

private:

  /** Randomness for the moves.  */
  RandomnessSource& rnd;

  /** Where notifications about successful moves go.  */
  NotificationSink& sink;

  IdAllocator ids;
  OwnershipLedger ownership;
  MarketplaceLedger market;

  /**
   * Parses the action part of a move (i.e. the "move" field in the
   * block data) into the move struct.
   */
  static bool ParseAction (const Json::Value& action, Move& mv);

  /**
   * Executes a parsed move.  Returns the result of the ledger operation.
   * On success, a notification is sent.
   */
  ErrorCode Execute (const Move& mv, unsigned height);

public:

  explicit MoveProcessor (xaya::SQLiteDatabase& db, RandomnessSource& r,
                          NotificationSink& s)
    : rnd(r), sink(s),
      ids(db), ownership(db, ids, rnd), market(db, ownership)
  {}

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Parses a move entry from the block data (including name and the actual
   * move value).  Returns false if the move is invalid.
   */
  static bool ParseMove (const Json::Value& entry, Move& mv);

  /**
   * Converts a parsed move into JSON (for pending moves).
   */
  static Json::Value MoveToJson (const Move& mv);

  /**
   * Processes all moves of a block.  The sequence index used for the
   * randomness of each move is its position in the array.
   */
  void ProcessAll (const Json::Value& moves, unsigned height);

};

} // namespace kitties

#endif // KITTIES_MOVES_HPP
