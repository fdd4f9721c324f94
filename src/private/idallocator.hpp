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

#ifndef KITTIES_IDALLOCATOR_HPP
#define KITTIES_IDALLOCATOR_HPP

#include "types.hpp"

#include <xayagame/sqlitestorage.hpp>

namespace kitties
{

/**
 * Source of new asset IDs.  The next ID is stored in the database and
 * increments by one with each allocation.  IDs are never reused.
 */
class IdAllocator
{

private:

  /** The database holding the counter.  */
  xaya::SQLiteDatabase& db;

public:

  /** Name of the counter row in the database.  */
  static constexpr const char* COUNTER = "assetid";

  explicit IdAllocator (xaya::SQLiteDatabase& d)
    : db(d)
  {}

  IdAllocator () = delete;
  IdAllocator (const IdAllocator&) = delete;
  void operator= (const IdAllocator&) = delete;

  /**
   * Returns the ID that would be allocated next.
   */
  AssetId Peek () const;

  /**
   * Allocates the next ID.  Returns ID_OVERFLOW if the counter cannot be
   * incremented anymore, in which case nothing is changed.
   */
  ErrorCode NextId (AssetId& id);

};

} // namespace kitties

#endif // KITTIES_IDALLOCATOR_HPP
