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

#include "schema.hpp"

namespace kitties
{

void
SetupSchema (xaya::SQLiteDatabase& db)
{
  /* Each asset is stored once, keyed by its ID.  This makes it impossible
     to have more than one owner per asset.  The genome is stored as
     hex string.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `assets` (
      `id` INTEGER NOT NULL PRIMARY KEY,
      `owner` TEXT NOT NULL,
      `genome` TEXT NOT NULL
    );
    CREATE INDEX IF NOT EXISTS `assets_by_owner`
      ON `assets` (`owner`, `id`);
  )");

  /* Named counters.  A missing row means the counter is zero.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `counters` (
      `name` TEXT NOT NULL PRIMARY KEY,
      `value` INTEGER NOT NULL
    )
  )");

  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `listings` (
      `id` INTEGER NOT NULL PRIMARY KEY,
      `price` INTEGER NOT NULL
    )
  )");

  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `balances` (
      `account` TEXT NOT NULL PRIMARY KEY,
      `amount` INTEGER NOT NULL
    )
  )");
}

} // namespace kitties
