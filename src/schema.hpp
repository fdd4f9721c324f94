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

#ifndef KITTIES_SCHEMA_HPP
#define KITTIES_SCHEMA_HPP

#include <xayagame/sqlitestorage.hpp>

namespace kitties
{

/**
 * Sets up the database schema (if it does not yet exist) for all the
 * tables that hold the game state.
 */
void SetupSchema (xaya::SQLiteDatabase& db);

} // namespace kitties

#endif // KITTIES_SCHEMA_HPP
