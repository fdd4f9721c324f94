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

#ifndef KITTIES_JSONPARSE_HPP
#define KITTIES_JSONPARSE_HPP

#include "types.hpp"

#include <json/json.h>

#include <string>

namespace kitties
{

/**
 * Parses an asset ID from a JSON value.  It has to be an unsigned integer
 * in range.
 */
bool AssetIdFromJson (const Json::Value& val, AssetId& id);

/**
 * Parses an asset ID from its decimal string form, as used for keys
 * of JSON objects.
 */
bool AssetIdFromString (const std::string& str, AssetId& id);

/**
 * Parses a balance (or price) from JSON.  It has to be a non-negative
 * integer that fits into Balance.
 */
bool BalanceFromJson (const Json::Value& val, Balance& amount);

/**
 * Parses an account name from JSON.  It has to be a non-empty string.
 */
bool AccountFromJson (const Json::Value& val, std::string& account);

} // namespace kitties

#endif // KITTIES_JSONPARSE_HPP
