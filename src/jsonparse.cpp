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

#include "private/jsonparse.hpp"

#include <limits>

namespace kitties
{

bool
AssetIdFromJson (const Json::Value& val, AssetId& id)
{
  if (!val.isUInt64 ())
    return false;

  const uint64_t raw = val.asUInt64 ();
  if (raw > std::numeric_limits<AssetId>::max ())
    return false;

  id = static_cast<AssetId> (raw);
  return true;
}

bool
AssetIdFromString (const std::string& str, AssetId& id)
{
  /* We do not allow leading zeros (except for "0" itself), so that
     each ID has a unique string representation.  */
  if (str.empty () || str.size () > 10)
    return false;
  if (str.size () > 1 && str[0] == '0')
    return false;

  uint64_t raw = 0;
  for (const char c : str)
    {
      if (c < '0' || c > '9')
        return false;
      raw = 10 * raw + (c - '0');
    }

  if (raw > std::numeric_limits<AssetId>::max ())
    return false;

  id = static_cast<AssetId> (raw);
  return true;
}

bool
BalanceFromJson (const Json::Value& val, Balance& amount)
{
  if (!val.isInt64 ())
    return false;

  const int64_t raw = val.asInt64 ();
  if (raw < 0)
    return false;

  amount = raw;
  return true;
}

bool
AccountFromJson (const Json::Value& val, std::string& account)
{
  if (!val.isString ())
    return false;

  account = val.asString ();
  return !account.empty ();
}

} // namespace kitties
