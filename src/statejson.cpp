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

#include "statejson.hpp"

#include "genome.hpp"
#include "private/idallocator.hpp"

#include <glog/logging.h>

namespace kitties
{

Json::Value
StateJson::AssetRowToJson (xaya::SQLiteDatabase::Statement& stmt)
{
  const auto id = stmt.Get<int64_t> (0);
  Genome genome;
  CHECK (GenomeFromHex (stmt.Get<std::string> (2), genome))
      << "Invalid genome stored for asset " << id;

  Json::Value res(Json::objectValue);
  res["id"] = static_cast<Json::Int64> (id);
  res["owner"] = stmt.Get<std::string> (1);
  res["genome"] = GenomeToHex (genome);
  res["gender"] = GenderToString (GetGender (genome));

  return res;
}

Json::Value
StateJson::FullState () const
{
  Json::Value res(Json::objectValue);

  {
    auto stmt = db.PrepareRo (R"(
      SELECT `value`
        FROM `counters`
        WHERE `name` = ?1
    )");
    stmt.Bind (1, std::string (IdAllocator::COUNTER));
    Json::Int64 next = 0;
    if (stmt.Step ())
      next = stmt.Get<int64_t> (0);
    res["nextid"] = next;
  }

  {
    auto stmt = db.PrepareRo (R"(
      SELECT `id`, `owner`, `genome`
        FROM `assets`
        ORDER BY `id`
    )");
    Json::Value assets(Json::arrayValue);
    while (stmt.Step ())
      assets.append (AssetRowToJson (stmt));
    res["assets"] = assets;
  }

  {
    auto stmt = db.PrepareRo (R"(
      SELECT `id`, `price`
        FROM `listings`
        ORDER BY `id`
    )");
    Json::Value listings(Json::objectValue);
    while (stmt.Step ())
      {
        const auto id = stmt.Get<int64_t> (0);
        listings[std::to_string (id)]
            = static_cast<Json::Int64> (stmt.Get<int64_t> (1));
      }
    res["listings"] = listings;
  }

  {
    auto stmt = db.PrepareRo (R"(
      SELECT `account`, `amount`
        FROM `balances`
        ORDER BY `account`
    )");
    Json::Value balances(Json::objectValue);
    while (stmt.Step ())
      balances[stmt.Get<std::string> (0)]
          = static_cast<Json::Int64> (stmt.Get<int64_t> (1));
    res["balances"] = balances;
  }

  return res;
}

Json::Value
StateJson::GetAsset (const AssetId id) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`, `owner`, `genome`
      FROM `assets`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));

  if (!stmt.Step ())
    return Json::Value ();

  const Json::Value res = AssetRowToJson (stmt);
  CHECK (!stmt.Step ());

  return res;
}

Json::Value
StateJson::GetAssetsOf (const std::string& owner) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`, `owner`, `genome`
      FROM `assets`
      WHERE `owner` = ?1
      ORDER BY `id`
  )");
  stmt.Bind (1, owner);

  Json::Value res(Json::arrayValue);
  while (stmt.Step ())
    res.append (AssetRowToJson (stmt));

  return res;
}

Json::Value
StateJson::GetListing (const AssetId id) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `price`
      FROM `listings`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));

  if (!stmt.Step ())
    return Json::Value ();

  const Json::Value res = static_cast<Json::Int64> (stmt.Get<int64_t> (0));
  CHECK (!stmt.Step ());

  return res;
}

Json::Value
StateJson::GetBalance (const std::string& account) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `amount`
      FROM `balances`
      WHERE `account` = ?1
  )");
  stmt.Bind (1, account);

  if (!stmt.Step ())
    return Json::Value ();

  const Json::Value res = static_cast<Json::Int64> (stmt.Get<int64_t> (0));
  CHECK (!stmt.Step ());

  return res;
}

} // namespace kitties
