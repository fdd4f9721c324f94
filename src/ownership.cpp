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

#include "private/ownership.hpp"

#include "genome.hpp"

#include <glog/logging.h>

namespace kitties
{

void
OwnershipLedger::Insert (const std::string& owner, const AssetId id,
                         const Genome& genome)
{
  auto stmt = db.Prepare (R"(
    INSERT INTO `assets`
      (`id`, `owner`, `genome`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Bind (2, owner);
  stmt.Bind (3, GenomeToHex (genome));
  stmt.Execute ();
}

ErrorCode
OwnershipLedger::Create (const std::string& owner, AssetId& id,
                         Genome& genome)
{
  const ErrorCode err = ids.NextId (id);
  if (err != ErrorCode::OK)
    return err;

  genome = rnd.GetValue (owner);
  Insert (owner, id, genome);

  return ErrorCode::OK;
}

ErrorCode
OwnershipLedger::Breed (const std::string& owner,
                        const AssetId parentA, const AssetId parentB,
                        AssetId& id, Genome& genome)
{
  Genome dnaA, dnaB;
  if (!Get (owner, parentA, dnaA) || !Get (owner, parentB, dnaB))
    return ErrorCode::INVALID_ASSET_ID;

  if (GetGender (dnaA) == GetGender (dnaB))
    return ErrorCode::SAME_GENDER;

  const ErrorCode err = ids.NextId (id);
  if (err != ErrorCode::OK)
    return err;

  const Genome selector = rnd.GetValue (owner);
  genome = CombineDna (dnaA, dnaB, selector);
  Insert (owner, id, genome);

  return ErrorCode::OK;
}

ErrorCode
OwnershipLedger::Transfer (const std::string& from, const std::string& to,
                           const AssetId id)
{
  if (!Exists (from, id))
    return ErrorCode::INVALID_ASSET_ID;

  if (from == to)
    return ErrorCode::OK;

  /* The owner is changed in place, so there is never a state in which
     the asset is held by both or neither.  */
  auto stmt = db.Prepare (R"(
    UPDATE `assets`
      SET `owner` = ?2
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Bind (2, to);
  stmt.Execute ();

  return ErrorCode::OK;
}

bool
OwnershipLedger::Exists (const std::string& owner, const AssetId id) const
{
  Genome dummy;
  return Get (owner, id, dummy);
}

bool
OwnershipLedger::Get (const std::string& owner, const AssetId id,
                      Genome& genome) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `genome`
      FROM `assets`
      WHERE `id` = ?1 AND `owner` = ?2
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Bind (2, owner);

  if (!stmt.Step ())
    return false;

  CHECK (GenomeFromHex (stmt.Get<std::string> (0), genome))
      << "Invalid genome stored for asset " << id;
  CHECK (!stmt.Step ());

  return true;
}

bool
OwnershipLedger::GetOwner (const AssetId id, std::string& owner) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `owner`
      FROM `assets`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));

  if (!stmt.Step ())
    return false;

  owner = stmt.Get<std::string> (0);
  CHECK (!stmt.Step ());

  return true;
}

bool
OwnershipLedger::Remove (const std::string& owner, const AssetId id)
{
  if (!Exists (owner, id))
    return false;

  auto stmt = db.Prepare (R"(
    DELETE FROM `assets`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Execute ();

  return true;
}

} // namespace kitties
