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

#ifndef KITTIES_OWNERSHIP_HPP
#define KITTIES_OWNERSHIP_HPP

#include "private/idallocator.hpp"
#include "randomness.hpp"
#include "types.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <string>

namespace kitties
{

/**
 * The ledger of all assets and who owns them.  Each asset ID is held by
 * at most one owner at any time.
 */
class OwnershipLedger
{

private:

  /** The database holding the assets.  */
  xaya::SQLiteDatabase& db;

  /** Allocator for new IDs.  */
  IdAllocator& ids;

  /** Randomness for genomes and breeding.  */
  RandomnessSource& rnd;

  /**
   * Inserts a new asset into the database.  The ID must not exist yet.
   */
  void Insert (const std::string& owner, AssetId id, const Genome& genome);

public:

  explicit OwnershipLedger (xaya::SQLiteDatabase& d, IdAllocator& i,
                            RandomnessSource& r)
    : db(d), ids(i), rnd(r)
  {}

  OwnershipLedger () = delete;
  OwnershipLedger (const OwnershipLedger&) = delete;
  void operator= (const OwnershipLedger&) = delete;

  /**
   * Mints a new asset with random genome for the given owner.
   */
  ErrorCode Create (const std::string& owner, AssetId& id, Genome& genome);

  /**
   * Breeds two assets of the given owner, which must have different
   * genders.  The child's genome is combined from both parents with
   * a random selector, and it is given to the same owner.
   */
  ErrorCode Breed (const std::string& owner, AssetId parentA, AssetId parentB,
                   AssetId& id, Genome& genome);

  /**
   * Transfers an asset between owners.  A transfer to oneself only
   * verifies the asset is owned.
   */
  ErrorCode Transfer (const std::string& from, const std::string& to,
                      AssetId id);

  /**
   * Returns true if the asset with the given ID exists and is owned
   * by the given account.
   */
  bool Exists (const std::string& owner, AssetId id) const;

  /**
   * Looks up an asset owned by the given account.  Returns false
   * if it does not exist (or has a different owner).
   */
  bool Get (const std::string& owner, AssetId id, Genome& genome) const;

  /**
   * Looks up the owner of an asset.  Returns false if it does not exist.
   */
  bool GetOwner (AssetId id, std::string& owner) const;

  /**
   * Deletes an asset if it is owned by the given account.  Returns false
   * (and does nothing) if the asset is not owned by them.
   */
  bool Remove (const std::string& owner, AssetId id);

};

} // namespace kitties

#endif // KITTIES_OWNERSHIP_HPP
