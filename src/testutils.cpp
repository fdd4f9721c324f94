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

#include "testutils.hpp"

#include "genome.hpp"
#include "private/idallocator.hpp"

#include <sqlite3.h>

#include <sstream>

namespace kitties
{

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

Genome
GenomeFrom (const std::string& hex)
{
  Genome res;
  CHECK (GenomeFromHex (hex, res)) << "Invalid genome hex: " << hex;
  return res;
}

Genome
GenomeWithFirstByte (const unsigned char first)
{
  Genome res;
  res.fill (0);
  res[0] = first;
  return res;
}

Genome
TestRandomness::GetValue (const std::string& caller)
{
  CHECK (!values.empty ()) << "No more random values queued";

  callers.push_back (caller);
  indices.push_back (GetSequenceIndex ());

  const Genome res = values.front ();
  values.pop_front ();
  return res;
}

DBTest::DBTest ()
  : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY)
{
  SetupSchema (db);
}

void
DBTest::InsertAsset (const AssetId id, const std::string& owner,
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

void
DBTest::SetNextId (const int64_t value)
{
  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `counters`
      (`name`, `value`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, std::string (IdAllocator::COUNTER));
  stmt.Bind (2, value);
  stmt.Execute ();
}

int
DBTest::CountRows (const std::string& table)
{
  auto stmt = db.PrepareRo ("SELECT COUNT(*) FROM `" + table + "`");
  CHECK (stmt.Step ());
  const int res = stmt.Get<int> (0);
  CHECK (!stmt.Step ());
  return res;
}

} // namespace kitties
