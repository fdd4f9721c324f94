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

#include "private/idallocator.hpp"

#include <glog/logging.h>

#include <limits>

namespace kitties
{

constexpr const char* IdAllocator::COUNTER;

AssetId
IdAllocator::Peek () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `value`
      FROM `counters`
      WHERE `name` = ?1
  )");
  stmt.Bind (1, std::string (COUNTER));

  if (!stmt.Step ())
    return 0;

  const auto val = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  CHECK_GE (val, 0);
  CHECK_LE (val, std::numeric_limits<AssetId>::max ());

  return static_cast<AssetId> (val);
}

ErrorCode
IdAllocator::NextId (AssetId& id)
{
  const AssetId current = Peek ();
  if (current == std::numeric_limits<AssetId>::max ())
    return ErrorCode::ID_OVERFLOW;

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `counters`
      (`name`, `value`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, std::string (COUNTER));
  stmt.Bind (2, static_cast<int64_t> (current) + 1);
  stmt.Execute ();

  VLOG (1) << "Allocated asset ID " << current;

  id = current;
  return ErrorCode::OK;
}

} // namespace kitties
