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

#include "pending.hpp"

#include "moves.hpp"

#include <glog/logging.h>

namespace kitties
{

void
PendingMoves::Clear ()
{
  pending = Json::Value (Json::objectValue);
}

Json::Value
PendingMoves::ToJson () const
{
  return pending;
}

void
PendingMoves::AddPendingMove (const Json::Value& mv)
{
  Move parsed;
  if (!MoveProcessor::ParseMove (mv, parsed))
    {
      LOG (WARNING) << "Invalid pending move: " << mv;
      return;
    }

  const Json::Value cur = MoveProcessor::MoveToJson (parsed);

  if (!pending.isMember (parsed.name))
    pending[parsed.name] = Json::Value (Json::arrayValue);
  auto& arr = pending[parsed.name];
  CHECK (arr.isArray ());

  /* A move with known txid that is reported again is ignored.  */
  for (const auto& existing : arr)
    if (existing == cur && !parsed.txid.empty ())
      return;
  arr.append (cur);
}

} // namespace kitties
