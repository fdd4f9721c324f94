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

#include "randomness.hpp"

#include <xayautil/hash.hpp>

#include <algorithm>

namespace kitties
{

namespace
{

/**
 * Encodes a 32-bit integer as four bytes in big-endian order.
 */
std::string
EncodeUint32 (const uint32_t val)
{
  std::string res(4, '\0');
  for (int i = 3; i >= 0; --i)
    res[3 - i] = static_cast<char> ((val >> (8 * i)) & 0xFF);
  return res;
}

} // anonymous namespace

Genome
BlockRandomness::GetValue (const std::string& caller)
{
  /* The caller name is prefixed by its length, so that the concatenation
     of name and index can never be ambiguous.  */
  const std::string seedBytes(reinterpret_cast<const char*> (seed.GetBlob ()),
                              xaya::uint256::NUM_BYTES);

  xaya::SHA256 hasher;
  hasher << seedBytes
         << EncodeUint32 (caller.size ()) << caller
         << EncodeUint32 (GetSequenceIndex ());
  const xaya::uint256 hash = hasher.Finalise ();

  Genome res;
  std::copy_n (hash.GetBlob (), res.size (), res.begin ());

  return res;
}

} // namespace kitties
