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

#include "genome.hpp"

#include <glog/logging.h>

namespace kitties
{

Gender
GetGender (const Genome& genome)
{
  if (genome[0] % 2 == 0)
    return Gender::MALE;
  return Gender::FEMALE;
}

Genome
CombineDna (const Genome& a, const Genome& b, const Genome& selector)
{
  Genome res;
  for (size_t i = 0; i < res.size (); ++i)
    res[i] = (~selector[i] & a[i]) | (selector[i] & b[i]);

  return res;
}

namespace
{

/**
 * Decodes a single hex digit.  Returns -1 if it is invalid.
 */
int
HexDigitValue (const char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // anonymous namespace

std::string
GenomeToHex (const Genome& genome)
{
  static const char* const DIGITS = "0123456789abcdef";

  std::string res;
  res.reserve (2 * genome.size ());
  for (const unsigned char b : genome)
    {
      res.push_back (DIGITS[b >> 4]);
      res.push_back (DIGITS[b & 0x0F]);
    }

  return res;
}

bool
GenomeFromHex (const std::string& hex, Genome& genome)
{
  if (hex.size () != 2 * genome.size ())
    return false;

  for (size_t i = 0; i < genome.size (); ++i)
    {
      const int hi = HexDigitValue (hex[2 * i]);
      const int lo = HexDigitValue (hex[2 * i + 1]);
      if (hi < 0 || lo < 0)
        return false;
      genome[i] = static_cast<unsigned char> ((hi << 4) | lo);
    }

  return true;
}

std::string
GenderToString (const Gender g)
{
  switch (g)
    {
    case Gender::MALE:
      return "male";
    case Gender::FEMALE:
      return "female";
    default:
      LOG (FATAL) << "Invalid gender: " << static_cast<int> (g);
    }
}

} // namespace kitties
