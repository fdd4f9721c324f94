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

#ifndef KITTIES_GENOME_HPP
#define KITTIES_GENOME_HPP

#include "types.hpp"

#include <string>

namespace kitties
{

/**
 * Gender of an asset.  It is not stored but derived from the genome.
 */
enum class Gender
{
  MALE,
  FEMALE,
};

/**
 * Returns the gender of an asset with the given genome.  This is determined
 * by the parity of the first byte (even is male).
 */
Gender GetGender (const Genome& genome);

/**
 * Combines the genomes of two parents into that of their child.  Each bit
 * of the selector decides whether the child gets the corresponding bit
 * from the first parent (selector bit not set) or the second parent
 * (selector bit set).
 */
Genome CombineDna (const Genome& a, const Genome& b, const Genome& selector);

/**
 * Returns the lower-case hex encoding of a genome.
 */
std::string GenomeToHex (const Genome& genome);

/**
 * Parses a genome from hex.  Returns false if the string is not exactly
 * the right number of hex digits.
 */
bool GenomeFromHex (const std::string& hex, Genome& genome);

/**
 * Converts a gender to its string form ("male" or "female").
 */
std::string GenderToString (Gender g);

} // namespace kitties

#endif // KITTIES_GENOME_HPP
