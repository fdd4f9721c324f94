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

#ifndef KITTIES_RANDOMNESS_HPP
#define KITTIES_RANDOMNESS_HPP

#include "types.hpp"

#include <xayautil/uint256.hpp>

#include <string>

namespace kitties
{

/**
 * Source of the random values used for new genomes and breeding selectors.
 * The value for a call has to be determined entirely by the consensus
 * state, so that every node computes the same.
 */
class RandomnessSource
{

private:

  /** The index of the call currently being processed.  */
  unsigned index = 0;

protected:

  unsigned
  GetSequenceIndex () const
  {
    return index;
  }

public:

  RandomnessSource () = default;
  virtual ~RandomnessSource () = default;

  RandomnessSource (const RandomnessSource&) = delete;
  void operator= (const RandomnessSource&) = delete;

  /**
   * Sets the index of the call (within the current block) that values
   * are returned for from now on.
   */
  void
  SetSequenceIndex (const unsigned i)
  {
    index = i;
  }

  /**
   * Returns the random value for the current call made by the given caller.
   */
  virtual Genome GetValue (const std::string& caller) = 0;

};

/**
 * The randomness used in the game, based on the block's random seed.
 * Values are derived by hashing the seed, the caller's name and the index
 * of the current move within the block, and using the first 16 bytes of
 * the SHA-256 hash.
 */
class BlockRandomness : public RandomnessSource
{

private:

  /** The block's seed.  */
  const xaya::uint256 seed;

public:

  explicit BlockRandomness (const xaya::uint256& s)
    : seed(s)
  {}

  Genome GetValue (const std::string& caller) override;

};

} // namespace kitties

#endif // KITTIES_RANDOMNESS_HPP
