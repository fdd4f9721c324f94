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

#ifndef KITTIES_TYPES_HPP
#define KITTIES_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace kitties
{

/** Identifier of an asset.  They are allocated in increasing order.  */
using AssetId = uint32_t;

/**
 * Amount of the internal marketplace balance (and thus also prices).
 * Valid values are never negative; the signed type matches what
 * we can store in SQLite without conversions.
 */
using Balance = int64_t;

/** Number of bytes in a genome.  */
constexpr size_t GENOME_BYTES = 16;

/** The DNA of an asset, which is all the data it has.  */
using Genome = std::array<unsigned char, GENOME_BYTES>;

/**
 * Result of an operation on the ledgers.  OK means success, all other
 * values are the specific reason why an operation was rejected.
 */
enum class ErrorCode
{
  OK,
  /** The asset ID counter would overflow.  */
  ID_OVERFLOW,
  /** The asset does not exist or is not owned by the caller.  */
  INVALID_ASSET_ID,
  /** Both parents for breeding have the same gender.  */
  SAME_GENDER,
  /** The asset has no listing (or the counterparty has no balance).  */
  NOT_FOR_SALE,
  /** An exchange was requested with oneself.  */
  SELF_EXCHANGE,
  /** The balance is not enough for the exchange.  */
  INSUFFICIENT_BALANCE,
  /** A balance would exceed the representable range.  */
  BALANCE_OVERFLOW,
};

/**
 * Returns a string representation of the error code, for logging.
 */
std::string ErrorCodeToString (ErrorCode c);

std::ostream& operator<< (std::ostream& out, ErrorCode c);

} // namespace kitties

#endif // KITTIES_TYPES_HPP
