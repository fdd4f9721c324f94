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

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace kitties
{
namespace
{

/* ************************************************************************** */

using GenderTests = testing::Test;

TEST_F (GenderTests, ParityOfFirstByte)
{
  EXPECT_EQ (GetGender (GenomeWithFirstByte (4)), Gender::MALE);
  EXPECT_EQ (GetGender (GenomeWithFirstByte (5)), Gender::FEMALE);
  EXPECT_EQ (GetGender (GenomeWithFirstByte (0)), Gender::MALE);
  EXPECT_EQ (GetGender (GenomeWithFirstByte (255)), Gender::FEMALE);
}

TEST_F (GenderTests, OtherBytesIrrelevant)
{
  EXPECT_EQ (GetGender (GenomeFrom ("02ffffffffffffffffffffffffffffff")),
             Gender::MALE);
  EXPECT_EQ (GetGender (GenomeFrom ("03000000000000000000000000000000")),
             Gender::FEMALE);
}

TEST_F (GenderTests, ToString)
{
  EXPECT_EQ (GenderToString (Gender::MALE), "male");
  EXPECT_EQ (GenderToString (Gender::FEMALE), "female");
}

/* ************************************************************************** */

using CombineDnaTests = testing::Test;

TEST_F (CombineDnaTests, SelectorPicksBits)
{
  Genome a, b, selector;
  a.fill (0xAA);
  b.fill (0x55);
  selector.fill (0xF0);

  Genome expected;
  expected.fill (0x5A);

  EXPECT_EQ (CombineDna (a, b, selector), expected);
}

TEST_F (CombineDnaTests, ZeroAndFullSelector)
{
  const Genome a = GenomeFrom ("00112233445566778899aabbccddeeff");
  const Genome b = GenomeFrom ("ffeeddccbbaa99887766554433221100");

  Genome selector;
  selector.fill (0x00);
  EXPECT_EQ (CombineDna (a, b, selector), a);

  selector.fill (0xFF);
  EXPECT_EQ (CombineDna (a, b, selector), b);
}

TEST_F (CombineDnaTests, PerByteSelector)
{
  const Genome a = GenomeFrom ("ffffffffffffffffffffffffffffffff");
  const Genome b = GenomeFrom ("00000000000000000000000000000000");
  const Genome selector = GenomeFrom ("0f00ff0000000000000000000000000f");

  EXPECT_EQ (CombineDna (a, b, selector),
             GenomeFrom ("f0ff00fffffffffffffffffffffffff0"));
}

/* ************************************************************************** */

using GenomeHexTests = testing::Test;

TEST_F (GenomeHexTests, ToHex)
{
  Genome g;
  for (size_t i = 0; i < g.size (); ++i)
    g[i] = static_cast<unsigned char> (i * 17);

  EXPECT_EQ (GenomeToHex (g), "00112233445566778899aabbccddeeff");
}

TEST_F (GenomeHexTests, FromHex)
{
  Genome g;
  ASSERT_TRUE (GenomeFromHex ("00112233445566778899AABBCCDDEEFF", g));
  EXPECT_EQ (g[0], 0x00);
  EXPECT_EQ (g[10], 0xAA);
  EXPECT_EQ (g[15], 0xFF);
}

TEST_F (GenomeHexTests, InvalidHex)
{
  Genome g;
  EXPECT_FALSE (GenomeFromHex ("", g));
  EXPECT_FALSE (GenomeFromHex ("0011", g));
  EXPECT_FALSE (GenomeFromHex ("00112233445566778899aabbccddeeff00", g));
  EXPECT_FALSE (GenomeFromHex ("0011223344556677889xaabbccddeeff", g));
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace kitties
