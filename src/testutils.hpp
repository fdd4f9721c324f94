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

#ifndef KITTIES_TESTUTILS_HPP
#define KITTIES_TESTUTILS_HPP

#include "notifications.hpp"
#include "proto/notifications.pb.h"
#include "randomness.hpp"
#include "schema.hpp"
#include "types.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/message_differencer.h>

#include <deque>
#include <string>
#include <vector>

namespace kitties
{

/**
 * Parses a string to JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Parses a protocol buffer from text format.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res));
  return res;
}

#define DEFINE_PROTO_MATCHER(name, type) \
  MATCHER_P (name, str, "") \
  { \
    const auto expected = ParseTextProto<proto::type> (str);\
    if (google::protobuf::util::MessageDifferencer::Equals (arg, expected)) \
      return true; \
    *result_listener << "actual: " << arg.DebugString (); \
    return false; \
  }

DEFINE_PROTO_MATCHER (EqualsNotification, Notification)

/**
 * Constructs a genome from its hex string (which must be valid).
 */
Genome GenomeFrom (const std::string& hex);

/**
 * Returns a genome that has all bytes zero except the first one,
 * which is set to the given value.  This is enough to control the
 * gender of an asset in tests.
 */
Genome GenomeWithFirstByte (unsigned char first);

/**
 * Randomness source for tests, which returns values that have been
 * queued up before.  It also records the callers and sequence indices
 * for which values were requested.
 */
class TestRandomness : public RandomnessSource
{

private:

  /** Values to be returned.  */
  std::deque<Genome> values;

public:

  /** The callers for which values were requested, in order.  */
  std::vector<std::string> callers;

  /** The sequence indices at which values were requested.  */
  std::vector<unsigned> indices;

  TestRandomness () = default;

  /**
   * Queues a value to be returned.
   */
  void
  Add (const Genome& val)
  {
    values.push_back (val);
  }

  Genome GetValue (const std::string& caller) override;

};

/**
 * Notification sink that just records everything for inspection.
 */
class RecordingNotificationSink : public NotificationSink
{

public:

  std::vector<proto::Notification> notifications;

  RecordingNotificationSink () = default;

  void
  Notify (const proto::Notification& n) override
  {
    notifications.push_back (n);
  }

};

/**
 * Test fixture with an in-memory database that has the game's schema
 * set up.
 */
class DBTest : public testing::Test
{

protected:

  xaya::SQLiteDatabase db;

  DBTest ();

  /**
   * Inserts an asset directly into the database.
   */
  void InsertAsset (AssetId id, const std::string& owner,
                    const Genome& genome);

  /**
   * Sets the asset ID counter directly in the database.
   */
  void SetNextId (int64_t value);

  /**
   * Returns the number of rows in a table.
   */
  int CountRows (const std::string& table);

};

} // namespace kitties

#endif // KITTIES_TESTUTILS_HPP
