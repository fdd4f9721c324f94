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

#include "json.hpp"

#include "genome.hpp"
#include "proto/notifications.pb.h"

#include <glog/logging.h>

#include <algorithm>

namespace kitties
{

namespace
{

/**
 * Converts an integer to JSON, making sure to do it with the proper
 * signed JSON int64 type.
 */
Json::Value
IntToJson (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

/**
 * Converts a genome given as raw bytes in a proto to its hex form.
 */
Json::Value
GenomeBytesToJson (const std::string& bytes)
{
  CHECK_EQ (bytes.size (), GENOME_BYTES);

  Genome genome;
  std::copy (bytes.begin (), bytes.end (), genome.begin ());

  return GenomeToHex (genome);
}

} // anonymous namespace

template <>
  Json::Value
  ProtoToJson<proto::AssetCreated> (const proto::AssetCreated& pb)
{
  Json::Value res(Json::objectValue);
  res["owner"] = pb.owner ();
  res["id"] = IntToJson (pb.id ());
  res["genome"] = GenomeBytesToJson (pb.genome ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::AssetBred> (const proto::AssetBred& pb)
{
  Json::Value res(Json::objectValue);
  res["owner"] = pb.owner ();
  res["id"] = IntToJson (pb.id ());
  res["genome"] = GenomeBytesToJson (pb.genome ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::AssetTransferred> (const proto::AssetTransferred& pb)
{
  Json::Value res(Json::objectValue);
  res["from"] = pb.from ();
  res["to"] = pb.to ();
  res["id"] = IntToJson (pb.id ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::PriceUpdated> (const proto::PriceUpdated& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (pb.id ());
  res["oldprice"] = IntToJson (pb.old_price ());
  res["newprice"] = IntToJson (pb.new_price ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::AssetExchanged> (const proto::AssetExchanged& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (pb.id ());
  res["initiator"] = pb.initiator ();
  res["counterparty"] = pb.counterparty ();
  res["price"] = IntToJson (pb.price ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Notification> (const proto::Notification& pb)
{
  Json::Value res(Json::objectValue);

  if (pb.has_height ())
    res["height"] = IntToJson (pb.height ());
  if (pb.has_txid ())
    res["txid"] = pb.txid ();

  switch (pb.event_case ())
    {
    case proto::Notification::kCreated:
      res["type"] = "created";
      res["data"] = ProtoToJson (pb.created ());
      break;
    case proto::Notification::kBred:
      res["type"] = "bred";
      res["data"] = ProtoToJson (pb.bred ());
      break;
    case proto::Notification::kTransferred:
      res["type"] = "transferred";
      res["data"] = ProtoToJson (pb.transferred ());
      break;
    case proto::Notification::kPriceUpdated:
      res["type"] = "priceupdated";
      res["data"] = ProtoToJson (pb.price_updated ());
      break;
    case proto::Notification::kExchanged:
      res["type"] = "exchanged";
      res["data"] = ProtoToJson (pb.exchanged ());
      break;
    default:
      LOG (FATAL) << "Notification without event: " << pb.DebugString ();
    }

  return res;
}

} // namespace kitties
