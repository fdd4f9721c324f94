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

#include "moves.hpp"

#include "private/jsonparse.hpp"

#include <glog/logging.h>

namespace kitties
{

namespace
{

/**
 * Checks that a JSON object has exactly the given number of fields.
 */
bool
HasFields (const Json::Value& obj, const unsigned n)
{
  return obj.isObject () && obj.size () == n;
}

/**
 * Returns the raw bytes of a genome, as used in the notification protos.
 */
std::string
GenomeBytes (const Genome& genome)
{
  return std::string (genome.begin (), genome.end ());
}

} // anonymous namespace

bool
MoveProcessor::ParseAction (const Json::Value& action, Move& mv)
{
  if (!HasFields (action, 1))
    return false;

  const std::string key = action.getMemberNames ()[0];
  const Json::Value& data = action[key];

  if (key == "c")
    {
      mv.type = Move::Type::CREATE;
      return HasFields (data, 0);
    }

  if (key == "b")
    {
      mv.type = Move::Type::BREED;
      return HasFields (data, 2)
          && AssetIdFromJson (data["a"], mv.id)
          && AssetIdFromJson (data["b"], mv.other);
    }

  if (key == "t")
    {
      mv.type = Move::Type::TRANSFER;
      return HasFields (data, 2)
          && AssetIdFromJson (data["id"], mv.id)
          && AccountFromJson (data["to"], mv.account);
    }

  if (key == "p")
    {
      mv.type = Move::Type::SET_PRICE;
      return HasFields (data, 2)
          && AssetIdFromJson (data["id"], mv.id)
          && BalanceFromJson (data["price"], mv.price);
    }

  if (key == "x")
    {
      mv.type = Move::Type::EXCHANGE;
      return HasFields (data, 2)
          && AssetIdFromJson (data["id"], mv.id)
          && AccountFromJson (data["with"], mv.account);
    }

  return false;
}

bool
MoveProcessor::ParseMove (const Json::Value& entry, Move& mv)
{
  mv = Move ();

  if (!entry.isObject ())
    return false;

  const auto& name = entry["name"];
  CHECK (name.isString ()) << "Move without name: " << entry;
  mv.name = name.asString ();

  const auto& txid = entry["txid"];
  if (txid.isString ())
    mv.txid = txid.asString ();

  return ParseAction (entry["move"], mv);
}

Json::Value
MoveProcessor::MoveToJson (const Move& mv)
{
  Json::Value res(Json::objectValue);
  if (!mv.txid.empty ())
    res["txid"] = mv.txid;

  switch (mv.type)
    {
    case Move::Type::CREATE:
      res["type"] = "create";
      break;

    case Move::Type::BREED:
      res["type"] = "breed";
      res["parents"] = Json::Value (Json::arrayValue);
      res["parents"].append (static_cast<Json::Int64> (mv.id));
      res["parents"].append (static_cast<Json::Int64> (mv.other));
      break;

    case Move::Type::TRANSFER:
      res["type"] = "transfer";
      res["id"] = static_cast<Json::Int64> (mv.id);
      res["to"] = mv.account;
      break;

    case Move::Type::SET_PRICE:
      res["type"] = "setprice";
      res["id"] = static_cast<Json::Int64> (mv.id);
      res["price"] = static_cast<Json::Int64> (mv.price);
      break;

    case Move::Type::EXCHANGE:
      res["type"] = "exchange";
      res["id"] = static_cast<Json::Int64> (mv.id);
      res["with"] = mv.account;
      break;

    default:
      LOG (FATAL) << "Invalid move type: " << static_cast<int> (mv.type);
    }

  return res;
}

ErrorCode
MoveProcessor::Execute (const Move& mv, const unsigned height)
{
  proto::Notification n;
  n.set_height (height);
  if (!mv.txid.empty ())
    n.set_txid (mv.txid);

  ErrorCode err;
  switch (mv.type)
    {
    case Move::Type::CREATE:
      {
        AssetId id;
        Genome genome;
        err = ownership.Create (mv.name, id, genome);
        if (err == ErrorCode::OK)
          {
            auto* data = n.mutable_created ();
            data->set_owner (mv.name);
            data->set_id (id);
            data->set_genome (GenomeBytes (genome));
          }
        break;
      }

    case Move::Type::BREED:
      {
        AssetId id;
        Genome genome;
        err = ownership.Breed (mv.name, mv.id, mv.other, id, genome);
        if (err == ErrorCode::OK)
          {
            auto* data = n.mutable_bred ();
            data->set_owner (mv.name);
            data->set_id (id);
            data->set_genome (GenomeBytes (genome));
          }
        break;
      }

    case Move::Type::TRANSFER:
      err = ownership.Transfer (mv.name, mv.account, mv.id);
      if (err == ErrorCode::OK)
        {
          auto* data = n.mutable_transferred ();
          data->set_from (mv.name);
          data->set_to (mv.account);
          data->set_id (mv.id);
        }
      break;

    case Move::Type::SET_PRICE:
      {
        Balance oldPrice;
        err = market.SetPrice (mv.name, mv.id, mv.price, oldPrice);
        if (err == ErrorCode::OK)
          {
            auto* data = n.mutable_price_updated ();
            data->set_id (mv.id);
            data->set_old_price (oldPrice);
            data->set_new_price (mv.price);
          }
        break;
      }

    case Move::Type::EXCHANGE:
      {
        Balance price;
        err = market.Exchange (mv.name, mv.account, mv.id, price);
        if (err == ErrorCode::OK)
          {
            auto* data = n.mutable_exchanged ();
            data->set_id (mv.id);
            data->set_initiator (mv.name);
            data->set_counterparty (mv.account);
            data->set_price (price);
          }
        break;
      }

    default:
      LOG (FATAL) << "Invalid move type: " << static_cast<int> (mv.type);
    }

  if (err == ErrorCode::OK)
    sink.Notify (n);

  return err;
}

void
MoveProcessor::ProcessAll (const Json::Value& moves, const unsigned height)
{
  CHECK (moves.isArray ());

  unsigned index = 0;
  for (const auto& entry : moves)
    {
      rnd.SetSequenceIndex (index++);

      Move mv;
      if (!ParseMove (entry, mv))
        {
          LOG (WARNING) << "Invalid move: " << entry;
          continue;
        }

      const ErrorCode err = Execute (mv, height);
      if (err != ErrorCode::OK)
        LOG (WARNING)
            << "Move from " << mv.name << " failed (" << err << "): "
            << entry["move"];
    }
}

} // namespace kitties
