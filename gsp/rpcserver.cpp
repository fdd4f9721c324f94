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

#include "rpcserver.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

namespace kitties
{

AssetId
RpcServer::CheckAssetId (const int id)
{
  if (id < 0)
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "asset ID must not be negative");
  return static_cast<AssetId> (id);
}

void
RpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";
  game.RequestStop ();
}

Json::Value
RpcServer::getcurrentstate ()
{
  LOG (INFO) << "RPC method called: getcurrentstate";
  return game.GetCurrentJsonState ();
}

Json::Value
RpcServer::getpendingstate ()
{
  LOG (INFO) << "RPC method called: getpendingstate";
  return game.GetPendingJsonState ();
}

Json::Value
RpcServer::getasset (const int id)
{
  LOG (INFO) << "RPC method called: getasset " << id;
  const AssetId assetId = CheckAssetId (id);
  return logic.Query (game, [assetId] (const StateJson& s)
    {
      return s.GetAsset (assetId);
    });
}

Json::Value
RpcServer::getassetsof (const std::string& owner)
{
  LOG (INFO) << "RPC method called: getassetsof " << owner;
  return logic.Query (game, [&owner] (const StateJson& s)
    {
      return s.GetAssetsOf (owner);
    });
}

Json::Value
RpcServer::getlisting (const int id)
{
  LOG (INFO) << "RPC method called: getlisting " << id;
  const AssetId assetId = CheckAssetId (id);
  return logic.Query (game, [assetId] (const StateJson& s)
    {
      return s.GetListing (assetId);
    });
}

Json::Value
RpcServer::getbalance (const std::string& account)
{
  LOG (INFO) << "RPC method called: getbalance " << account;
  return logic.Query (game, [&account] (const StateJson& s)
    {
      return s.GetBalance (account);
    });
}

} // namespace kitties
