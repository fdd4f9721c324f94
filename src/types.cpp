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

#include "types.hpp"

#include <glog/logging.h>

namespace kitties
{

std::string
ErrorCodeToString (const ErrorCode c)
{
  switch (c)
    {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::ID_OVERFLOW:
      return "id overflow";
    case ErrorCode::INVALID_ASSET_ID:
      return "invalid asset id";
    case ErrorCode::SAME_GENDER:
      return "same gender";
    case ErrorCode::NOT_FOR_SALE:
      return "not for sale";
    case ErrorCode::SELF_EXCHANGE:
      return "exchange with oneself";
    case ErrorCode::INSUFFICIENT_BALANCE:
      return "insufficient balance";
    case ErrorCode::BALANCE_OVERFLOW:
      return "balance overflow";
    default:
      LOG (FATAL) << "Invalid error code: " << static_cast<int> (c);
    }
}

std::ostream&
operator<< (std::ostream& out, const ErrorCode c)
{
  out << ErrorCodeToString (c);
  return out;
}

} // namespace kitties
