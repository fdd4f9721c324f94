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

#include "private/marketplace.hpp"

#include <glog/logging.h>

#include <limits>

namespace kitties
{

ErrorCode
MarketplaceLedger::SetPrice (const std::string& caller, const AssetId id,
                             const Balance newPrice, Balance& oldPrice)
{
  CHECK_GE (newPrice, 0);

  if (!ownership.Exists (caller, id))
    return ErrorCode::INVALID_ASSET_ID;

  if (!GetPrice (id, oldPrice))
    return ErrorCode::NOT_FOR_SALE;

  SetListing (id, newPrice);
  return ErrorCode::OK;
}

ErrorCode
MarketplaceLedger::Exchange (const std::string& initiator,
                             const std::string& counterparty,
                             const AssetId id, Balance& price)
{
  if (initiator == counterparty)
    return ErrorCode::SELF_EXCHANGE;

  if (!TakeListing (id, price))
    return ErrorCode::NOT_FOR_SALE;

  /* From here on, the listing is gone no matter how the exchange ends.  */

  Balance counterpartyBalance;
  if (!GetBalance (counterparty, counterpartyBalance))
    return ErrorCode::NOT_FOR_SALE;

  if (counterpartyBalance <= price)
    return ErrorCode::INSUFFICIENT_BALANCE;

  Balance initiatorBalance;
  const bool hasInitiatorBalance = GetBalance (initiator, initiatorBalance);
  if (hasInitiatorBalance && initiatorBalance < price)
    {
      LOG (WARNING)
          << "Initiator " << initiator << " has balance " << initiatorBalance
          << ", which is not enough for price " << price;
      return ErrorCode::INSUFFICIENT_BALANCE;
    }

  if (counterpartyBalance > std::numeric_limits<Balance>::max () - price)
    {
      LOG (WARNING)
          << "Crediting " << price << " to " << counterparty
          << " would overflow the balance of " << counterpartyBalance;
      return ErrorCode::BALANCE_OVERFLOW;
    }

  if (!ownership.Exists (initiator, id))
    return ErrorCode::INVALID_ASSET_ID;

  if (hasInitiatorBalance)
    SetBalance (initiator, initiatorBalance - price);
  SetBalance (counterparty, counterpartyBalance + price);

  CHECK (ownership.Remove (initiator, id));

  return ErrorCode::OK;
}

bool
MarketplaceLedger::TakeListing (const AssetId id, Balance& price)
{
  if (!GetPrice (id, price))
    return false;

  auto stmt = db.Prepare (R"(
    DELETE FROM `listings`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Execute ();

  return true;
}

bool
MarketplaceLedger::GetPrice (const AssetId id, Balance& price) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `price`
      FROM `listings`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));

  if (!stmt.Step ())
    return false;

  price = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());
  CHECK_GE (price, 0);

  return true;
}

bool
MarketplaceLedger::GetBalance (const std::string& account,
                               Balance& balance) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `amount`
      FROM `balances`
      WHERE `account` = ?1
  )");
  stmt.Bind (1, account);

  if (!stmt.Step ())
    return false;

  balance = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());
  CHECK_GE (balance, 0);

  return true;
}

void
MarketplaceLedger::SetListing (const AssetId id, const Balance price)
{
  CHECK_GE (price, 0);

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `listings`
      (`id`, `price`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Bind (2, price);
  stmt.Execute ();
}

void
MarketplaceLedger::SetBalance (const std::string& account,
                               const Balance balance)
{
  CHECK_GE (balance, 0);

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `balances`
      (`account`, `amount`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, account);
  stmt.Bind (2, balance);
  stmt.Execute ();
}

} // namespace kitties
