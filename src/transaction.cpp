/*
    Settler - ledger-settled asset holds
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

#include "transaction.hpp"

#include <glog/logging.h>

namespace settler
{

proto::Transaction
InitialiseTransaction (const proto::Transaction& data, const int64_t now)
{
  proto::Transaction res = data;

  res.set_submitted (false);
  res.set_response_received (false);
  res.set_response_success (false);
  res.set_response_status ("");
  res.set_response_reason ("");
  res.set_payer_ending_balance (-1);

  res.set_state (proto::Transaction::CREATED);
  res.set_created_time (now);
  res.clear_enacted_time ();
  res.clear_finished_time ();

  return res;
}

void
ApplyResponse (const proto::Transaction& response, proto::Transaction& tx)
{
  if (response.has_submitted ())
    tx.set_submitted (response.submitted ());
  if (response.has_response_received ())
    tx.set_response_received (response.response_received ());
  if (response.has_response_success ())
    tx.set_response_success (response.response_success ());
  if (response.has_response_status ())
    tx.set_response_status (response.response_status ());
  if (response.has_response_reason ())
    tx.set_response_reason (response.response_reason ());
  if (response.has_payer_ending_balance ())
    tx.set_payer_ending_balance (response.payer_ending_balance ());
}

bool
IsTerminal (const proto::Transaction::State state)
{
  switch (state)
    {
    case proto::Transaction::CREATED:
    case proto::Transaction::ENACTED:
      return false;

    case proto::Transaction::CONSUMED:
    case proto::Transaction::CANCELED:
      return true;

    default:
      LOG (FATAL) << "Invalid transaction state: " << static_cast<int> (state);
    }
}

std::string
StateToString (const proto::Transaction::State state)
{
  switch (state)
    {
    case proto::Transaction::CREATED:
      return "created";
    case proto::Transaction::ENACTED:
      return "enacted";
    case proto::Transaction::CONSUMED:
      return "consumed";
    case proto::Transaction::CANCELED:
      return "canceled";
    default:
      LOG (FATAL) << "Invalid transaction state: " << static_cast<int> (state);
    }
}

bool
IsEnacted (const proto::Transaction& tx)
{
  return tx.has_enacted_time ();
}

bool
IsConsumed (const proto::Transaction& tx)
{
  return tx.state () == proto::Transaction::CONSUMED;
}

bool
IsCanceled (const proto::Transaction& tx)
{
  return tx.state () == proto::Transaction::CANCELED;
}

bool
TryGetLocalId (const proto::Transaction& tx, uint32_t& localId)
{
  if (!tx.has_local_id ())
    {
      localId = 0;
      return false;
    }

  localId = tx.local_id ();
  return true;
}

} // namespace settler
