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

#ifndef SETTLER_TRANSACTION_HPP
#define SETTLER_TRANSACTION_HPP

#include "proto/transaction.pb.h"

#include <cstdint>
#include <string>

namespace settler
{

/** Identifier of a transaction.  */
using TransactionId = std::string;

/**
 * Builds a fresh transaction record from the caller-supplied data.  Only
 * the identifying and economic fields of data are taken over; all the
 * response bookkeeping, the state and the timestamps are reset to their
 * initial values, with the creation time set to the given timestamp.
 */
proto::Transaction InitialiseTransaction (const proto::Transaction& data,
                                          int64_t now);

/**
 * Updates the ledger response bookkeeping of tx (submission flag,
 * response status and the payer's ending balance) from response.
 * Only those bookkeeping fields that are set in response are copied;
 * everything else in tx is left alone.
 */
void ApplyResponse (const proto::Transaction& response,
                    proto::Transaction& tx);

/**
 * Returns true if the given state is terminal (consumed or canceled).
 */
bool IsTerminal (proto::Transaction::State state);

/**
 * Returns a lower-case string for the given state, as used in
 * log messages and the JSON representation.
 */
std::string StateToString (proto::Transaction::State state);

/* The boolean view of the state.  Enacted is true also after a consume,
   and after a cancel if the hold had been enacted first.  */
bool IsEnacted (const proto::Transaction& tx);
bool IsConsumed (const proto::Transaction& tx);
bool IsCanceled (const proto::Transaction& tx);

/**
 * Retrieves the region-local id of the object, if it is set in the record.
 * Returns false if not.
 */
bool TryGetLocalId (const proto::Transaction& tx, uint32_t& localId);

} // namespace settler

#endif // SETTLER_TRANSACTION_HPP
