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

#ifndef SETTLER_PROCESSOR_HPP
#define SETTLER_PROCESSOR_HPP

#include "assetcallback.hpp"
#include "phase.hpp"
#include "private/record.hpp"
#include "private/registry.hpp"
#include "transaction.hpp"

#include <memory>
#include <string>

namespace settler
{

/**
 * Handles phase requests coming in from the remote ledger.  It looks up
 * the transaction, fences it against concurrent requests, runs the
 * requested phase and reports back whether it was successful.
 */
class PhaseProcessor
{

private:

  /** The registry holding the transactions.  */
  TransactionRegistry& registry;

  /**
   * Runs a phase for a record (whose fence must be held).  This checks the
   * transition, invokes the asset callback if needed and updates and
   * persists the record on success.
   */
  bool RunPhase (const std::shared_ptr<Record>& rec, Phase phase,
                 AssetCallback& cb, std::string& msg);

  /**
   * Calls the asset callback's method for the given phase.
   */
  static bool InvokeCallback (AssetCallback& cb, Phase phase,
                              const proto::Transaction& tx, std::string& msg);

public:

  explicit PhaseProcessor (TransactionRegistry& r)
    : registry(r)
  {}

  PhaseProcessor () = delete;
  PhaseProcessor (const PhaseProcessor&) = delete;
  void operator= (const PhaseProcessor&) = delete;

  /**
   * Processes a request for the named phase of the given transaction,
   * with cb as the asset-specific implementation.  Returns true on success
   * and sets msg to the message that should be returned to the ledger.
   *
   * A message of "pending" (with false returned) means that another request
   * for the same transaction is being processed, and the ledger should
   * retry later.  All other failures are final.
   *
   * Failures of the store while looking up the transaction (StoreError
   * and DataIntegrityError) are thrown.
   */
  bool ProcessPhaseRequest (const TransactionId& id,
                            const std::string& phaseName,
                            AssetCallback& cb, std::string& msg);

};

} // namespace settler

#endif // SETTLER_PROCESSOR_HPP
