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

#ifndef SETTLER_DAEMON_HPP
#define SETTLER_DAEMON_HPP

#include "assetcallback.hpp"
#include "phase.hpp"
#include "proto/transaction.pb.h"
#include "transaction.hpp"
#include "transactionstore.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace settler
{

/**
 * The main class for running a Settler daemon.  It ties together the
 * registry of transactions (backed by the given store), the processing
 * of phase requests with the given asset callback, and the background
 * jobs that retry failed writes to the store and warn about holds that
 * seem to be stuck.
 */
class Daemon
{

private:

  class Impl;

  /**
   * The actual implementation, whose definition is hidden in the .cpp
   * file to decouple the public interface from internal stuff.
   */
  std::unique_ptr<Impl> impl;

public:

  /**
   * Counts of the registry, as returned by the status RPC.
   */
  struct Status
  {
    size_t known;
    size_t pending;
    size_t unpersisted;
  };

  /**
   * Constructs the daemon.  The callback base URI is the address of the
   * external HTTP frontend that receives the ledger's phase callbacks and
   * forwards them to processphase.  The URIs handed out to the ledger
   * are built on it.  Throws std::invalid_argument if it is
   * not a valid base URI.
   */
  explicit Daemon (TransactionStore& store, AssetCallback& cb,
                   const std::string& callbackBase);

  ~Daemon ();

  Daemon () = delete;
  Daemon (const Daemon&) = delete;
  void operator= (const Daemon&) = delete;

  /**
   * Processes an inbound phase request from the ledger.
   */
  bool ProcessPhase (const TransactionId& id, const std::string& phase,
                     std::string& msg);

  /**
   * Creates a new transaction from the given data.  Returns false if
   * one with the same id exists already.  On success, the created
   * record is returned in tx.
   */
  bool CreateTransaction (const proto::Transaction& data,
                          proto::Transaction& tx);

  /**
   * Records the ledger's response to a transaction (only the bookkeeping
   * fields set in response are used).  Returns false with the reason
   * in msg if it cannot be done right now.
   */
  bool RecordResponse (const TransactionId& id,
                       const proto::Transaction& response, std::string& msg);

  /**
   * Looks up a transaction by id, loading it from the store if necessary.
   * Returns false if it does not exist.
   */
  bool GetTransaction (const TransactionId& id, proto::Transaction& tx);

  /**
   * Returns the callback URI for a phase of the given transaction.
   */
  std::string GetPhaseUri (const TransactionId& id, Phase phase) const;

  /**
   * Returns the current counts of the registry.
   */
  Status GetStatus () const;

};

} // namespace settler

#endif // SETTLER_DAEMON_HPP
