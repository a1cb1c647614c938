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

#ifndef SETTLER_REGISTRY_HPP
#define SETTLER_REGISTRY_HPP

#include "private/record.hpp"
#include "proto/transaction.pb.h"
#include "transaction.hpp"
#include "transactionstore.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace settler
{

/**
 * The set of transactions this process knows about.  It holds the
 * in-memory cache of active transactions (write-through to the
 * persistent store), and the "pending" fence that ensures only
 * one phase request is processed for a transaction at any time.
 *
 * Each map has its own lock.  The locks are only held while checking and
 * updating the maps themselves, never while calling into the store.
 */
class TransactionRegistry
{

private:

  using RecordMap = std::map<TransactionId, std::shared_ptr<Record>>;

  /** The store used for persisting and recovering records.  */
  TransactionStore& store;

  /**
   * The cache of known transactions.  Records are added when created or
   * loaded from the store, and removed once they reach a terminal state.
   */
  RecordMap known;

  /** Lock for known.  */
  mutable std::mutex mutKnown;

  /** Transactions that have a phase request being processed right now.  */
  RecordMap pending;

  /** Lock for pending.  */
  mutable std::mutex mutPending;

  /**
   * Records whose latest state could not be written to the store.  They are
   * retried regularly, and take precedence over the store's data on lookups
   * while queued.
   */
  RecordMap unpersisted;

  /** Lock for unpersisted.  */
  mutable std::mutex mutUnpersisted;

  /**
   * Looks up a record in the given map while holding the given lock.
   * Returns null if there is none.
   */
  static std::shared_ptr<Record> LookupLocked (const RecordMap& m,
                                               std::mutex& mut,
                                               const TransactionId& id);

protected:

  /**
   * Returns the current time as UNIX milliseconds.  This is used for
   * the timestamps in records, and can be mocked in tests.
   */
  virtual int64_t GetCurrentTimeImpl () const;

public:

  explicit TransactionRegistry (TransactionStore& s)
    : store(s)
  {}

  virtual ~TransactionRegistry () = default;

  TransactionRegistry () = delete;
  TransactionRegistry (const TransactionRegistry&) = delete;
  void operator= (const TransactionRegistry&) = delete;

  /**
   * Returns the current time as used for the timestamps.
   */
  int64_t
  GetCurrentTime () const
  {
    return GetCurrentTimeImpl ();
  }

  /**
   * Looks up a transaction by id.  Returns the in-memory record if there
   * is one, and otherwise tries to load it from the store.  Returns null
   * if the transaction is not known at all.  Throws DataIntegrityError if
   * the store contains more than one row for the id.
   *
   * Records in a terminal state that are loaded from the store are not
   * added to the cache again.
   */
  std::shared_ptr<Record> Get (const TransactionId& id);

  /**
   * Creates a new transaction from the given data (see
   * InitialiseTransaction), adds it to the cache and persists it.
   * Returns null if a transaction with the same id exists already, in which
   * case nothing is changed.  If persisting fails, the StoreError
   * is propagated and the transaction is not created.
   */
  std::shared_ptr<Record> Create (const proto::Transaction& data);

  /**
   * Records the ledger's response to a submitted transaction, i.e. sets
   * the bookkeeping fields given in response (see ApplyResponse) and
   * persists the record.  This works for terminal transactions as well.
   *
   * Returns false with "no matching transaction found" if the id is not
   * known, and with "pending" if a phase request for it is being
   * processed right now.  Lookup failures of the store are thrown.
   */
  bool RecordResponse (const TransactionId& id,
                       const proto::Transaction& response, std::string& msg);

  /**
   * Tries to claim the pending fence for a transaction.  Returns false if
   * some other request holds it already.
   */
  bool TryClaim (const TransactionId& id, std::shared_ptr<Record> rec);

  /**
   * Releases the fence for a transaction.  It must have been claimed
   * before with TryClaim.
   */
  void Release (const TransactionId& id);

  /**
   * Removes a transaction from the known cache (but not the store).
   */
  void Evict (const TransactionId& id);

  /**
   * Writes the current state of a record to the store.  If that fails,
   * the record is queued to be retried later instead.  Returns true if
   * the record has been stored.
   *
   * The caller must hold the fence for the record.
   */
  bool Persist (const std::shared_ptr<Record>& rec);

  /**
   * Tries to store all records queued as unpersisted.  Records whose fence
   * is currently claimed are skipped, as they will be persisted by
   * the request holding it anyway.  Returns the number of records still
   * queued afterwards.
   */
  size_t RetryUnpersisted ();

  /**
   * Returns snapshots of all known records that are not terminal and have
   * been created at least maxAge ago.
   */
  std::vector<proto::Transaction> GetStale (
      std::chrono::milliseconds maxAge) const;

  size_t CountKnown () const;
  size_t CountPending () const;
  size_t CountUnpersisted () const;

};

} // namespace settler

#endif // SETTLER_REGISTRY_HPP
