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

#ifndef SETTLER_TRANSACTIONSTORE_HPP
#define SETTLER_TRANSACTIONSTORE_HPP

#include "proto/transaction.pb.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace settler
{

/**
 * Exception thrown if the underlying storage fails, or if it is used
 * in an invalid way (e.g. lookup by an unsupported field).
 */
class StoreError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Exception thrown if the stored data is inconsistent in a way that
 * should be structurally impossible, namely if more than one row is
 * found for a single transaction id.
 */
class DataIntegrityError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Durable storage of transaction records.  It is used as audit log
 * and as source for recovering records that are not (or no longer)
 * in memory.  Records are never deleted from it.
 *
 * Implementations must be thread-safe.
 */
class TransactionStore
{

public:

  TransactionStore () = default;
  virtual ~TransactionStore () = default;

  TransactionStore (const TransactionStore&) = delete;
  void operator= (const TransactionStore&) = delete;

  /**
   * Writes the full record, inserting it if no row with its id exists yet
   * and overwriting the existing row(s) otherwise.  Throws StoreError
   * if that fails.
   */
  virtual void Store (const proto::Transaction& tx) = 0;

  /**
   * Returns all records where the given field matches the value.
   * Fields that can be queried are "id", "payer_id", "payee_id", "part_id"
   * and "subscription_id".
   */
  virtual std::vector<proto::Transaction> Get (const std::string& field,
                                               const std::string& value) = 0;

};

} // namespace settler

#endif // SETTLER_TRANSACTIONSTORE_HPP
