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

#ifndef SETTLER_SQLITESTORE_HPP
#define SETTLER_SQLITESTORE_HPP

#include "transactionstore.hpp"

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <vector>

namespace settler
{

/**
 * TransactionStore backed by an SQLite database file.  Each record is
 * kept as one row in the `transactions` table, with the fields that can
 * be queried as dedicated (indexed) columns and the full record as
 * serialised protocol buffer.
 */
class SQLiteTransactionStore : public TransactionStore
{

private:

  /** The database handle.  */
  sqlite3* db = nullptr;

  /**
   * Lock for the database.  SQLite itself is opened in serialised mode,
   * but the upsert in Store consists of multiple statements that need
   * to happen together.
   */
  std::mutex mut;

  /**
   * Executes a single SQL statement (or script) without results.
   * Throws StoreError on failure.
   */
  void Execute (const std::string& sql);

  /**
   * Sets up the database schema if it does not exist yet.
   */
  void SetupSchema ();

public:

  /**
   * Opens (and creates if needed) the database at the given file name.
   * ":memory:" can be used for a temporary in-memory database.
   */
  explicit SQLiteTransactionStore (const std::string& file);

  ~SQLiteTransactionStore ();

  SQLiteTransactionStore () = delete;

  void Store (const proto::Transaction& tx) override;
  std::vector<proto::Transaction> Get (const std::string& field,
                                       const std::string& value) override;

  /**
   * Inserts a row for the record without checking for an existing one.
   * This allows tests to simulate corrupted data with duplicate ids.
   */
  void InsertForTesting (const proto::Transaction& tx);

};

} // namespace settler

#endif // SETTLER_SQLITESTORE_HPP
