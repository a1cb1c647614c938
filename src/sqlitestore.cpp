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

#include "sqlitestore.hpp"

#include <glog/logging.h>

#include <set>
#include <sstream>

namespace settler
{

namespace
{

/** Fields of the record that can be used for Get.  */
const std::set<std::string> QUERYABLE_FIELDS =
  {
    "id",
    "payer_id",
    "payee_id",
    "part_id",
    "subscription_id",
  };

/**
 * Throws a StoreError with the given context and the current error
 * message of the database.
 */
[[noreturn]] void
ThrowError (sqlite3* db, const std::string& what)
{
  std::ostringstream msg;
  msg << what << ": " << sqlite3_errmsg (db);
  throw StoreError (msg.str ());
}

/**
 * Prepared statement, which is finalised when the instance goes
 * out of scope.
 */
class Statement
{

private:

  sqlite3* db;
  sqlite3_stmt* stmt = nullptr;

public:

  explicit Statement (sqlite3* d, const std::string& sql)
    : db(d)
  {
    const int rc = sqlite3_prepare_v2 (db, sql.c_str (), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
      ThrowError (db, "preparing statement failed");
  }

  ~Statement ()
  {
    sqlite3_finalize (stmt);
  }

  Statement () = delete;
  Statement (const Statement&) = delete;
  void operator= (const Statement&) = delete;

  void
  Bind (const int ind, const std::string& val)
  {
    const int rc = sqlite3_bind_text (stmt, ind, val.c_str (), val.size (),
                                      SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
      ThrowError (db, "binding text failed");
  }

  void
  BindBlob (const int ind, const std::string& val)
  {
    const int rc = sqlite3_bind_blob (stmt, ind, val.data (), val.size (),
                                      SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
      ThrowError (db, "binding blob failed");
  }

  /**
   * Steps the statement.  Returns true if there is a result row, and
   * false if the statement is done.
   */
  bool
  Step ()
  {
    const int rc = sqlite3_step (stmt);
    switch (rc)
      {
      case SQLITE_ROW:
        return true;
      case SQLITE_DONE:
        return false;
      default:
        ThrowError (db, "executing statement failed");
      }
  }

  /**
   * Extracts a blob column of the current row.
   */
  std::string
  GetBlob (const int ind)
  {
    const auto* data = static_cast<const char*> (sqlite3_column_blob (stmt, ind));
    const int len = sqlite3_column_bytes (stmt, ind);
    if (data == nullptr)
      return "";
    return std::string (data, len);
  }

};

/**
 * Binds the columns of a record to the update / insert statements.
 * Both of them use ?1 for the id, ?2 to ?5 for the other lookup fields
 * and ?6 for the full serialised record.
 */
void
BindRecord (Statement& stmt, const proto::Transaction& tx)
{
  std::string serialised;
  if (!tx.SerializeToString (&serialised))
    throw StoreError ("failed to serialise transaction " + tx.id ());

  stmt.Bind (1, tx.id ());
  stmt.Bind (2, tx.payer_id ());
  stmt.Bind (3, tx.payee_id ());
  stmt.Bind (4, tx.part_id ());
  stmt.Bind (5, tx.subscription_id ());
  stmt.BindBlob (6, serialised);
}

void
InsertRow (sqlite3* db, const proto::Transaction& tx)
{
  Statement stmt(db, R"(
    INSERT INTO `transactions`
      (`id`, `payer_id`, `payee_id`, `part_id`, `subscription_id`, `data`)
      VALUES (?1, ?2, ?3, ?4, ?5, ?6)
  )");
  BindRecord (stmt, tx);
  CHECK (!stmt.Step ());
}

} // anonymous namespace

SQLiteTransactionStore::SQLiteTransactionStore (const std::string& file)
{
  const int rc = sqlite3_open_v2 (file.c_str (), &db,
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
                                    | SQLITE_OPEN_FULLMUTEX,
                                  nullptr);
  if (rc != SQLITE_OK)
    {
      std::string msg = "failed to open database " + file;
      if (db != nullptr)
        {
          msg += ": ";
          msg += sqlite3_errmsg (db);
          sqlite3_close (db);
          db = nullptr;
        }
      throw StoreError (msg);
    }

  LOG (INFO) << "Opened transaction database " << file;
  SetupSchema ();
}

SQLiteTransactionStore::~SQLiteTransactionStore ()
{
  if (db != nullptr)
    sqlite3_close (db);
}

void
SQLiteTransactionStore::Execute (const std::string& sql)
{
  char* err = nullptr;
  const int rc = sqlite3_exec (db, sql.c_str (), nullptr, nullptr, &err);
  if (rc != SQLITE_OK)
    {
      const std::string msg = (err != nullptr ? err : "exec failed");
      sqlite3_free (err);
      throw StoreError (msg);
    }
}

void
SQLiteTransactionStore::SetupSchema ()
{
  /* The id is not a primary key here.  Uniqueness is enforced when records
     are created, and Get reports all rows it finds so that a violation
     is detected instead of hidden.  */
  Execute (R"(
    PRAGMA journal_mode = WAL;

    CREATE TABLE IF NOT EXISTS `transactions` (
      `id` TEXT NOT NULL,
      `payer_id` TEXT NOT NULL,
      `payee_id` TEXT NOT NULL,
      `part_id` TEXT NOT NULL,
      `subscription_id` TEXT NOT NULL,
      `data` BLOB NOT NULL
    );

    CREATE INDEX IF NOT EXISTS `transactions_id`
      ON `transactions` (`id`);
    CREATE INDEX IF NOT EXISTS `transactions_payer`
      ON `transactions` (`payer_id`);
    CREATE INDEX IF NOT EXISTS `transactions_payee`
      ON `transactions` (`payee_id`);
    CREATE INDEX IF NOT EXISTS `transactions_part`
      ON `transactions` (`part_id`);
    CREATE INDEX IF NOT EXISTS `transactions_subscription`
      ON `transactions` (`subscription_id`);
  )");
}

void
SQLiteTransactionStore::Store (const proto::Transaction& tx)
{
  std::lock_guard<std::mutex> lock(mut);
  VLOG (2) << "Storing transaction " << tx.id ();

  Execute ("BEGIN");
  try
    {
      Statement update(db, R"(
        UPDATE `transactions`
          SET `payer_id` = ?2, `payee_id` = ?3, `part_id` = ?4,
              `subscription_id` = ?5, `data` = ?6
          WHERE `id` = ?1
      )");
      BindRecord (update, tx);
      CHECK (!update.Step ());

      if (sqlite3_changes (db) == 0)
        InsertRow (db, tx);

      Execute ("COMMIT");
    }
  catch (const StoreError&)
    {
      LOG (WARNING) << "Rolling back failed store of " << tx.id ();
      if (sqlite3_exec (db, "ROLLBACK", nullptr, nullptr, nullptr)
            != SQLITE_OK)
        LOG (ERROR) << "Rollback failed: " << sqlite3_errmsg (db);
      throw;
    }
}

std::vector<proto::Transaction>
SQLiteTransactionStore::Get (const std::string& field,
                             const std::string& value)
{
  if (QUERYABLE_FIELDS.count (field) == 0)
    throw StoreError ("cannot query transactions by field " + field);

  std::lock_guard<std::mutex> lock(mut);

  /* The field name has been validated above, so it is safe to just put
     it into the query string.  */
  std::ostringstream sql;
  sql << "SELECT `data` FROM `transactions` WHERE `" << field << "` = ?1"
      << " ORDER BY `rowid`";

  Statement stmt(db, sql.str ());
  stmt.Bind (1, value);

  std::vector<proto::Transaction> res;
  while (stmt.Step ())
    {
      proto::Transaction tx;
      if (!tx.ParseFromString (stmt.GetBlob (0)))
        throw StoreError ("failed to parse stored transaction for "
                            + field + " = " + value);
      res.push_back (std::move (tx));
    }

  return res;
}

void
SQLiteTransactionStore::InsertForTesting (const proto::Transaction& tx)
{
  std::lock_guard<std::mutex> lock(mut);
  InsertRow (db, tx);
}

} // namespace settler
