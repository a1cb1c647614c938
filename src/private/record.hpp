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

#ifndef SETTLER_RECORD_HPP
#define SETTLER_RECORD_HPP

#include "proto/transaction.pb.h"

#include <mutex>

namespace settler
{

/**
 * A transaction record held in memory by the registry.  The fence ensures
 * that only one phase handler modifies a record at any time, but status
 * queries may still read it concurrently.  Hence all access goes through
 * the record's own mutex.
 */
class Record
{

private:

  /** The record data.  */
  proto::Transaction data;

  /** Lock for the data.  */
  mutable std::mutex mut;

public:

  explicit Record (const proto::Transaction& d)
    : data(d)
  {}

  Record () = delete;
  Record (const Record&) = delete;
  void operator= (const Record&) = delete;

  /**
   * Calls f with a mutable reference to the data, while holding the lock.
   */
  template <typename Fcn>
    void
    Access (const Fcn& f)
  {
    std::lock_guard<std::mutex> lock(mut);
    f (data);
  }

  /**
   * Calls f with the data in read-only form, while holding the lock.
   */
  template <typename Fcn>
    void
    Read (const Fcn& f) const
  {
    std::lock_guard<std::mutex> lock(mut);
    f (data);
  }

  /**
   * Returns a copy of the current data.
   */
  proto::Transaction
  Snapshot () const
  {
    std::lock_guard<std::mutex> lock(mut);
    return data;
  }

};

} // namespace settler

#endif // SETTLER_RECORD_HPP
