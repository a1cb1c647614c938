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

#include "private/registry.hpp"

#include "phase.hpp"

#include <glog/logging.h>

#include <sstream>

namespace settler
{

int64_t
TransactionRegistry::GetCurrentTimeImpl () const
{
  using namespace std::chrono;
  const auto now = system_clock::now ().time_since_epoch ();
  return duration_cast<milliseconds> (now).count ();
}

std::shared_ptr<Record>
TransactionRegistry::LookupLocked (const RecordMap& m, std::mutex& mut,
                                   const TransactionId& id)
{
  std::lock_guard<std::mutex> lock(mut);
  const auto mit = m.find (id);
  if (mit == m.end ())
    return nullptr;
  return mit->second;
}

std::shared_ptr<Record>
TransactionRegistry::Get (const TransactionId& id)
{
  auto res = LookupLocked (known, mutKnown, id);
  if (res != nullptr)
    return res;

  /* A record that could not be persisted yet has a newer state than what
     the store would return.  */
  res = LookupLocked (unpersisted, mutUnpersisted, id);
  if (res != nullptr)
    {
      VLOG (1) << "Found unpersisted transaction " << id;
      return res;
    }

  VLOG (1) << "Looking up transaction " << id << " in the store";
  const auto rows = store.Get ("id", id);
  switch (rows.size ())
    {
    case 0:
      VLOG (1) << "No transaction matching " << id;
      return nullptr;

    case 1:
      break;

    default:
      {
        std::ostringstream msg;
        msg << "found " << rows.size () << " stored transactions for " << id;
        LOG (ERROR) << msg.str ();
        throw DataIntegrityError (msg.str ());
      }
    }

  const auto& tx = rows.front ();
  VLOG (1)
      << "Loaded transaction " << id << " in state "
      << StateToString (tx.state ());

  if (IsTerminal (tx.state ()))
    return std::make_shared<Record> (tx);

  std::lock_guard<std::mutex> lock(mutKnown);
  /* Someone else may have loaded it in the mean time, in which case
     their instance wins.  */
  const auto ins = known.emplace (id, std::make_shared<Record> (tx));
  return ins.first->second;
}

std::shared_ptr<Record>
TransactionRegistry::Create (const proto::Transaction& data)
{
  const TransactionId& id = data.id ();

  /* Cheap check outside any lock first.  This also covers transactions
     that are only in the store.  */
  if (Get (id) != nullptr)
    {
      LOG (WARNING) << "Transaction " << id << " exists already";
      return nullptr;
    }

  auto rec = std::make_shared<Record> (
      InitialiseTransaction (data, GetCurrentTime ()));

  /* Hold the fence while the record is not yet stored, so that no phase
     request can modify it before the initial state has been written.  */
  if (!TryClaim (id, rec))
    {
      LOG (WARNING) << "Transaction " << id << " is being processed already";
      return nullptr;
    }

  /* The transaction may have been created, finished and evicted by some
     other request since our lookup above, so check again now that the
     fence is ours.  */
  bool exists;
  try
    {
      exists = LookupLocked (unpersisted, mutUnpersisted, id) != nullptr
                  || !store.Get ("id", id).empty ();
    }
  catch (const StoreError&)
    {
      Release (id);
      throw;
    }
  if (exists)
    {
      LOG (WARNING) << "Transaction " << id << " was finished concurrently";
      Release (id);
      return nullptr;
    }

  bool inserted;
  {
    std::lock_guard<std::mutex> lock(mutKnown);
    inserted = known.emplace (id, rec).second;
  }
  if (!inserted)
    {
      LOG (WARNING) << "Transaction " << id << " was created concurrently";
      Release (id);
      return nullptr;
    }

  try
    {
      store.Store (rec->Snapshot ());
    }
  catch (const StoreError& exc)
    {
      LOG (ERROR)
          << "Failed to store new transaction " << id << ": " << exc.what ();
      Evict (id);
      Release (id);
      throw;
    }

  Release (id);

  LOG (INFO) << "Created transaction " << id;
  return rec;
}

bool
TransactionRegistry::RecordResponse (const TransactionId& id,
                                     const proto::Transaction& response,
                                     std::string& msg)
{
  VLOG (1) << "Ledger response for " << id << ":\n" << response.DebugString ();

  const auto rec = Get (id);
  if (rec == nullptr)
    {
      LOG (WARNING) << "Ledger response for unknown transaction " << id;
      msg = MSG_NOT_FOUND;
      return false;
    }

  if (!TryClaim (id, rec))
    {
      msg = MSG_PENDING;
      return false;
    }

  rec->Access ([&response] (proto::Transaction& tx)
    {
      ApplyResponse (response, tx);
    });
  LOG (INFO) << "Recorded ledger response for " << id;

  if (!Persist (rec))
    LOG (WARNING)
        << "Ledger response for " << id << " is only kept in memory"
        << " until the store can be written again";

  Release (id);

  msg.clear ();
  return true;
}

bool
TransactionRegistry::TryClaim (const TransactionId& id,
                               std::shared_ptr<Record> rec)
{
  std::lock_guard<std::mutex> lock(mutPending);
  const auto ins = pending.emplace (id, std::move (rec));
  if (!ins.second)
    {
      VLOG (1) << "Transaction " << id << " is already pending";
      return false;
    }

  VLOG (2) << "Claimed fence for " << id;
  return true;
}

void
TransactionRegistry::Release (const TransactionId& id)
{
  std::lock_guard<std::mutex> lock(mutPending);
  const auto num = pending.erase (id);
  CHECK_EQ (num, 1u) << "Fence for " << id << " was not claimed";
  VLOG (2) << "Released fence for " << id;
}

void
TransactionRegistry::Evict (const TransactionId& id)
{
  std::lock_guard<std::mutex> lock(mutKnown);
  known.erase (id);
  VLOG (1) << "Evicted transaction " << id << " from the cache";
}

bool
TransactionRegistry::Persist (const std::shared_ptr<Record>& rec)
{
  const auto tx = rec->Snapshot ();

  try
    {
      store.Store (tx);
    }
  catch (const StoreError& exc)
    {
      LOG (ERROR)
          << "Failed to store transaction " << tx.id ()
          << " in state " << StateToString (tx.state ())
          << ", will retry: " << exc.what ();

      std::lock_guard<std::mutex> lock(mutUnpersisted);
      unpersisted[tx.id ()] = rec;
      return false;
    }

  std::lock_guard<std::mutex> lock(mutUnpersisted);
  unpersisted.erase (tx.id ());
  return true;
}

size_t
TransactionRegistry::RetryUnpersisted ()
{
  RecordMap queued;
  {
    std::lock_guard<std::mutex> lock(mutUnpersisted);
    queued = unpersisted;
  }

  for (const auto& entry : queued)
    {
      if (!TryClaim (entry.first, entry.second))
        continue;

      if (Persist (entry.second))
        LOG (INFO) << "Stored previously failed transaction " << entry.first;

      Release (entry.first);
    }

  return CountUnpersisted ();
}

std::vector<proto::Transaction>
TransactionRegistry::GetStale (const std::chrono::milliseconds maxAge) const
{
  const int64_t cutoff = GetCurrentTime () - maxAge.count ();

  std::vector<std::shared_ptr<Record>> records;
  {
    std::lock_guard<std::mutex> lock(mutKnown);
    for (const auto& entry : known)
      records.push_back (entry.second);
  }

  std::vector<proto::Transaction> res;
  for (const auto& rec : records)
    rec->Read ([&res, cutoff] (const proto::Transaction& tx)
      {
        if (!IsTerminal (tx.state ()) && tx.created_time () <= cutoff)
          res.push_back (tx);
      });

  return res;
}

size_t
TransactionRegistry::CountKnown () const
{
  std::lock_guard<std::mutex> lock(mutKnown);
  return known.size ();
}

size_t
TransactionRegistry::CountPending () const
{
  std::lock_guard<std::mutex> lock(mutPending);
  return pending.size ();
}

size_t
TransactionRegistry::CountUnpersisted () const
{
  std::lock_guard<std::mutex> lock(mutUnpersisted);
  return unpersisted.size ();
}

} // namespace settler
