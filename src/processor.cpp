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

#include "private/processor.hpp"

#include <glog/logging.h>

namespace settler
{

namespace
{

/**
 * Holds the pending fence of a transaction and releases it when
 * going out of scope.
 */
class FenceGuard
{

private:

  TransactionRegistry& registry;
  const TransactionId id;

public:

  explicit FenceGuard (TransactionRegistry& r, const TransactionId& i)
    : registry(r), id(i)
  {}

  ~FenceGuard ()
  {
    registry.Release (id);
  }

  FenceGuard () = delete;
  FenceGuard (const FenceGuard&) = delete;
  void operator= (const FenceGuard&) = delete;

};

} // anonymous namespace

bool
PhaseProcessor::InvokeCallback (AssetCallback& cb, const Phase phase,
                                const proto::Transaction& tx, std::string& msg)
{
  switch (phase)
    {
    case Phase::ENACT:
      return cb.EnactHold (tx, msg);
    case Phase::CONSUME:
      return cb.ConsumeHold (tx, msg);
    case Phase::CANCEL:
      return cb.CancelHold (tx, msg);
    default:
      LOG (FATAL) << "Invalid phase: " << static_cast<int> (phase);
    }
}

bool
PhaseProcessor::RunPhase (const std::shared_ptr<Record>& rec,
                          const Phase phase, AssetCallback& cb,
                          std::string& msg)
{
  const proto::Transaction tx = rec->Snapshot ();
  const std::string phaseStr = PhaseToString (phase);

  switch (CheckTransition (tx.state (), phase, msg))
    {
    case Disposition::DONE:
      VLOG (1)
          << "Repeated " << phaseStr << " for " << tx.id ()
          << ": " << msg;
      return true;

    case Disposition::REJECT:
      LOG (WARNING)
          << "Rejected " << phaseStr << " for " << tx.id ()
          << " in state " << StateToString (tx.state ()) << ": " << msg;
      return false;

    case Disposition::PROCEED:
      break;

    default:
      LOG (FATAL) << "Unexpected disposition";
    }

  /* The callback may be slow, so it gets the snapshot and no lock
     is held while it runs.  The fence keeps others away.  */
  msg.clear ();
  if (!InvokeCallback (cb, phase, tx, msg))
    {
      LOG (WARNING)
          << "Asset callback failed for " << phaseStr << " of " << tx.id ()
          << ": " << msg;
      return false;
    }

  const int64_t now = registry.GetCurrentTime ();
  rec->Access ([phase, now] (proto::Transaction& data)
    {
      data.set_state (NextState (phase));
      if (phase == Phase::ENACT)
        {
          CHECK (!data.has_enacted_time ());
          data.set_enacted_time (now);
        }
      else
        {
          CHECK (!data.has_finished_time ());
          data.set_finished_time (now);
        }
    });

  LOG (INFO)
      << "Transaction " << tx.id () << " is now "
      << StateToString (NextState (phase));
  if (VLOG_IS_ON (2))
    rec->Read ([] (const proto::Transaction& data)
      {
        VLOG (2) << "Updated record:\n" << data.DebugString ();
      });

  if (!registry.Persist (rec))
    LOG (WARNING)
        << "State change of " << tx.id () << " is only kept in memory"
        << " until the store can be written again";

  return true;
}

bool
PhaseProcessor::ProcessPhaseRequest (const TransactionId& id,
                                     const std::string& phaseName,
                                     AssetCallback& cb, std::string& msg)
{
  VLOG (1) << "Phase request " << phaseName << " for " << id;

  auto rec = registry.Get (id);
  if (rec == nullptr)
    {
      LOG (WARNING) << "Phase request for unknown transaction " << id;
      msg = MSG_NOT_FOUND;
      return false;
    }

  if (!registry.TryClaim (id, rec))
    {
      msg = MSG_PENDING;
      return false;
    }
  FenceGuard fence(registry, id);

  Phase phase;
  if (!ParsePhase (phaseName, phase))
    {
      LOG (WARNING)
          << "Unrecognized phase request " << phaseName << " for " << id;
      msg = MSG_UNRECOGNIZED;
      return false;
    }

  const bool res = RunPhase (rec, phase, cb, msg);

  if (res && phase != Phase::ENACT)
    registry.Evict (id);

  return res;
}

} // namespace settler
