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

#include "daemon.hpp"

#include "callbackuris.hpp"
#include "private/intervaljob.hpp"
#include "private/processor.hpp"
#include "private/registry.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>

namespace settler
{

DEFINE_int64 (settler_persist_retry_ms, 30 * 1'000,
              "Interval (in milliseconds) for retrying to store transactions"
              " whose update could not be written");
DEFINE_int64 (settler_stale_check_ms, 5 * 60 * 1'000,
              "Interval (in milliseconds) for checking for stale holds");
DEFINE_int64 (settler_stale_age_ms, 60 * 60 * 1'000,
              "Age (in milliseconds) after which an unfinished transaction"
              " is reported as stale");

/* ************************************************************************** */

/**
 * Actual implementation of the Daemon.
 */
class Daemon::Impl
{

private:

  /** The asset callback used for phase requests.  */
  AssetCallback& callback;

  /** Base URI for building callback URIs.  */
  const std::string callbackBase;

  /** The registry of transactions.  */
  TransactionRegistry registry;

  /** Processor for phase requests.  */
  PhaseProcessor processor;

  /** Job retrying to store unpersisted records.  */
  std::unique_ptr<IntervalJob> persistRetrier;

  /** Job warning about stale transactions.  */
  std::unique_ptr<IntervalJob> staleChecker;

  /**
   * Logs warnings for all transactions that have not been finished
   * after the configured age.
   */
  void CheckStale () const;

  friend class Daemon;

public:

  explicit Impl (TransactionStore& s, AssetCallback& cb,
                 const std::string& base);

  Impl () = delete;
  Impl (const Impl&) = delete;
  void operator= (const Impl&) = delete;

};

Daemon::Impl::Impl (TransactionStore& s, AssetCallback& cb,
                    const std::string& base)
  : callback(cb), callbackBase(base),
    registry(s), processor(registry)
{
  /* Fail early on a broken base URI, rather than on the first created
     transaction.  */
  const std::string testUri = BuildEnactUri (callbackBase, "test");
  VLOG (1) << "Callback URIs look like this: " << testUri;

  const std::chrono::milliseconds retryIntv(FLAGS_settler_persist_retry_ms);
  persistRetrier = std::make_unique<IntervalJob> ("persist-retry", retryIntv,
                                                  [this] ()
    {
      const size_t left = registry.RetryUnpersisted ();
      if (left > 0)
        LOG (WARNING) << left << " transactions are still not stored";
    });

  const std::chrono::milliseconds staleIntv(FLAGS_settler_stale_check_ms);
  staleChecker = std::make_unique<IntervalJob> ("stale-check", staleIntv,
                                                [this] ()
    {
      CheckStale ();
    });
}

void
Daemon::Impl::CheckStale () const
{
  const std::chrono::milliseconds maxAge(FLAGS_settler_stale_age_ms);
  const int64_t now = registry.GetCurrentTime ();

  for (const auto& tx : registry.GetStale (maxAge))
    LOG (WARNING)
        << "Transaction " << tx.id () << " is still "
        << StateToString (tx.state ()) << " after "
        << (now - tx.created_time ()) / 1'000 << " seconds";
}

/* ************************************************************************** */

Daemon::Daemon (TransactionStore& store, AssetCallback& cb,
                const std::string& callbackBase)
  : impl(std::make_unique<Impl> (store, cb, callbackBase))
{}

Daemon::~Daemon () = default;

bool
Daemon::ProcessPhase (const TransactionId& id, const std::string& phase,
                      std::string& msg)
{
  return impl->processor.ProcessPhaseRequest (id, phase, impl->callback, msg);
}

bool
Daemon::CreateTransaction (const proto::Transaction& data,
                           proto::Transaction& tx)
{
  const auto rec = impl->registry.Create (data);
  if (rec == nullptr)
    return false;

  tx = rec->Snapshot ();
  return true;
}

bool
Daemon::RecordResponse (const TransactionId& id,
                        const proto::Transaction& response, std::string& msg)
{
  return impl->registry.RecordResponse (id, response, msg);
}

bool
Daemon::GetTransaction (const TransactionId& id, proto::Transaction& tx)
{
  const auto rec = impl->registry.Get (id);
  if (rec == nullptr)
    return false;

  tx = rec->Snapshot ();
  return true;
}

std::string
Daemon::GetPhaseUri (const TransactionId& id, const Phase phase) const
{
  return BuildPhaseUri (impl->callbackBase, id, phase);
}

Daemon::Status
Daemon::GetStatus () const
{
  Status res;
  res.known = impl->registry.CountKnown ();
  res.pending = impl->registry.CountPending ();
  res.unpersisted = impl->registry.CountUnpersisted ();
  return res;
}

} // namespace settler
