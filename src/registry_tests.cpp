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

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace settler
{
namespace
{

using testing::ElementsAre;
using testing::IsEmpty;

class RegistryTests : public testing::Test
{

protected:

  TestStore store;
  TestRegistry registry;

  RegistryTests ()
    : registry(store)
  {}

  /**
   * Creates a transaction with the given id, expecting success.
   */
  std::shared_ptr<Record>
  CreateTx (const std::string& id)
  {
    auto res = registry.Create (NewTransactionData (id));
    CHECK (res != nullptr);
    return res;
  }

  /**
   * Changes the state of a record, as the processor does after
   * a successful callback.
   */
  static void
  SetState (Record& rec, const proto::Transaction::State state)
  {
    rec.Access ([state] (proto::Transaction& tx)
      {
        tx.set_state (state);
      });
  }

};

TEST_F (RegistryTests, CreateInitialises)
{
  auto data = NewTransactionData ("tx");
  data.set_state (proto::Transaction::CONSUMED);
  data.set_response_status ("ignored");

  const auto rec = registry.Create (data);
  ASSERT_NE (rec, nullptr);

  const auto tx = rec->Snapshot ();
  EXPECT_EQ (tx.id (), "tx");
  EXPECT_EQ (tx.state (), proto::Transaction::CREATED);
  EXPECT_EQ (tx.created_time (), TestRegistry::START_TIME);
  EXPECT_EQ (tx.response_status (), "");
  EXPECT_EQ (tx.amount (), 250);

  EXPECT_EQ (registry.CountKnown (), 1u);
  EXPECT_EQ (registry.CountPending (), 0u);
  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::CREATED);
}

TEST_F (RegistryTests, CreateIsUnique)
{
  const auto first = CreateTx ("tx");
  EXPECT_EQ (registry.Create (NewTransactionData ("tx")), nullptr);

  EXPECT_EQ (registry.Get ("tx"), first);
  EXPECT_EQ (store.Get ("id", "tx").size (), 1u);
}

TEST_F (RegistryTests, CreateUniqueAgainstStore)
{
  store.Store (ParseTextProto<proto::Transaction> (R"(
    id: "tx"
    state: CONSUMED
  )"));

  EXPECT_EQ (registry.Create (NewTransactionData ("tx")), nullptr);
  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::CONSUMED);
}

TEST_F (RegistryTests, CreateWhileFenced)
{
  /* Someone holds the fence for an id that is not known otherwise.  */
  ASSERT_TRUE (registry.TryClaim ("tx", nullptr));
  EXPECT_EQ (registry.Create (NewTransactionData ("tx")), nullptr);
  EXPECT_EQ (registry.CountKnown (), 0u);
  registry.Release ("tx");
}

TEST_F (RegistryTests, CreateStoreFailure)
{
  store.SetFailing (true);
  EXPECT_THROW (registry.Create (NewTransactionData ("tx")), StoreError);

  EXPECT_EQ (registry.CountKnown (), 0u);
  EXPECT_EQ (registry.CountPending (), 0u);
  EXPECT_EQ (registry.CountUnpersisted (), 0u);

  store.SetFailing (false);
  EXPECT_EQ (registry.Get ("tx"), nullptr);
  EXPECT_NE (registry.Create (NewTransactionData ("tx")), nullptr);
}

TEST_F (RegistryTests, GetUnknown)
{
  EXPECT_EQ (registry.Get ("nonexistent"), nullptr);
  EXPECT_EQ (registry.CountKnown (), 0u);
}

TEST_F (RegistryTests, GetLoadsActiveFromStore)
{
  store.Store (ParseTextProto<proto::Transaction> (R"(
    id: "tx"
    state: ENACTED
    enacted_time: 10
  )"));

  const auto rec = registry.Get ("tx");
  ASSERT_NE (rec, nullptr);
  EXPECT_THAT (rec->Snapshot (), EqualsTransaction (R"(
    id: "tx"
    state: ENACTED
    enacted_time: 10
  )"));

  EXPECT_EQ (registry.CountKnown (), 1u);
  EXPECT_EQ (registry.Get ("tx"), rec);
}

TEST_F (RegistryTests, TerminalNotCached)
{
  store.Store (ParseTextProto<proto::Transaction> (R"(
    id: "tx"
    state: CANCELED
    finished_time: 10
  )"));

  const auto rec = registry.Get ("tx");
  ASSERT_NE (rec, nullptr);
  EXPECT_EQ (rec->Snapshot ().state (), proto::Transaction::CANCELED);
  EXPECT_EQ (registry.CountKnown (), 0u);

  const auto again = registry.Get ("tx");
  ASSERT_NE (again, nullptr);
  EXPECT_NE (again, rec);
}

TEST_F (RegistryTests, DuplicateRowsThrow)
{
  const auto tx = ParseTextProto<proto::Transaction> (R"(
    id: "tx"
    state: CREATED
  )");
  store.InsertForTesting (tx);
  store.InsertForTesting (tx);

  EXPECT_THROW (registry.Get ("tx"), DataIntegrityError);
  EXPECT_EQ (registry.CountKnown (), 0u);
}

TEST_F (RegistryTests, Fence)
{
  const auto rec = CreateTx ("tx");

  ASSERT_TRUE (registry.TryClaim ("tx", rec));
  EXPECT_EQ (registry.CountPending (), 1u);
  EXPECT_FALSE (registry.TryClaim ("tx", rec));

  /* Other ids are independent.  */
  ASSERT_TRUE (registry.TryClaim ("other", nullptr));
  registry.Release ("other");

  registry.Release ("tx");
  EXPECT_EQ (registry.CountPending (), 0u);
  EXPECT_TRUE (registry.TryClaim ("tx", rec));
  registry.Release ("tx");
}

TEST_F (RegistryTests, EvictKeepsStore)
{
  CreateTx ("tx");
  registry.Evict ("tx");
  EXPECT_EQ (registry.CountKnown (), 0u);

  const auto rec = registry.Get ("tx");
  ASSERT_NE (rec, nullptr);
  EXPECT_EQ (rec->Snapshot ().state (), proto::Transaction::CREATED);
}

TEST_F (RegistryTests, Persist)
{
  const auto rec = CreateTx ("tx");
  SetState (*rec, proto::Transaction::ENACTED);

  ASSERT_TRUE (registry.TryClaim ("tx", rec));
  EXPECT_TRUE (registry.Persist (rec));
  registry.Release ("tx");

  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::ENACTED);
  EXPECT_EQ (registry.CountUnpersisted (), 0u);
}

TEST_F (RegistryTests, PersistFailureIsRetried)
{
  const auto rec = CreateTx ("tx");
  SetState (*rec, proto::Transaction::CONSUMED);

  store.SetFailing (true);
  ASSERT_TRUE (registry.TryClaim ("tx", rec));
  EXPECT_FALSE (registry.Persist (rec));
  registry.Evict ("tx");
  registry.Release ("tx");
  EXPECT_EQ (registry.CountUnpersisted (), 1u);

  /* While queued, lookups see the in-memory state rather than the
     outdated stored one.  */
  EXPECT_EQ (registry.Get ("tx"), rec);

  EXPECT_EQ (registry.RetryUnpersisted (), 1u);
  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::CREATED);

  store.SetFailing (false);
  EXPECT_EQ (registry.RetryUnpersisted (), 0u);
  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::CONSUMED);

  const auto loaded = registry.Get ("tx");
  ASSERT_NE (loaded, nullptr);
  EXPECT_NE (loaded, rec);
  EXPECT_EQ (loaded->Snapshot ().state (), proto::Transaction::CONSUMED);
}

TEST_F (RegistryTests, RetrySkipsFencedRecords)
{
  const auto rec = CreateTx ("tx");
  SetState (*rec, proto::Transaction::ENACTED);

  store.SetFailing (true);
  ASSERT_TRUE (registry.TryClaim ("tx", rec));
  EXPECT_FALSE (registry.Persist (rec));
  store.SetFailing (false);

  EXPECT_EQ (registry.RetryUnpersisted (), 1u);
  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::CREATED);

  registry.Release ("tx");
  EXPECT_EQ (registry.RetryUnpersisted (), 0u);
  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::ENACTED);
}

TEST_F (RegistryTests, RecordResponse)
{
  CreateTx ("tx");

  std::string msg = "foo";
  ASSERT_TRUE (registry.RecordResponse ("tx",
      ParseTextProto<proto::Transaction> (R"(
        submitted: true
        response_received: true
        response_success: true
        response_status: "success"
        payer_ending_balance: 750
      )"), msg));
  EXPECT_EQ (msg, "");

  const auto tx = store.GetStored ("tx");
  EXPECT_TRUE (tx.submitted ());
  EXPECT_TRUE (tx.response_success ());
  EXPECT_EQ (tx.response_status (), "success");
  EXPECT_EQ (tx.response_reason (), "");
  EXPECT_EQ (tx.payer_ending_balance (), 750);
  EXPECT_EQ (tx.state (), proto::Transaction::CREATED);

  EXPECT_EQ (registry.Get ("tx")->Snapshot ().payer_ending_balance (), 750);
  EXPECT_EQ (registry.CountPending (), 0u);
}

TEST_F (RegistryTests, RecordResponseForFinished)
{
  const auto rec = CreateTx ("tx");
  SetState (*rec, proto::Transaction::CONSUMED);
  ASSERT_TRUE (registry.TryClaim ("tx", rec));
  ASSERT_TRUE (registry.Persist (rec));
  registry.Release ("tx");
  registry.Evict ("tx");

  std::string msg;
  ASSERT_TRUE (registry.RecordResponse ("tx",
      ParseTextProto<proto::Transaction> ("payer_ending_balance: 10"), msg));

  const auto tx = store.GetStored ("tx");
  EXPECT_EQ (tx.state (), proto::Transaction::CONSUMED);
  EXPECT_EQ (tx.payer_ending_balance (), 10);
  EXPECT_EQ (registry.CountKnown (), 0u);
}

TEST_F (RegistryTests, RecordResponseUnknownOrFenced)
{
  const auto response
      = ParseTextProto<proto::Transaction> ("payer_ending_balance: 10");
  std::string msg;

  EXPECT_FALSE (registry.RecordResponse ("tx", response, msg));
  EXPECT_EQ (msg, "no matching transaction found");

  const auto rec = CreateTx ("tx");
  const unsigned writes = store.GetWrites ();
  ASSERT_TRUE (registry.TryClaim ("tx", rec));
  EXPECT_FALSE (registry.RecordResponse ("tx", response, msg));
  EXPECT_EQ (msg, "pending");
  registry.Release ("tx");

  EXPECT_EQ (rec->Snapshot ().payer_ending_balance (), -1);
  EXPECT_EQ (store.GetWrites (), writes);
}

TEST_F (RegistryTests, RecordResponseStoreFailure)
{
  CreateTx ("tx");

  store.SetFailing (true);
  std::string msg;
  ASSERT_TRUE (registry.RecordResponse ("tx",
      ParseTextProto<proto::Transaction> ("submitted: true"), msg));
  EXPECT_EQ (registry.CountUnpersisted (), 1u);
  EXPECT_FALSE (store.GetStored ("tx").submitted ());

  store.SetFailing (false);
  EXPECT_EQ (registry.RetryUnpersisted (), 0u);
  EXPECT_TRUE (store.GetStored ("tx").submitted ());
}

/**
 * Test store that runs a hook right after the next lookup returns, which
 * lets tests interleave other operations with that lookup.
 */
class InterleavingStore : public TestStore
{

private:

  /** The hook to run after the next call to Get, if any.  */
  std::function<void ()> afterGet;

public:

  void
  SetAfterGet (const std::function<void ()>& f)
  {
    afterGet = f;
  }

  std::vector<proto::Transaction>
  Get (const std::string& field, const std::string& value) override
  {
    auto res = TestStore::Get (field, value);

    if (afterGet)
      {
        const auto hook = std::move (afterGet);
        afterGet = nullptr;
        hook ();
      }

    return res;
  }

};

class RegistryInterleavingTests : public testing::Test
{

protected:

  InterleavingStore store;
  TestRegistry registry;

  RegistryInterleavingTests ()
    : registry(store)
  {}

};

TEST_F (RegistryInterleavingTests, CreateAfterOtherFinished)
{
  /* While the second creation has looked up the id but not yet claimed
     the fence, the first transaction is created, consumed and evicted.  */
  store.SetAfterGet ([this] ()
    {
      const auto rec = registry.Create (NewTransactionData ("tx"));
      ASSERT_NE (rec, nullptr);

      ASSERT_TRUE (registry.TryClaim ("tx", rec));
      rec->Access ([] (proto::Transaction& tx)
        {
          tx.set_state (proto::Transaction::CONSUMED);
          tx.set_finished_time (1);
        });
      ASSERT_TRUE (registry.Persist (rec));
      registry.Release ("tx");
      registry.Evict ("tx");
    });

  EXPECT_EQ (registry.Create (NewTransactionData ("tx")), nullptr);

  EXPECT_EQ (store.GetStored ("tx").state (), proto::Transaction::CONSUMED);
  EXPECT_EQ (registry.CountKnown (), 0u);
  EXPECT_EQ (registry.CountPending (), 0u);
}

TEST_F (RegistryTests, GetStale)
{
  CreateTx ("old");
  const auto finished = CreateTx ("finished");
  SetState (*finished, proto::Transaction::CONSUMED);

  registry.AdvanceTime (5'000);
  const auto enacted = CreateTx ("enacted");
  SetState (*enacted, proto::Transaction::ENACTED);
  CreateTx ("new");

  registry.AdvanceTime (5'000);
  EXPECT_THAT (registry.GetStale (std::chrono::seconds (20)), IsEmpty ());

  const auto stale = registry.GetStale (std::chrono::seconds (8));
  ASSERT_EQ (stale.size (), 1u);
  EXPECT_EQ (stale[0].id (), "old");

  EXPECT_EQ (registry.GetStale (std::chrono::seconds (5)).size (), 3u);
}

} // anonymous namespace
} // namespace settler
