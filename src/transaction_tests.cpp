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

#include "transaction.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace settler
{
namespace
{

using TransactionTests = testing::Test;

TEST_F (TransactionTests, InitialiseResetsBookkeeping)
{
  const auto data = ParseTextProto<proto::Transaction> (R"(
    id: "tx"
    payer_id: "payer"
    payee_id: "payee"
    amount: 10
    submitted: true
    response_received: true
    response_success: true
    response_status: "ok"
    response_reason: "foo"
    payer_ending_balance: 42
    state: CONSUMED
    created_time: 1
    enacted_time: 2
    finished_time: 3
  )");

  EXPECT_THAT (InitialiseTransaction (data, 1'000), EqualsTransaction (R"(
    id: "tx"
    payer_id: "payer"
    payee_id: "payee"
    amount: 10
    submitted: false
    response_received: false
    response_success: false
    response_status: ""
    response_reason: ""
    payer_ending_balance: -1
    state: CREATED
    created_time: 1000
  )"));
}

TEST_F (TransactionTests, ApplyResponse)
{
  auto tx = InitialiseTransaction (NewTransactionData ("tx"), 1'000);
  tx.set_state (proto::Transaction::CONSUMED);
  tx.set_finished_time (2'000);
  auto expected = tx;

  ApplyResponse (ParseTextProto<proto::Transaction> (R"(
    submitted: true
  )"), tx);
  expected.set_submitted (true);
  EXPECT_THAT (tx, EqualsTransaction (expected.DebugString ()));

  /* Fields not in the response keep their values, and everything
     except for the bookkeeping is ignored.  */
  ApplyResponse (ParseTextProto<proto::Transaction> (R"(
    id: "other"
    amount: 1
    state: CANCELED
    response_received: true
    response_success: false
    response_status: "failed"
    response_reason: "insufficient balance"
    payer_ending_balance: 0
  )"), tx);
  expected.set_response_received (true);
  expected.set_response_success (false);
  expected.set_response_status ("failed");
  expected.set_response_reason ("insufficient balance");
  expected.set_payer_ending_balance (0);
  EXPECT_THAT (tx, EqualsTransaction (expected.DebugString ()));
}

TEST_F (TransactionTests, Terminal)
{
  EXPECT_FALSE (IsTerminal (proto::Transaction::CREATED));
  EXPECT_FALSE (IsTerminal (proto::Transaction::ENACTED));
  EXPECT_TRUE (IsTerminal (proto::Transaction::CONSUMED));
  EXPECT_TRUE (IsTerminal (proto::Transaction::CANCELED));
}

TEST_F (TransactionTests, StateToString)
{
  EXPECT_EQ (StateToString (proto::Transaction::CREATED), "created");
  EXPECT_EQ (StateToString (proto::Transaction::ENACTED), "enacted");
  EXPECT_EQ (StateToString (proto::Transaction::CONSUMED), "consumed");
  EXPECT_EQ (StateToString (proto::Transaction::CANCELED), "canceled");
}

TEST_F (TransactionTests, BooleanView)
{
  auto tx = ParseTextProto<proto::Transaction> ("state: CREATED");
  EXPECT_FALSE (IsEnacted (tx));
  EXPECT_FALSE (IsConsumed (tx));
  EXPECT_FALSE (IsCanceled (tx));

  tx = ParseTextProto<proto::Transaction> (R"(
    state: CONSUMED
    enacted_time: 10
    finished_time: 20
  )");
  EXPECT_TRUE (IsEnacted (tx));
  EXPECT_TRUE (IsConsumed (tx));
  EXPECT_FALSE (IsCanceled (tx));

  tx = ParseTextProto<proto::Transaction> (R"(
    state: CANCELED
    finished_time: 20
  )");
  EXPECT_FALSE (IsEnacted (tx));
  EXPECT_FALSE (IsConsumed (tx));
  EXPECT_TRUE (IsCanceled (tx));
}

TEST_F (TransactionTests, LocalId)
{
  uint32_t localId = 123;
  EXPECT_FALSE (TryGetLocalId (proto::Transaction (), localId));
  EXPECT_EQ (localId, 0u);

  ASSERT_TRUE (TryGetLocalId (
      ParseTextProto<proto::Transaction> ("local_id: 0"), localId));
  EXPECT_EQ (localId, 0u);

  ASSERT_TRUE (TryGetLocalId (
      ParseTextProto<proto::Transaction> ("local_id: 4294967295"), localId));
  EXPECT_EQ (localId, 4'294'967'295u);
}

} // anonymous namespace
} // namespace settler
