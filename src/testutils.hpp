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

#ifndef SETTLER_TESTUTILS_HPP
#define SETTLER_TESTUTILS_HPP

#include "assetcallback.hpp"
#include "private/registry.hpp"
#include "proto/transaction.pb.h"
#include "sqlitestore.hpp"

#include <json/json.h>

#include <glog/logging.h>
#include <gmock/gmock.h>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/message_differencer.h>

#include <atomic>
#include <string>

namespace settler
{

/**
 * Sleeps some short amount of time, which we use to let background
 * threads do their work in tests.
 */
void SleepSome ();

/**
 * Parses a string to JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Parses a protocol buffer from text format.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res));
  return res;
}

#define DEFINE_PROTO_MATCHER(name, type) \
  MATCHER_P (name, str, "") \
  { \
    const auto expected = ParseTextProto<proto::type> (str);\
    if (google::protobuf::util::MessageDifferencer::Equals (arg, expected)) \
      return true; \
    *result_listener << "actual: " << arg.DebugString (); \
    return false; \
  }

DEFINE_PROTO_MATCHER (EqualsTransaction, Transaction)

/**
 * Returns the data for a new transaction (as passed to creation) with
 * the given id and some arbitrary other fields.
 */
proto::Transaction NewTransactionData (const std::string& id);

/**
 * AssetCallback with gmock'ed methods.  By default, all of them succeed
 * with an empty message.
 */
class MockAssetCallback : public AssetCallback
{

public:

  MockAssetCallback ();

  MOCK_METHOD2 (EnactHold, bool (const proto::Transaction& tx,
                                 std::string& msg));
  MOCK_METHOD2 (ConsumeHold, bool (const proto::Transaction& tx,
                                   std::string& msg));
  MOCK_METHOD2 (CancelHold, bool (const proto::Transaction& tx,
                                  std::string& msg));

};

/**
 * In-memory SQLite store, for which writes can be made to fail on demand
 * and which counts the writes done.
 */
class TestStore : public SQLiteTransactionStore
{

private:

  /** When set, Store throws instead of writing.  */
  std::atomic<bool> failing;

  /** Number of successful writes.  */
  std::atomic<unsigned> writes;

public:

  TestStore ()
    : SQLiteTransactionStore(":memory:"), failing(false), writes(0)
  {}

  void
  SetFailing (const bool f)
  {
    failing = f;
  }

  unsigned
  GetWrites () const
  {
    return writes;
  }

  void Store (const proto::Transaction& tx) override;

  /**
   * Returns the single stored row for the given id.  Fails the test
   * if there is not exactly one.
   */
  proto::Transaction GetStored (const std::string& id);

};

/**
 * TransactionRegistry with a mock clock, which stays at a fixed time
 * unless it is explicitly changed.
 */
class TestRegistry : public TransactionRegistry
{

private:

  /** The current mock time.  */
  std::atomic<int64_t> mockTime;

protected:

  int64_t
  GetCurrentTimeImpl () const override
  {
    return mockTime;
  }

public:

  /** The time at which the mock clock starts.  */
  static constexpr int64_t START_TIME = 1'600'000'000'000;

  explicit TestRegistry (TransactionStore& s)
    : TransactionRegistry(s), mockTime(START_TIME)
  {}

  void
  AdvanceTime (const int64_t ms)
  {
    mockTime += ms;
  }

};

} // namespace settler

#endif // SETTLER_TESTUTILS_HPP
