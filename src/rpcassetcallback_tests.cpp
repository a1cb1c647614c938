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

#include "rpcassetcallback.hpp"

#include "json.hpp"
#include "mockassets.hpp"
#include "testutils.hpp"

#include <jsonrpccpp/common/exception.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

namespace settler
{
namespace
{

using testing::Return;
using testing::Throw;

class RpcAssetCallbackTests : public testing::Test
{

protected:

  AssetServiceEnvironment env;
  RpcAssetCallback cb;

  /** The transaction we use for the calls.  */
  proto::Transaction tx;

  RpcAssetCallbackTests ()
    : cb(env.GetEndpoint ())
  {
    tx = NewTransactionData ("tx");
    tx.set_state (proto::Transaction::CREATED);
    tx.set_created_time (1'000);
  }

  MockAssetService&
  GetService ()
  {
    return env.GetService ();
  }

};

TEST_F (RpcAssetCallbackTests, ForwardsTransaction)
{
  EXPECT_CALL (GetService (), enacthold (ProtoToJson (tx)))
      .WillOnce (Return (ParseJson (R"({
        "success": true,
        "message": "held"
      })")));

  std::string msg;
  EXPECT_TRUE (cb.EnactHold (tx, msg));
  EXPECT_EQ (msg, "held");
}

TEST_F (RpcAssetCallbackTests, MethodsPerPhase)
{
  EXPECT_CALL (GetService (), consumehold (ProtoToJson (tx)))
      .WillOnce (Return (ParseJson (R"({
        "success": false,
        "message": "not delivered"
      })")));
  EXPECT_CALL (GetService (), cancelhold (ProtoToJson (tx)))
      .WillOnce (Return (ParseJson (R"({
        "success": true
      })")));

  std::string msg;
  EXPECT_FALSE (cb.ConsumeHold (tx, msg));
  EXPECT_EQ (msg, "not delivered");

  EXPECT_TRUE (cb.CancelHold (tx, msg));
  EXPECT_EQ (msg, "");
}

TEST_F (RpcAssetCallbackTests, InvalidReply)
{
  EXPECT_CALL (GetService (), enacthold (ProtoToJson (tx)))
      .WillOnce (Return (ParseJson ("true")))
      .WillOnce (Return (ParseJson (R"({"message": "foo"})")))
      .WillOnce (Return (ParseJson (R"({"success": "yes"})")))
      .WillOnce (Return (ParseJson (R"({"success": true, "message": 42})")));

  for (unsigned i = 0; i < 4; ++i)
    {
      std::string msg;
      EXPECT_FALSE (cb.EnactHold (tx, msg));
      EXPECT_EQ (msg, "invalid reply from asset service");
    }
}

TEST_F (RpcAssetCallbackTests, ServiceError)
{
  EXPECT_CALL (GetService (), cancelhold (ProtoToJson (tx)))
      .WillOnce (Throw (jsonrpc::JsonRpcException (-5, "no such hold")));

  std::string msg;
  EXPECT_FALSE (cb.CancelHold (tx, msg));
  EXPECT_EQ (msg, "asset service error: no such hold");
}

TEST (RpcAssetCallbackConnectionTests, ServiceUnreachable)
{
  std::ostringstream endpoint;
  endpoint << "http://localhost:" << GetPortForMockServer ();
  RpcAssetCallback cb(endpoint.str ());

  std::string msg;
  EXPECT_FALSE (cb.EnactHold (NewTransactionData ("tx"), msg));
  EXPECT_THAT (msg, testing::StartsWith ("asset service error: "));
}

} // anonymous namespace
} // namespace settler
