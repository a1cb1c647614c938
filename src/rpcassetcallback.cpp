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

#include "rpc-stubs/assetsrpcclient.h"

#include "json.hpp"
#include "private/rpcclient.hpp"

#include <jsonrpccpp/common/exception.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_int32 (settler_asset_rpc_timeout_ms, 10'000,
              "timeout in milliseconds for calls to the asset service");

namespace settler
{

class RpcAssetCallback::Impl
{

private:

  /** The RPC client for the asset service.  */
  RpcClient<AssetsRpcClient> rpc;

  /**
   * Type of a method on the RPC client that we call.
   */
  using Method = Json::Value (AssetsRpcClient::*) (const Json::Value&);

public:

  explicit Impl (const std::string& endpoint)
    : rpc(endpoint, FLAGS_settler_asset_rpc_timeout_ms)
  {}

  /**
   * Calls one of the RPC methods with the given transaction, and parses
   * the reply into success and message.
   */
  bool Call (const std::string& name, Method method,
             const proto::Transaction& tx, std::string& msg);

};

bool
RpcAssetCallback::Impl::Call (const std::string& name, const Method method,
                              const proto::Transaction& tx, std::string& msg)
{
  VLOG (1) << "Calling " << name << " for transaction " << tx.id ();

  Json::Value reply;
  try
    {
      reply = ((*rpc).*method) (ProtoToJson (tx));
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      LOG (ERROR)
          << "Asset service call " << name << " for transaction " << tx.id ()
          << " failed: " << exc.what ();
      msg = "asset service error: " + exc.GetMessage ();
      return false;
    }

  if (!reply.isObject () || !reply["success"].isBool ()
        || (reply.isMember ("message") && !reply["message"].isString ()))
    {
      LOG (ERROR)
          << "Invalid reply from asset service for " << name << ":\n"
          << reply;
      msg = "invalid reply from asset service";
      return false;
    }

  msg = reply.get ("message", "").asString ();
  const bool res = reply["success"].asBool ();

  VLOG (1)
      << "Asset service " << name << " for transaction " << tx.id ()
      << " returned " << res << ": " << msg;
  return res;
}

RpcAssetCallback::RpcAssetCallback (const std::string& endpoint)
  : impl(std::make_unique<Impl> (endpoint))
{
  LOG (INFO) << "Using asset service at " << endpoint;
}

RpcAssetCallback::~RpcAssetCallback () = default;

bool
RpcAssetCallback::EnactHold (const proto::Transaction& tx, std::string& msg)
{
  return impl->Call ("enacthold", &AssetsRpcClient::enacthold, tx, msg);
}

bool
RpcAssetCallback::ConsumeHold (const proto::Transaction& tx, std::string& msg)
{
  return impl->Call ("consumehold", &AssetsRpcClient::consumehold, tx, msg);
}

bool
RpcAssetCallback::CancelHold (const proto::Transaction& tx, std::string& msg)
{
  return impl->Call ("cancelhold", &AssetsRpcClient::cancelhold, tx, msg);
}

} // namespace settler
