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

#include "rpcserver.hpp"

#include "json.hpp"
#include "proto/transaction.pb.h"
#include "transactionstore.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

namespace settler
{

namespace
{

/**
 * Error code returned when creating a transaction with an existing id.
 */
constexpr int ERROR_TRANSACTION_EXISTS = -1;

/**
 * Runs the given function and translates failures of the store into
 * JSON-RPC internal errors.
 */
template <typename Fcn>
  Json::Value
  WithStoreErrors (const Fcn& f)
{
  try
    {
      return f ();
    }
  catch (const DataIntegrityError& exc)
    {
      LOG (ERROR) << "Data integrity failure: " << exc.what ();
      throw jsonrpc::JsonRpcException (
          jsonrpc::Errors::ERROR_RPC_INTERNAL_ERROR,
          std::string ("data integrity failure: ") + exc.what ());
    }
  catch (const StoreError& exc)
    {
      LOG (ERROR) << "Store failure: " << exc.what ();
      throw jsonrpc::JsonRpcException (
          jsonrpc::Errors::ERROR_RPC_INTERNAL_ERROR,
          std::string ("store failure: ") + exc.what ());
    }
}

} // anonymous namespace

void
RpcServer::Run ()
{
  std::unique_lock<std::mutex> lock(mutStop);
  shouldStop = false;

  StartListening ();

  while (!shouldStop)
    cvStop.wait (lock);

  StopListening ();
}

void
RpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";

  std::lock_guard<std::mutex> lock(mutStop);
  shouldStop = true;
  cvStop.notify_all ();
}

Json::Value
RpcServer::getstatus ()
{
  LOG (INFO) << "RPC method called: getstatus";

  const auto status = daemon.GetStatus ();

  Json::Value res(Json::objectValue);
  res["known"] = static_cast<Json::Int64> (status.known);
  res["pending"] = static_cast<Json::Int64> (status.pending);
  res["unpersisted"] = static_cast<Json::Int64> (status.unpersisted);

  return res;
}

Json::Value
RpcServer::processphase (const std::string& id, const std::string& state)
{
  LOG (INFO) << "RPC method called: processphase " << id << " " << state;

  return WithStoreErrors ([&] ()
    {
      std::string msg;
      const bool ok = daemon.ProcessPhase (id, state, msg);

      Json::Value res(Json::objectValue);
      res["success"] = ok;
      res["message"] = msg;
      return res;
    });
}

Json::Value
RpcServer::createtransaction (const Json::Value& data)
{
  LOG (INFO) << "RPC method called: createtransaction\n" << data;

  proto::Transaction pb;
  if (!ProtoFromJson (data, pb))
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "invalid transaction data");

  return WithStoreErrors ([&] ()
    {
      proto::Transaction tx;
      if (!daemon.CreateTransaction (pb, tx))
        throw jsonrpc::JsonRpcException (ERROR_TRANSACTION_EXISTS,
                                         "transaction already exists");

      Json::Value res(Json::objectValue);
      res["id"] = tx.id ();
      res["enact"] = daemon.GetPhaseUri (tx.id (), Phase::ENACT);
      res["consume"] = daemon.GetPhaseUri (tx.id (), Phase::CONSUME);
      res["cancel"] = daemon.GetPhaseUri (tx.id (), Phase::CANCEL);
      return res;
    });
}

Json::Value
RpcServer::recordresponse (const std::string& id, const Json::Value& response)
{
  LOG (INFO) << "RPC method called: recordresponse " << id << "\n" << response;

  proto::Transaction pb;
  if (!ResponseFromJson (response, pb))
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "invalid response data");

  return WithStoreErrors ([&] ()
    {
      std::string msg;
      const bool ok = daemon.RecordResponse (id, pb, msg);

      Json::Value res(Json::objectValue);
      res["success"] = ok;
      res["message"] = msg;
      return res;
    });
}

Json::Value
RpcServer::gettransaction (const std::string& id)
{
  LOG (INFO) << "RPC method called: gettransaction " << id;

  return WithStoreErrors ([&] ()
    {
      proto::Transaction tx;
      if (!daemon.GetTransaction (id, tx))
        return Json::Value ();

      return ProtoToJson (tx);
    });
}

} // namespace settler
