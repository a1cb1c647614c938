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

#ifndef SETTLER_RPCSERVER_HPP
#define SETTLER_RPCSERVER_HPP

#include "daemon.hpp"
#include "rpc-stubs/settlerrpcserverstub.h"

#include <json/json.h>
#include <jsonrpccpp/server.h>

#include <condition_variable>
#include <mutex>

namespace settler
{

/**
 * JSON-RPC server of the Settler daemon.  It receives the phase requests
 * of the ledger, and allows the local application to create and
 * inspect transactions.
 */
class RpcServer : public SettlerRpcServerStub
{

private:

  /** The Daemon this is for.  */
  Daemon& daemon;

  /** Flag set to indicate the server should shut down.  */
  bool shouldStop;

  /** Mutex for the stop flag.  */
  std::mutex mutStop;

  /** Condition variable for signalling "should stop".  */
  std::condition_variable cvStop;

public:

  explicit RpcServer (Daemon& d, jsonrpc::AbstractServerConnector& conn)
    : SettlerRpcServerStub(conn), daemon(d)
  {}

  RpcServer () = delete;
  RpcServer (const RpcServer&) = delete;
  void operator= (const RpcServer&) = delete;

  /**
   * Starts the server and blocks until it gets shut down again.
   */
  void Run ();

  void stop () override;
  Json::Value getstatus () override;

  Json::Value processphase (const std::string& id,
                            const std::string& state) override;

  Json::Value createtransaction (const Json::Value& data) override;
  Json::Value recordresponse (const std::string& id,
                              const Json::Value& response) override;
  Json::Value gettransaction (const std::string& id) override;

};

} // namespace settler

#endif // SETTLER_RPCSERVER_HPP
