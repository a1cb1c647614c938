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

#ifndef SETTLER_RPCCLIENT_HPP
#define SETTLER_RPCCLIENT_HPP

#include <jsonrpccpp/client.h>
#include <jsonrpccpp/client/connectors/httpclient.h>

#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace settler
{

/**
 * Wrapper around a jsonrpcstub-generated client class, which can be used
 * from many threads at the same time.  Each calling thread gets its own
 * HTTP connector and client instance, created when it first uses
 * the wrapper.
 *
 * Phase requests for different transactions are processed concurrently
 * by the RPC server's worker threads, and all of them may call out to
 * the asset service through one instance of this.
 */
template <typename T>
  class RpcClient
{

private:

  /**
   * HTTP connector and client used by one thread.  The client holds
   * a reference to the connector, so they are kept together.
   */
  struct Connection
  {

    jsonrpc::HttpClient http;
    T rpc;

    explicit Connection (const std::string& ep, const int timeoutMs)
      : http(ep), rpc(http, jsonrpc::JSONRPC_CLIENT_V2)
    {
      if (timeoutMs > 0)
        http.SetTimeout (timeoutMs);
    }

    Connection () = delete;
    Connection (const Connection&) = delete;
    void operator= (const Connection&) = delete;

  };

  /** The JSON-RPC HTTP endpoint to use.  */
  const std::string endpoint;

  /** Timeout for the HTTP calls in milliseconds (zero for the default).  */
  const int timeout;

  /** The connections per thread.  */
  std::map<std::thread::id, Connection> connections;

  /** Mutex protecting the map.  */
  std::mutex mut;

public:

  /**
   * Constructs the wrapper for the given endpoint.  If timeoutMs is
   * positive, it is set as timeout on all HTTP connections.
   */
  explicit RpcClient (const std::string& ep, const int timeoutMs = 0)
    : endpoint(ep), timeout(timeoutMs)
  {}

  RpcClient () = delete;
  RpcClient (const RpcClient<T>&) = delete;
  void operator= (const RpcClient<T>&) = delete;

  /**
   * Returns the client instance for the calling thread.
   */
  T& operator* ();

  T*
  operator-> ()
  {
    return &(this->operator* ());
  }

  /**
   * Returns the endpoint this is calling.
   */
  const std::string&
  GetEndpoint () const
  {
    return endpoint;
  }

};

} // namespace settler

#include "rpcclient.tpp"

#endif // SETTLER_RPCCLIENT_HPP
