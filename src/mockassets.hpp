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

#ifndef SETTLER_MOCKASSETS_HPP
#define SETTLER_MOCKASSETS_HPP

#include "rpc-stubs/assetsrpcserverstub.h"

#include <json/json.h>
#include <jsonrpccpp/server.h>
#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gmock/gmock.h>

#include <string>

namespace settler
{

/**
 * Utility method for generating server ports to be used.  It uses an
 * internal call counter to cycle through some range, which should be good
 * enough to find free ports even if more than one mock server are running
 * at the same time.
 */
int GetPortForMockServer ();

/**
 * Mock asset service.  All methods are gmock'ed, and by default they
 * are not expected to be called at all.
 */
class MockAssetService : public AssetsRpcServerStub
{

public:

  explicit MockAssetService (jsonrpc::AbstractServerConnector& conn);

  MOCK_METHOD1 (enacthold, Json::Value (const Json::Value& transaction));
  MOCK_METHOD1 (consumehold, Json::Value (const Json::Value& transaction));
  MOCK_METHOD1 (cancelhold, Json::Value (const Json::Value& transaction));

};

/**
 * Runs a MockAssetService on a real HTTP server on some local port.
 */
class AssetServiceEnvironment
{

private:

  /** Port for the server.  */
  const int port;

  /** HTTP server used.  */
  jsonrpc::HttpServer httpServer;

  /** The mock service.  */
  MockAssetService service;

public:

  AssetServiceEnvironment ();
  ~AssetServiceEnvironment ();

  AssetServiceEnvironment (const AssetServiceEnvironment&) = delete;
  void operator= (const AssetServiceEnvironment&) = delete;

  MockAssetService&
  GetService ()
  {
    return service;
  }

  /**
   * Returns the HTTP endpoint at which the service is reachable.
   */
  std::string GetEndpoint () const;

};

} // namespace settler

#endif // SETTLER_MOCKASSETS_HPP
