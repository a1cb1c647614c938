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

#include "mockassets.hpp"

#include <sstream>

namespace settler
{

using testing::_;

int
GetPortForMockServer ()
{
  static unsigned cnt = 0;
  ++cnt;

  return 2'000 + (cnt % 1'000);
}

MockAssetService::MockAssetService (jsonrpc::AbstractServerConnector& conn)
  : AssetsRpcServerStub(conn)
{
  /* Tests set explicit expectations for the calls they need.  */
  EXPECT_CALL (*this, enacthold (_)).Times (0);
  EXPECT_CALL (*this, consumehold (_)).Times (0);
  EXPECT_CALL (*this, cancelhold (_)).Times (0);
}

AssetServiceEnvironment::AssetServiceEnvironment ()
  : port(GetPortForMockServer ()),
    httpServer(port),
    service(httpServer)
{
  service.StartListening ();
}

AssetServiceEnvironment::~AssetServiceEnvironment ()
{
  service.StopListening ();
}

std::string
AssetServiceEnvironment::GetEndpoint () const
{
  std::ostringstream out;
  out << "http://localhost:" << port;
  return out.str ();
}

} // namespace settler
