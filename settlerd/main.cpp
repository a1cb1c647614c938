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

#include "daemon.hpp"
#include "rpcassetcallback.hpp"
#include "rpcserver.hpp"
#include "sqlitestore.hpp"

#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

DEFINE_int32 (rpc_port, 0,
              "the port at which Settler's JSON-RPC server will be started");

DEFINE_string (datafile, "",
               "SQLite database file in which transactions are stored");

DEFINE_string (asset_rpc_url, "",
               "URL at which the asset service's JSON-RPC interface"
               " is available");

DEFINE_string (callback_base_uri, "",
               "base URI of the external HTTP frontend that receives the"
               " ledger's phase callbacks and forwards them to processphase;"
               " the callback URIs handed out to the ledger are built on it");

/**
 * Exception thrown for usage errors (won't be logged).
 */
class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Run the Settler daemon");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  try
    {
      if (FLAGS_rpc_port == 0)
        throw UsageError ("--rpc_port must be set");
      if (FLAGS_datafile.empty ())
        throw UsageError ("--datafile must be set");
      if (FLAGS_asset_rpc_url.empty ())
        throw UsageError ("--asset_rpc_url must be set");
      if (FLAGS_callback_base_uri.empty ())
        throw UsageError ("--callback_base_uri must be set");

      settler::SQLiteTransactionStore store(FLAGS_datafile);
      settler::RpcAssetCallback assets(FLAGS_asset_rpc_url);

      settler::Daemon daemon(store, assets, FLAGS_callback_base_uri);

      jsonrpc::HttpServer httpServer(FLAGS_rpc_port);
      httpServer.BindLocalhost ();
      settler::RpcServer server(daemon, httpServer);

      LOG (INFO) << "Starting JSON-RPC interface on port " << FLAGS_rpc_port;
      server.Run ();

      return EXIT_SUCCESS;
    }
  catch (const UsageError& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR) << exc.what ();
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
}
