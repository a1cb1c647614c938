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

#ifndef SETTLER_RPCASSETCALLBACK_HPP
#define SETTLER_RPCASSETCALLBACK_HPP

#include "assetcallback.hpp"

#include <memory>
#include <string>

namespace settler
{

/**
 * AssetCallback that forwards the hold operations to an external asset
 * service through JSON-RPC (methods "enacthold", "consumehold" and
 * "cancelhold").  Each gets the transaction as JSON and has to return
 * an object with "success" (bool) and "message" (string).
 *
 * Transport errors and malformed replies are turned into a failure of
 * the callback, so that the ledger sees a failed phase request.
 */
class RpcAssetCallback : public AssetCallback
{

private:

  class Impl;

  /** The RPC client, hidden in the .cpp file.  */
  std::unique_ptr<Impl> impl;

public:

  /**
   * Constructs the callback for an asset service at the given
   * JSON-RPC endpoint.
   */
  explicit RpcAssetCallback (const std::string& endpoint);

  ~RpcAssetCallback ();

  RpcAssetCallback () = delete;
  RpcAssetCallback (const RpcAssetCallback&) = delete;
  void operator= (const RpcAssetCallback&) = delete;

  bool EnactHold (const proto::Transaction& tx, std::string& msg) override;
  bool ConsumeHold (const proto::Transaction& tx, std::string& msg) override;
  bool CancelHold (const proto::Transaction& tx, std::string& msg) override;

};

} // namespace settler

#endif // SETTLER_RPCASSETCALLBACK_HPP
