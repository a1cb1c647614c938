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

#ifndef SETTLER_ASSETCALLBACK_HPP
#define SETTLER_ASSETCALLBACK_HPP

#include "proto/transaction.pb.h"

#include <string>

namespace settler
{

/**
 * This interface is implemented by whatever actually holds, delivers and
 * undoes the asset that a transaction pays for (e.g. giving an object
 * to the buyer, or crediting a subscription).  It is the application-specific
 * part that is plugged into the phase processing.
 *
 * Each method gets the full transaction record, and returns true if the
 * phase was handled successfully.  In any case, msg can be set to a message
 * that is passed on to the remote ledger.  The result is trusted as is.
 *
 * The phase processing guarantees that for a given transaction, each method
 * is called at most once successfully, and that no two methods are called
 * concurrently.  Calls for different transactions may happen concurrently
 * from multiple threads, though, so implementations must be thread-safe.
 * They also must not block indefinitely.
 */
class AssetCallback
{

public:

  AssetCallback () = default;
  virtual ~AssetCallback () = default;

  /**
   * Places the hold on the asset after the ledger has reserved the
   * funds for the transfer.
   */
  virtual bool EnactHold (const proto::Transaction& tx, std::string& msg) = 0;

  /**
   * Finalises the hold, i.e. completes the delivery.  This is only called
   * after a successful EnactHold.
   */
  virtual bool ConsumeHold (const proto::Transaction& tx,
                            std::string& msg) = 0;

  /**
   * Releases the hold without completing the transfer.  This may be called
   * also if EnactHold was never called or failed, in which case the
   * implementation has to figure out what (if anything) needs to be undone.
   */
  virtual bool CancelHold (const proto::Transaction& tx, std::string& msg) = 0;

};

} // namespace settler

#endif // SETTLER_ASSETCALLBACK_HPP
