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

#ifndef SETTLER_CALLBACKURIS_HPP
#define SETTLER_CALLBACKURIS_HPP

#include "phase.hpp"
#include "transaction.hpp"

#include <string>

namespace settler
{

/** The path at which the ledger posts its phase callbacks.  */
extern const char* const CALLBACK_PATH;

/**
 * Builds the URI the remote ledger should call for the given phase
 * of a transaction.  The scheme and authority (host and port) are taken
 * from the base URI; path, query and fragment of it are replaced
 * by CALLBACK_PATH and the "id" and "state" query parameters.
 *
 * Throws std::invalid_argument if the base URI has no scheme or authority.
 */
std::string BuildPhaseUri (const std::string& baseUri,
                           const TransactionId& id, Phase phase);

inline std::string
BuildEnactUri (const std::string& baseUri, const TransactionId& id)
{
  return BuildPhaseUri (baseUri, id, Phase::ENACT);
}

inline std::string
BuildConsumeUri (const std::string& baseUri, const TransactionId& id)
{
  return BuildPhaseUri (baseUri, id, Phase::CONSUME);
}

inline std::string
BuildCancelUri (const std::string& baseUri, const TransactionId& id)
{
  return BuildPhaseUri (baseUri, id, Phase::CANCEL);
}

} // namespace settler

#endif // SETTLER_CALLBACKURIS_HPP
