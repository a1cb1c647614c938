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

#ifndef SETTLER_PHASE_HPP
#define SETTLER_PHASE_HPP

#include "proto/transaction.pb.h"

#include <string>

namespace settler
{

/**
 * A phase of the protocol, as requested by the remote ledger through
 * a callback.
 */
enum class Phase
{
  ENACT,
  CONSUME,
  CANCEL,
};

/**
 * What should happen when a phase is requested for a transaction in
 * some state.
 */
enum class Disposition
{
  /** The asset callback needs to be invoked for the phase.  */
  PROCEED,
  /** The phase has been done already, report success without action.  */
  DONE,
  /** The request is out of order and has to fail.  */
  REJECT,
};

/* Messages returned for requests that do not reach the asset callback.
   The remote ledger inspects them, so they must not be changed.  */
extern const char* const MSG_PENDING;
extern const char* const MSG_NOT_FOUND;
extern const char* const MSG_UNRECOGNIZED;
extern const char* const MSG_ALREADY_ENACTED;
extern const char* const MSG_ALREADY_CONSUMED;
extern const char* const MSG_ALREADY_CANCELED;
extern const char* const MSG_NOT_YET_ENACTED;

/**
 * Parses a phase name ("enact", "consume" or "cancel").  Returns false
 * if the name is not one of them.
 */
bool ParsePhase (const std::string& name, Phase& phase);

/**
 * Returns the name of a phase, as used in callback URIs.
 */
std::string PhaseToString (Phase phase);

/**
 * The transition function of the protocol:  Determines for a transaction
 * currently in the given state what to do with a request for the given
 * phase.  For DONE and REJECT, msg is set to the message to return.
 */
Disposition CheckTransition (proto::Transaction::State state, Phase phase,
                             std::string& msg);

/**
 * Returns the state a transaction is in after the asset callback has
 * successfully processed the given phase.
 */
proto::Transaction::State NextState (Phase phase);

} // namespace settler

#endif // SETTLER_PHASE_HPP
