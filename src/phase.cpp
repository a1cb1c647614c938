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

#include "phase.hpp"

#include <glog/logging.h>

namespace settler
{

const char* const MSG_PENDING = "pending";
const char* const MSG_NOT_FOUND = "no matching transaction found";
const char* const MSG_UNRECOGNIZED = "Unrecognized state request";
const char* const MSG_ALREADY_ENACTED = "already enacted";
const char* const MSG_ALREADY_CONSUMED = "already consumed";
const char* const MSG_ALREADY_CANCELED = "already canceled";
const char* const MSG_NOT_YET_ENACTED = "not yet enacted";

bool
ParsePhase (const std::string& name, Phase& phase)
{
  if (name == "enact")
    phase = Phase::ENACT;
  else if (name == "consume")
    phase = Phase::CONSUME;
  else if (name == "cancel")
    phase = Phase::CANCEL;
  else
    return false;

  return true;
}

std::string
PhaseToString (const Phase phase)
{
  switch (phase)
    {
    case Phase::ENACT:
      return "enact";
    case Phase::CONSUME:
      return "consume";
    case Phase::CANCEL:
      return "cancel";
    default:
      LOG (FATAL) << "Invalid phase: " << static_cast<int> (phase);
    }
}

namespace
{

Disposition
CheckEnact (const proto::Transaction::State state, std::string& msg)
{
  switch (state)
    {
    case proto::Transaction::CREATED:
      return Disposition::PROCEED;

    /* A late enact after the transaction moved on is harmless, and has to
       succeed so that the ledger does not keep retrying it.  */
    case proto::Transaction::ENACTED:
      msg = MSG_ALREADY_ENACTED;
      return Disposition::DONE;
    case proto::Transaction::CONSUMED:
      msg = MSG_ALREADY_CONSUMED;
      return Disposition::DONE;

    /* A delayed enact must not resurrect a canceled hold.  */
    case proto::Transaction::CANCELED:
      msg = MSG_ALREADY_CANCELED;
      return Disposition::REJECT;

    default:
      LOG (FATAL) << "Invalid transaction state: " << static_cast<int> (state);
    }
}

Disposition
CheckConsume (const proto::Transaction::State state, std::string& msg)
{
  switch (state)
    {
    case proto::Transaction::CREATED:
      msg = MSG_NOT_YET_ENACTED;
      return Disposition::REJECT;

    case proto::Transaction::ENACTED:
      return Disposition::PROCEED;

    case proto::Transaction::CONSUMED:
      msg = MSG_ALREADY_CONSUMED;
      return Disposition::DONE;

    case proto::Transaction::CANCELED:
      msg = MSG_ALREADY_CANCELED;
      return Disposition::REJECT;

    default:
      LOG (FATAL) << "Invalid transaction state: " << static_cast<int> (state);
    }
}

Disposition
CheckCancel (const proto::Transaction::State state, std::string& msg)
{
  switch (state)
    {
    /* Even if nothing has been enacted yet, the callback gets to decide
       whether there is anything to undo.  */
    case proto::Transaction::CREATED:
    case proto::Transaction::ENACTED:
      return Disposition::PROCEED;

    case proto::Transaction::CONSUMED:
      msg = MSG_ALREADY_CONSUMED;
      return Disposition::REJECT;

    case proto::Transaction::CANCELED:
      msg = MSG_ALREADY_CANCELED;
      return Disposition::DONE;

    default:
      LOG (FATAL) << "Invalid transaction state: " << static_cast<int> (state);
    }
}

} // anonymous namespace

Disposition
CheckTransition (const proto::Transaction::State state, const Phase phase,
                 std::string& msg)
{
  switch (phase)
    {
    case Phase::ENACT:
      return CheckEnact (state, msg);
    case Phase::CONSUME:
      return CheckConsume (state, msg);
    case Phase::CANCEL:
      return CheckCancel (state, msg);
    default:
      LOG (FATAL) << "Invalid phase: " << static_cast<int> (phase);
    }
}

proto::Transaction::State
NextState (const Phase phase)
{
  switch (phase)
    {
    case Phase::ENACT:
      return proto::Transaction::ENACTED;
    case Phase::CONSUME:
      return proto::Transaction::CONSUMED;
    case Phase::CANCEL:
      return proto::Transaction::CANCELED;
    default:
      LOG (FATAL) << "Invalid phase: " << static_cast<int> (phase);
    }
}

} // namespace settler
