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

#ifndef SETTLER_JSON_HPP
#define SETTLER_JSON_HPP

#include "proto/transaction.pb.h"

#include <json/json.h>

namespace settler
{

/**
 * Converts one of the protocol buffers into the JSON form used on the
 * RPC interfaces (both our own server and the calls to the asset service).
 */
template <typename Proto>
  Json::Value ProtoToJson (const Proto& pb);

/**
 * Tries to parse a protocol buffer from its JSON representation.  This is
 * implemented for the data passed in when creating a transaction.
 * Returns true on success, in which case the output proto is filled in.
 */
template <typename Proto>
  bool ProtoFromJson (const Json::Value& val, Proto& pb);

/**
 * Parses the ledger response bookkeeping of a transaction, given in the
 * same form as the "response" object of the transaction's JSON.  All
 * members are optional, but at least one must be present and unknown ones
 * are rejected.  Only the fields that are given are set in pb.
 */
bool ResponseFromJson (const Json::Value& val, proto::Transaction& pb);

} // namespace settler

#endif // SETTLER_JSON_HPP
