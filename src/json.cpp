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

#include "json.hpp"

#include "proto/transaction.pb.h"
#include "transaction.hpp"

#include <limits>

namespace settler
{

namespace
{

/**
 * Converts an integer to JSON, making sure to do it with the proper
 * signed JSON int64 type.
 */
Json::Value
IntToJson (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

/**
 * Reads an optional string member from a JSON object.  Returns false if
 * the member is present but not a string.
 */
bool
GetOptionalString (const Json::Value& obj, const char* key, std::string& out)
{
  if (!obj.isMember (key))
    return true;

  const auto& val = obj[key];
  if (!val.isString ())
    return false;

  out = val.asString ();
  return true;
}

/**
 * Reads a required string member, which must also be non-empty.
 */
bool
GetRequiredString (const Json::Value& obj, const char* key, std::string& out)
{
  const auto& val = obj[key];
  if (!val.isString ())
    return false;

  out = val.asString ();
  return !out.empty ();
}

/**
 * Reads an optional int32 member.
 */
bool
GetOptionalInt (const Json::Value& obj, const char* key, int32_t& out)
{
  if (!obj.isMember (key))
    return true;

  const auto& val = obj[key];
  if (!val.isInt ())
    return false;

  out = val.asInt ();
  return true;
}

} // anonymous namespace

template <>
  Json::Value
  ProtoToJson<proto::Transaction> (const proto::Transaction& pb)
{
  Json::Value res(Json::objectValue);

  res["id"] = pb.id ();
  res["state"] = StateToString (pb.state ());

  Json::Value payer(Json::objectValue);
  payer["id"] = pb.payer_id ();
  payer["name"] = pb.payer_name ();
  res["payer"] = payer;

  Json::Value payee(Json::objectValue);
  payee["id"] = pb.payee_id ();
  payee["name"] = pb.payee_name ();
  res["payee"] = payee;

  res["amount"] = IntToJson (pb.amount ());
  res["type"] = pb.type ();
  res["type_string"] = pb.type_string ();

  if (pb.subscription_debit ())
    res["subscription"] = pb.subscription_id ();

  Json::Value part(Json::objectValue);
  part["id"] = pb.part_id ();
  part["name"] = pb.part_name ();
  part["description"] = pb.part_description ();
  part["category"] = pb.category_id ();
  if (pb.has_local_id ())
    part["local_id"] = IntToJson (pb.local_id ());
  part["sale_type"] = pb.sale_type ();
  res["part"] = part;

  Json::Value response(Json::objectValue);
  response["submitted"] = pb.submitted ();
  response["received"] = pb.response_received ();
  response["success"] = pb.response_success ();
  response["status"] = pb.response_status ();
  response["reason"] = pb.response_reason ();
  response["payer_ending_balance"] = IntToJson (pb.payer_ending_balance ());
  res["response"] = response;

  Json::Value times(Json::objectValue);
  times["created"] = IntToJson (pb.created_time ());
  if (pb.has_enacted_time ())
    times["enacted"] = IntToJson (pb.enacted_time ());
  if (pb.has_finished_time ())
    times["finished"] = IntToJson (pb.finished_time ());
  res["times"] = times;

  return res;
}

template <>
  bool
  ProtoFromJson<proto::Transaction> (const Json::Value& val,
                                     proto::Transaction& pb)
{
  pb.Clear ();

  if (!val.isObject ())
    return false;

  std::string str;

  if (!GetRequiredString (val, "id", str))
    return false;
  pb.set_id (str);

  if (!GetRequiredString (val, "payer_id", str))
    return false;
  pb.set_payer_id (str);

  if (!GetRequiredString (val, "payee_id", str))
    return false;
  pb.set_payee_id (str);

  if (!val["amount"].isInt64 ())
    return false;
  pb.set_amount (val["amount"].asInt64 ());

  /* The remaining fields are all optional, and just copied over with
     a type check if present.  */
  const struct
  {
    const char* key;
    std::string* (proto::Transaction::*field) ();
  } stringFields[] =
    {
      {"payer_name", &proto::Transaction::mutable_payer_name},
      {"payee_name", &proto::Transaction::mutable_payee_name},
      {"type_string", &proto::Transaction::mutable_type_string},
      {"subscription_id", &proto::Transaction::mutable_subscription_id},
      {"part_id", &proto::Transaction::mutable_part_id},
      {"part_name", &proto::Transaction::mutable_part_name},
      {"part_description", &proto::Transaction::mutable_part_description},
      {"category_id", &proto::Transaction::mutable_category_id},
    };
  for (const auto& f : stringFields)
    {
      str.clear ();
      if (!GetOptionalString (val, f.key, str))
        return false;
      if (val.isMember (f.key))
        *(pb.*f.field) () = str;
    }

  int32_t num = 0;
  if (!GetOptionalInt (val, "type", num))
    return false;
  if (val.isMember ("type"))
    pb.set_type (num);

  if (!GetOptionalInt (val, "sale_type", num))
    return false;
  if (val.isMember ("sale_type"))
    pb.set_sale_type (num);

  if (val.isMember ("subscription_debit"))
    {
      if (!val["subscription_debit"].isBool ())
        return false;
      pb.set_subscription_debit (val["subscription_debit"].asBool ());
    }

  if (val.isMember ("local_id"))
    {
      const auto& localId = val["local_id"];
      if (!localId.isUInt64 ()
            || localId.asUInt64 () > std::numeric_limits<uint32_t>::max ())
        return false;
      pb.set_local_id (localId.asUInt64 ());
    }

  if (pb.subscription_debit () && pb.subscription_id ().empty ())
    return false;

  return true;
}

bool
ResponseFromJson (const Json::Value& val, proto::Transaction& pb)
{
  pb.Clear ();

  if (!val.isObject () || val.empty ())
    return false;

  for (const auto& key : val.getMemberNames ())
    {
      const auto& member = val[key];

      if (key == "submitted" || key == "received" || key == "success")
        {
          if (!member.isBool ())
            return false;

          if (key == "submitted")
            pb.set_submitted (member.asBool ());
          else if (key == "received")
            pb.set_response_received (member.asBool ());
          else
            pb.set_response_success (member.asBool ());
        }
      else if (key == "status" || key == "reason")
        {
          if (!member.isString ())
            return false;

          if (key == "status")
            pb.set_response_status (member.asString ());
          else
            pb.set_response_reason (member.asString ());
        }
      else if (key == "payer_ending_balance")
        {
          if (!member.isInt64 ())
            return false;
          pb.set_payer_ending_balance (member.asInt64 ());
        }
      else
        return false;
    }

  return true;
}

} // namespace settler
