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

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <thread>

namespace settler
{

using testing::_;
using testing::Return;

void
SleepSome ()
{
  std::this_thread::sleep_for (std::chrono::milliseconds (10));
}

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

proto::Transaction
NewTransactionData (const std::string& id)
{
  auto res = ParseTextProto<proto::Transaction> (R"(
    payer_id: "payer"
    payer_name: "Alice"
    payee_id: "payee"
    payee_name: "Bob"
    amount: 250
    type: 1
    type_string: "purchase"
    part_id: "part"
    part_name: "Sword"
    category_id: "weapons"
    sale_type: 2
  )");
  res.set_id (id);

  return res;
}

/* ************************************************************************** */

MockAssetCallback::MockAssetCallback ()
{
  ON_CALL (*this, EnactHold (_, _)).WillByDefault (Return (true));
  ON_CALL (*this, ConsumeHold (_, _)).WillByDefault (Return (true));
  ON_CALL (*this, CancelHold (_, _)).WillByDefault (Return (true));
}

/* ************************************************************************** */

constexpr int64_t TestRegistry::START_TIME;

void
TestStore::Store (const proto::Transaction& tx)
{
  if (failing)
    throw StoreError ("test store is failing");

  SQLiteTransactionStore::Store (tx);
  ++writes;
}

proto::Transaction
TestStore::GetStored (const std::string& id)
{
  const auto rows = Get ("id", id);
  EXPECT_EQ (rows.size (), 1u) << "Rows stored for " << id;
  if (rows.empty ())
    return proto::Transaction ();

  return rows.front ();
}

} // namespace settler
