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

/* Template implementation code for rpcclient.hpp.  */

#include <tuple>
#include <utility>

namespace settler
{

template <typename T>
  T&
  RpcClient<T>::operator* ()
{
  std::lock_guard<std::mutex> lock(mut);
  const auto id = std::this_thread::get_id ();

  auto mit = connections.find (id);
  if (mit == connections.end ())
    mit = connections.emplace (std::piecewise_construct,
                               std::forward_as_tuple (id),
                               std::forward_as_tuple (endpoint, timeout))
            .first;

  return mit->second.rpc;
}

} // namespace settler
