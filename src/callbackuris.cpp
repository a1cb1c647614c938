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

#include "callbackuris.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace settler
{

const char* const CALLBACK_PATH = "/settler/transaction";

namespace
{

/**
 * Percent-encodes a value for use in the query string.  Only the
 * unreserved characters of RFC 3986 are kept as they are.
 */
std::string
EncodeQueryValue (const std::string& val)
{
  std::ostringstream out;
  out << std::hex << std::uppercase;

  for (const char c : val)
    {
      const auto u = static_cast<unsigned char> (c);
      if (std::isalnum (u) || c == '-' || c == '_' || c == '.' || c == '~')
        out << c;
      else
        out << '%' << std::setw (2) << std::setfill ('0')
            << static_cast<int> (u);
    }

  return out.str ();
}

/**
 * Extracts the "scheme://authority" prefix of a URI.
 */
std::string
GetSchemeAndAuthority (const std::string& uri)
{
  const size_t schemeEnd = uri.find ("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0)
    throw std::invalid_argument ("URI has no scheme: " + uri);

  const size_t authStart = schemeEnd + 3;
  const size_t authEnd = uri.find_first_of ("/?#", authStart);
  const size_t authLen = (authEnd == std::string::npos
                            ? uri.size () - authStart
                            : authEnd - authStart);
  if (authLen == 0)
    throw std::invalid_argument ("URI has no authority: " + uri);

  return uri.substr (0, authStart + authLen);
}

} // anonymous namespace

std::string
BuildPhaseUri (const std::string& baseUri, const TransactionId& id,
               const Phase phase)
{
  std::ostringstream res;
  res << GetSchemeAndAuthority (baseUri) << CALLBACK_PATH
      << "?id=" << EncodeQueryValue (id)
      << "&state=" << PhaseToString (phase);

  return res.str ();
}

} // namespace settler
