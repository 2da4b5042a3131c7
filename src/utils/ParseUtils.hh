// ----------------------------------------------------------------------
// File: ParseUtils.hh
// Author: Georgios Bitzes - CERN
// ----------------------------------------------------------------------

/************************************************************************
 * slotdb - a sharded, replicated redis-compatible key-value store      *
 * Copyright (C) 2016 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

#ifndef SLOTDB_PARSING_UTILS_HH
#define SLOTDB_PARSING_UTILS_HH

#include "../Utils.hh"

#include <climits>
#include <cerrno>

namespace slotdb { namespace ParseUtils {

inline bool parseInteger(std::string_view str, int64_t &ret) {
  return my_strtoll(str, ret);
}

inline bool parseBool(std::string_view str, bool &ret) {
  if(str == "true" || str == "yes" || str == "1") {
    ret = true;
    return true;
  }

  if(str == "false" || str == "no" || str == "0") {
    ret = false;
    return true;
  }

  return false;
}

inline bool parseTraceLevel(std::string_view str, TraceLevel &ret) {
  if(str == "off") ret = TraceLevel::off;
  else if(str == "error") ret = TraceLevel::error;
  else if(str == "warning") ret = TraceLevel::warning;
  else if(str == "info") ret = TraceLevel::info;
  else if(str == "debug") ret = TraceLevel::debug;
  else return false;

  return true;
}

} }

#endif
