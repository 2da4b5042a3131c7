// ----------------------------------------------------------------------
// File: StringUtils.hh
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

#ifndef SLOTDB_UTILS_STRING_UTILS_HH
#define SLOTDB_UTILS_STRING_UTILS_HH

#include <string>
#include <string_view>
#include <sstream>
#include <fnmatch.h>

namespace slotdb { namespace StringUtils {

inline bool startsWith(std::string_view str, std::string_view prefix) {
  if(prefix.size() > str.size()) return false;

  for(size_t i = 0; i < prefix.size(); i++) {
    if(str[i] != prefix[i]) return false;
  }
  return true;
}

inline bool isPrintable(std::string_view str) {
  for(size_t i = 0; i < str.size(); i++) {
    if(!isprint(str[i])) {
      return false;
    }
  }
  return true;
}

inline std::string escapeNonPrintable(std::string_view str) {
  std::stringstream ss;

  for(size_t i = 0; i < str.size(); i++) {
    if(isprint(str[i])) {
      ss << str[i];
    }
    else if(str[i] == '\0') {
      ss << "\\x00";
    }
    else {
      char buff[16];
      snprintf(buff, 16, "\\x%02X", (unsigned char) str[i]);
      ss << buff;
    }
  }
  return ss.str();
}

inline std::string toLower(std::string_view str) {
  std::string ret(str);
  for(size_t i = 0; i < ret.size(); i++) {
    ret[i] = tolower(ret[i]);
  }
  return ret;
}

//------------------------------------------------------------------------------
// Glob-style matching: '*', '?', '[...]' and '\' escapes. Keys containing a
// null byte never match, fnmatch works on C strings.
//------------------------------------------------------------------------------
inline bool globMatch(const std::string &pattern, const std::string &str) {
  if(str.find('\0') != std::string::npos) return false;
  return fnmatch(pattern.c_str(), str.c_str(), 0) == 0;
}

} }

#endif
