// ----------------------------------------------------------------------
// File: PatternMatching.hh
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

#ifndef SLOTDB_PATTERN_MATCHING_HH
#define SLOTDB_PATTERN_MATCHING_HH

#include <string>

namespace slotdb {

// Given a glob pattern, extract the maximum prefix which doesn't contain
// special glob-style characters. Keys are kept ordered, so everything not
// starting with this prefix can be skipped without running the matcher.
inline std::string extractPatternPrefix(const std::string &pattern) {
  for(size_t i = 0; i < pattern.size(); i++) {
    char c = pattern[i];

    if(c == '?' || c == '*' || c == '[' || c == ']' || c == '\\') {
      return std::string(pattern.begin(), pattern.begin()+i);
    }
  }

  return pattern;
}

}

#endif
