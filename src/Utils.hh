// ----------------------------------------------------------------------
// File: Utils.hh
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

#ifndef SLOTDB_UTILS_HH
#define SLOTDB_UTILS_HH

#include <iostream>
#include <sstream>
#include <vector>
#include <atomic>
#include <chrono>
#include <mutex>

#include "Common.hh"

namespace slotdb {

// Controls whether stacktraces are printed on serious errors
// (critical, and exceptions)
// True by default when running a real instance, but false during tests,
// as many error conditions are simulated there, and we'd make the output
// unreadable.
void setStacktraceOnError(bool val);

bool my_strtoll(std::string_view str, int64_t &ret);
std::vector<std::string> split(std::string data, std::string token);
bool parseServer(const std::string &str, NodeAddress &srv);
bool parseServers(const std::string &str, std::vector<NodeAddress> &servers);
std::string serializeNodes(const std::vector<NodeAddress> &nodes);
bool caseInsensitiveEquals(std::string_view str1, std::string_view str2);

inline std::string boolToString(bool b) {
  if(b) return "TRUE";
  return "FALSE";
}

// given a vector, checks whether all elements are unique
template<class T>
bool checkUnique(const std::vector<T> &v) {
  for(size_t i = 0; i < v.size(); i++) {
    for(size_t j = 0; j < v.size(); j++) {
      if(i != j && v[i] == v[j]) {
        return false;
      }
    }
  }
  return true;
}

template<class T>
bool contains(const std::vector<T> &v, const T& element) {
  for(size_t i = 0; i <  v.size(); i++) {
    if(v[i] == element) return true;
  }
  return false;
}

}

#endif
