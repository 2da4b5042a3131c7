// ----------------------------------------------------------------------
// File: Utils.cc
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

#include <climits>
#include <cerrno>
#include "utils/Stacktrace.hh"
#include "Utils.hh"

namespace slotdb {

bool stacktraceOnError = true;
void setStacktraceOnError(bool val) {
  stacktraceOnError = val;
}

std::string errorStacktrace(bool crash) {
  if(!stacktraceOnError) {
    return "";
  }

  std::string suffixMessage;

  if(!crash) {
    suffixMessage = " ----- The above stacktrace does NOT signify a crash! It's used to show the location of a serious error.";
  }

  return SSTR(" ----- " << getStacktrace() << suffixMessage);
}

std::mutex logMutex;
std::atomic<TraceLevel> traceLevel {TraceLevel::info};

void setTraceLevel(TraceLevel level) {
  traceLevel = level;
}

bool caseInsensitiveEquals(std::string_view str1, std::string_view str2) {
  if(str1.size() != str2.size()) return false;
  for(size_t i = 0; i < str1.size(); i++) {
    if(tolower(str1[i]) != tolower(str2[i])) return false;
  }
  return true;
}

bool my_strtoll(std::string_view str, int64_t &ret) {
  if(str.empty()) return false;

  std::string copy(str);
  char *endptr = NULL;
  errno = 0;
  ret = strtoll(copy.c_str(), &endptr, 10);
  if(endptr != copy.c_str() + copy.size() || errno == ERANGE) {
    return false;
  }
  return true;
}

std::vector<std::string> split(std::string data, std::string token) {
  std::vector<std::string> output;
  size_t pos = std::string::npos;
  do {
    pos = data.find(token);
    output.push_back(data.substr(0, pos));
    if(std::string::npos != pos)
      data = data.substr(pos + token.size());
  } while (std::string::npos != pos);
  return output;
}

bool parseServer(const std::string &str, NodeAddress &srv) {
  size_t colon = str.rfind(":");
  if(colon == std::string::npos || colon == 0) return false;

  int64_t port;
  if(!my_strtoll(std::string_view(str).substr(colon+1), port)) return false;
  if(port <= 0 || port > 65535) return false;

  srv = NodeAddress{ str.substr(0, colon), (int) port };
  return true;
}

bool parseServers(const std::string &str, std::vector<NodeAddress> &servers) {
  servers = {};
  std::vector<std::string> parts = split(str, ",");

  for(size_t i = 0; i < parts.size(); i++) {
    NodeAddress srv;
    if(!parseServer(parts[i], srv)) return false;
    servers.push_back(srv);
  }

  return checkUnique(servers);
}

std::string serializeNodes(const std::vector<NodeAddress> &nodes) {
  std::stringstream ss;
  for(size_t i = 0; i < nodes.size(); i++) {
    ss << nodes[i].toString();
    if(i != nodes.size()-1) ss << ",";
  }
  return ss.str();
}

}
