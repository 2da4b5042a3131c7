// ----------------------------------------------------------------------
// File: RedisParser.cc
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

#include "RedisParser.hh"
#include "Utils.hh"
#include "utils/StringUtils.hh"

using namespace slotdb;

RedisParser::RedisParser(Link *l) : reader(l) {
}

LinkStatus RedisParser::protocolError(const std::string &msg) {
  error = msg;
  sdb_warn("Redis protocol error: " << msg);
  return kProtocolError;
}

LinkStatus RedisParser::fetch(RedisRequest &req) {
  while(request_size == 0) {
    req.clear();

    // new request to process from scratch
    LinkStatus retcode = readInteger('*', request_size);
    if(retcode <= 0) return retcode;

    if(request_size < 0 || request_size > kMaxElements) {
      request_size = 0;
      return protocolError(SSTR("invalid multibulk length"));
    }

    // An empty array carries no command, skip it.
    element_size = -1;
    current_element = 0;
    req.resize(request_size);
  }

  for( ; current_element < request_size; current_element++) {
    LinkStatus rc = readElement(req.getBuffer(current_element));
    if(rc <= 0) return rc;
    element_size = -1;
  }

  request_size = 0;
  req.parseCommand();
  return 1;
}

LinkStatus RedisParser::readInteger(char prefix, int64_t &retval) {
  std::string prev;

  while(current_integer.empty() || current_integer.back() != '\n') {
    LinkStatus rlen = reader.consume(1, prev);
    if(rlen <= 0) return rlen;

    current_integer.append(prev);

    if(current_integer[0] != prefix) {
      std::string received = StringUtils::escapeNonPrintable(current_integer.substr(0, 1));
      current_integer.clear();
      return protocolError(SSTR("expected '" << prefix << "', got '" << received << "'"));
    }

    if(current_integer.size() > 32) {
      current_integer.clear();
      return protocolError("length line too long");
    }
  }

  if(current_integer.size() < 3 || current_integer[current_integer.size()-2] != '\r') {
    current_integer.clear();
    return protocolError("received \\n without preceeding \\r");
  }

  std::string_view digits(current_integer);
  digits = digits.substr(1, digits.size() - 3);

  int64_t num;
  if(!my_strtoll(digits, num)) {
    std::string invalid(digits);
    current_integer.clear();
    return protocolError(SSTR("invalid length " << quotes(StringUtils::escapeNonPrintable(invalid))));
  }

  current_integer.clear();
  retval = num;
  return 1; // success
}

LinkStatus RedisParser::readElement(std::string &str) {
  if(element_size == -1) {
    LinkStatus retcode = readInteger('$', element_size);
    if(retcode <= 0) return retcode;

    if(element_size < 0 || element_size > kMaxElementSize) {
      element_size = -1;
      return protocolError("invalid bulk length");
    }
  }

  return readString(element_size, str);
}

LinkStatus RedisParser::readString(int64_t nbytes, std::string &str) {
  LinkStatus rlen = reader.consume(nbytes+2, str);
  if(rlen <= 0) return rlen;

  if(str[str.size()-2] != '\r' || str[str.size()-1] != '\n') {
    return protocolError("expected CRLF after bulk string");
  }

  str.resize(str.size() - 2);
  return rlen;
}
