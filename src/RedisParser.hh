// ----------------------------------------------------------------------
// File: RedisParser.hh
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

#ifndef SLOTDB_REDIS_PARSER_HH
#define SLOTDB_REDIS_PARSER_HH

#include "BufferedReader.hh"
#include "Common.hh"
#include "RedisRequest.hh"

namespace slotdb {

class RedisParser {
public:
  RedisParser(Link *link);

  //----------------------------------------------------------------------------
  // Returned by fetch when the peer violated the protocol. The stream can't
  // be resynchronized after this, getError() describes what went wrong.
  //----------------------------------------------------------------------------
  static constexpr LinkStatus kProtocolError = -1000;

  static constexpr int64_t kMaxElements = 1024 * 1024;
  static constexpr int64_t kMaxElementSize = 512 * 1024 * 1024;

  //----------------------------------------------------------------------------
  // Resumable function to fetch a request from the link.
  // returns 1 if there's a request to process, and sets req accordingly
  // returns 0 on slow link, ie if there's not enough data on the link to
  //           construct a redis request from
  // returns negative on error
  //----------------------------------------------------------------------------
  LinkStatus fetch(RedisRequest &req);

  const std::string& getError() const {
    return error;
  }

private:
  BufferedReader reader;

  //----------------------------------------------------------------------------
  // A redis request is composed of multiple elements.
  // Here we keep track the size of the current element as well as how many
  // elements we've read so far.
  //----------------------------------------------------------------------------
  int64_t request_size = 0;
  int64_t current_element = 0;
  int64_t element_size = -1;

  //----------------------------------------------------------------------------
  // Buffers to hold temporary contents.
  //----------------------------------------------------------------------------
  std::string current_integer;
  std::string error;

  //----------------------------------------------------------------------------
  // Helper functions to do parsing
  //----------------------------------------------------------------------------
  LinkStatus readInteger(char prefix, int64_t &retval);
  LinkStatus readElement(std::string &str);
  LinkStatus readString(int64_t nbytes, std::string &str);
  LinkStatus protocolError(const std::string &msg);
};

}

#endif
