// ----------------------------------------------------------------------
// File: RedisEncodedResponse.hh
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

#ifndef SLOTDB_REDIS_REDIS_ENCODED_RESPONSE_HH
#define SLOTDB_REDIS_REDIS_ENCODED_RESPONSE_HH

#include <string>

namespace slotdb {

// Phantom type: std::string with a special meaning. Unless explicitly asked
// with obj.val, this will generate compiler errors when you try to use like
// plain string.
class RedisEncodedResponse {
public:
  explicit RedisEncodedResponse(std::string &&src) : val(std::move(src)) {}
  RedisEncodedResponse() {}
  bool empty() const { return val.empty(); }

  // Error replies start with '-'
  bool isError() const { return !val.empty() && val[0] == '-'; }

  std::string val;
};

}

#endif
