// ----------------------------------------------------------------------
// File: Formatter.hh
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

#ifndef SLOTDB_FORMATTER_HH
#define SLOTDB_FORMATTER_HH

#include "redis/RedisEncodedResponse.hh"
#include "Status.hh"
#include "Utils.hh"

namespace slotdb {

class RedisRequest;

class Formatter {
public:
  //----------------------------------------------------------------------------
  // Composable overloads
  //----------------------------------------------------------------------------
  static void status(std::ostringstream &ss, std::string_view str);
  static void string(std::ostringstream &ss, std::string_view str);
  static void integer(std::ostringstream &ss, int64_t number);

  //----------------------------------------------------------------------------
  // One-shot overloads
  //----------------------------------------------------------------------------
  static RedisEncodedResponse moved(int64_t slot, const NodeAddress &srv);
  static RedisEncodedResponse crossSlot();
  static RedisEncodedResponse err(std::string_view msg);
  static RedisEncodedResponse errArgs(std::string_view cmd);
  static RedisEncodedResponse errInteger();
  static RedisEncodedResponse rawError(std::string_view msg);
  static RedisEncodedResponse pong();
  static RedisEncodedResponse string(std::string_view str);
  static RedisEncodedResponse fromStatus(const Status &status);
  static RedisEncodedResponse status(std::string_view str);
  static RedisEncodedResponse ok();
  static RedisEncodedResponse null();
  static RedisEncodedResponse integer(int64_t number);
  static RedisEncodedResponse vector(const std::vector<std::string> &vec);
  static RedisEncodedResponse statusVector(const std::vector<std::string> &vec);
  static RedisEncodedResponse noauth(std::string_view str);

  static RedisEncodedResponse subscribe(std::string_view channel, size_t active);
  static RedisEncodedResponse unsubscribe(std::string_view channel, size_t active);
  static RedisEncodedResponse unsubscribeNone();
  static RedisEncodedResponse message(std::string_view channel, std::string_view payload);

  static RedisEncodedResponse redisRequest(const RedisRequest &req);

private:
  static RedisEncodedResponse strstrint(std::string_view str1, std::string_view str2, int num);
};

}

#endif
