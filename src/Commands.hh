// ----------------------------------------------------------------------
// File: Commands.hh
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

#ifndef SLOTDB_COMMANDS_HH
#define SLOTDB_COMMANDS_HH

#include <map>
#include <string>
#include <string_view>

namespace slotdb {

enum class RedisCommand {
  INVALID,

  PING,
  ECHO,
  CLIENT,
  CLUSTER,
  SAVE,
  DBSIZE,
  FLUSHALL,
  SLOTDB_INFO,

  AUTH,
  SLOTDB_REPLICATION_HANDSHAKE,

  GET,
  SET,
  APPEND,
  STRLEN,

  DEL,
  EXISTS,
  TYPE,
  KEYS,
  EXPIRE,
  PEXPIRE,
  TTL,
  PTTL,
  PERSIST,

  LPUSH,
  RPUSH,
  LPOP,
  RPOP,
  LLEN,
  LRANGE,
  LINDEX,
  LSET,
  LINSERT,
  LREM,

  HSET,
  HGET,
  HDEL,
  HEXISTS,
  HLEN,
  HGETALL,
  HKEYS,
  HVALS,

  SADD,
  SREM,
  SMEMBERS,
  SISMEMBER,
  SCARD,

  PUBLISH,
  SUBSCRIBE,
  UNSUBSCRIBE
};

enum class CommandType {
  INVALID,

  READ,
  WRITE,
  CONTROL,
  AUTHENTICATION,
  REPLICATION,
  PUBSUB
};

struct CommandComparator {

    __attribute__((always_inline))
    char normalize(char c) const {
      char ret = tolower(c);
      if(ret == '-') {
        ret = '_';
      }
      return ret;
    }

    bool operator() (std::string_view lhs, std::string_view rhs) const {
        for(size_t i = 0; i < std::min(lhs.size(), rhs.size()); i++) {
          char left = normalize(lhs[i]);
          char right = normalize(rhs[i]);

          if(left != right) {
            return left < right;
          }
        }
        return lhs.size() < rhs.size();
    }

    struct is_transparent {};
};

extern std::map<std::string,
                std::pair<RedisCommand, CommandType>,
                CommandComparator>
                redis_cmd_map;
}

#endif
