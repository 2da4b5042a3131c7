// ----------------------------------------------------------------------
// File: Commands.cc
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

#include "Commands.hh"
using namespace slotdb;

std::map<std::string,
         std::pair<RedisCommand, CommandType>,
         CommandComparator>
         slotdb::redis_cmd_map;

struct cmdMapInit {
  cmdMapInit() {
    redis_cmd_map["ping"] = {RedisCommand::PING, CommandType::CONTROL};
    redis_cmd_map["echo"] = {RedisCommand::ECHO, CommandType::CONTROL};
    redis_cmd_map["client"] = {RedisCommand::CLIENT, CommandType::CONTROL};
    redis_cmd_map["cluster"] = {RedisCommand::CLUSTER, CommandType::CONTROL};
    redis_cmd_map["save"] = {RedisCommand::SAVE, CommandType::CONTROL};
    redis_cmd_map["dbsize"] = {RedisCommand::DBSIZE, CommandType::CONTROL};
    redis_cmd_map["slotdb_info"] = {RedisCommand::SLOTDB_INFO, CommandType::CONTROL};

    redis_cmd_map["auth"] = {RedisCommand::AUTH, CommandType::AUTHENTICATION};
    redis_cmd_map["slotdb_replication_handshake"] = {RedisCommand::SLOTDB_REPLICATION_HANDSHAKE, CommandType::REPLICATION};

    redis_cmd_map["get"] = {RedisCommand::GET, CommandType::READ};
    redis_cmd_map["strlen"] = {RedisCommand::STRLEN, CommandType::READ};
    redis_cmd_map["exists"] = {RedisCommand::EXISTS, CommandType::READ};
    redis_cmd_map["type"] = {RedisCommand::TYPE, CommandType::READ};
    redis_cmd_map["keys"] = {RedisCommand::KEYS, CommandType::READ};
    redis_cmd_map["ttl"] = {RedisCommand::TTL, CommandType::READ};
    redis_cmd_map["pttl"] = {RedisCommand::PTTL, CommandType::READ};
    redis_cmd_map["llen"] = {RedisCommand::LLEN, CommandType::READ};
    redis_cmd_map["lrange"] = {RedisCommand::LRANGE, CommandType::READ};
    redis_cmd_map["lindex"] = {RedisCommand::LINDEX, CommandType::READ};
    redis_cmd_map["hget"] = {RedisCommand::HGET, CommandType::READ};
    redis_cmd_map["hexists"] = {RedisCommand::HEXISTS, CommandType::READ};
    redis_cmd_map["hlen"] = {RedisCommand::HLEN, CommandType::READ};
    redis_cmd_map["hgetall"] = {RedisCommand::HGETALL, CommandType::READ};
    redis_cmd_map["hkeys"] = {RedisCommand::HKEYS, CommandType::READ};
    redis_cmd_map["hvals"] = {RedisCommand::HVALS, CommandType::READ};
    redis_cmd_map["smembers"] = {RedisCommand::SMEMBERS, CommandType::READ};
    redis_cmd_map["sismember"] = {RedisCommand::SISMEMBER, CommandType::READ};
    redis_cmd_map["scard"] = {RedisCommand::SCARD, CommandType::READ};

    redis_cmd_map["flushall"] = {RedisCommand::FLUSHALL, CommandType::WRITE};
    redis_cmd_map["set"] = {RedisCommand::SET, CommandType::WRITE};
    redis_cmd_map["append"] = {RedisCommand::APPEND, CommandType::WRITE};
    redis_cmd_map["del"] = {RedisCommand::DEL, CommandType::WRITE};
    redis_cmd_map["expire"] = {RedisCommand::EXPIRE, CommandType::WRITE};
    redis_cmd_map["pexpire"] = {RedisCommand::PEXPIRE, CommandType::WRITE};
    redis_cmd_map["persist"] = {RedisCommand::PERSIST, CommandType::WRITE};
    redis_cmd_map["lpush"] = {RedisCommand::LPUSH, CommandType::WRITE};
    redis_cmd_map["rpush"] = {RedisCommand::RPUSH, CommandType::WRITE};
    redis_cmd_map["lpop"] = {RedisCommand::LPOP, CommandType::WRITE};
    redis_cmd_map["rpop"] = {RedisCommand::RPOP, CommandType::WRITE};
    redis_cmd_map["lset"] = {RedisCommand::LSET, CommandType::WRITE};
    redis_cmd_map["linsert"] = {RedisCommand::LINSERT, CommandType::WRITE};
    redis_cmd_map["lrem"] = {RedisCommand::LREM, CommandType::WRITE};
    redis_cmd_map["hset"] = {RedisCommand::HSET, CommandType::WRITE};
    redis_cmd_map["hdel"] = {RedisCommand::HDEL, CommandType::WRITE};
    redis_cmd_map["sadd"] = {RedisCommand::SADD, CommandType::WRITE};
    redis_cmd_map["srem"] = {RedisCommand::SREM, CommandType::WRITE};

    redis_cmd_map["publish"] = {RedisCommand::PUBLISH, CommandType::PUBSUB};
    redis_cmd_map["subscribe"] = {RedisCommand::SUBSCRIBE, CommandType::PUBSUB};
    redis_cmd_map["unsubscribe"] = {RedisCommand::UNSUBSCRIBE, CommandType::PUBSUB};
  }
} cmd_map_init;
