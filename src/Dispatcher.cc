// ----------------------------------------------------------------------
// File: Dispatcher.cc
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

#include "storage/KeyValueStore.hh"
#include "utils/ParseUtils.hh"
#include "utils/StringUtils.hh"
#include "Dispatcher.hh"
#include "Utils.hh"
#include "Formatter.hh"

#include <climits>

using namespace slotdb;

// Absolute deadline for a relative expiration, false if it does not fit in
// an int64_t.
static bool deadlineFromNow(int64_t now, int64_t amount, int64_t unitMs, int64_t &deadline) {
  if(amount > INT64_MAX / unitMs || amount < INT64_MIN / unitMs) return false;

  int64_t delta = amount * unitMs;
  if(delta > 0 && delta > INT64_MAX - now) return false;
  if(delta < 0 && delta < INT64_MIN - now) return false;

  deadline = now + delta;
  return true;
}

RedisEncodedResponse Dispatcher::handlePing(RedisRequest &request) {
  sdb_assert(request.getCommand() == RedisCommand::PING);

  if(request.size() > 2) return Formatter::errArgs(request[0]);
  if(request.size() == 1) return Formatter::pong();
  return Formatter::string(request[1]);
}

RedisEncodedResponse Dispatcher::handleEcho(RedisRequest &request) {
  sdb_assert(request.getCommand() == RedisCommand::ECHO);

  if(request.size() != 2) return Formatter::errArgs(request[0]);
  return Formatter::string(request[1]);
}

RedisDispatcher::RedisDispatcher(KeyValueStore &kv) : store(kv) {
}

LinkStatus RedisDispatcher::dispatch(Connection *conn, RedisRequest &req) {
  return conn->raw(dispatch(req));
}

RedisEncodedResponse RedisDispatcher::errArgs(RedisRequest &request) {
  return Formatter::errArgs(request[0]);
}

RedisEncodedResponse RedisDispatcher::dispatchingError(RedisRequest &request) {
  std::string msg = SSTR("internal dispatching error for " << quotes(request[0]));
  sdb_critical(msg);
  return Formatter::err(msg);
}

RedisEncodedResponse RedisDispatcher::dispatch(RedisRequest &request) {
  if(request.getCommandType() == CommandType::READ) {
    return dispatchRead(request);
  }

  if(request.getCommandType() == CommandType::WRITE) {
    return dispatchWrite(request);
  }

  return dispatchingError(request);
}

//------------------------------------------------------------------------------
// SET key value [EX seconds | PX milliseconds] [NX | XX]
//------------------------------------------------------------------------------
RedisEncodedResponse RedisDispatcher::dispatchSET(RedisRequest &request) {
  if(request.size() < 3) return errArgs(request);

  int64_t expiration = 0;
  SetCondition cond = SetCondition::kAlways;

  for(size_t i = 3; i < request.size(); i++) {
    if(caseInsensitiveEquals(request[i], "nx") && cond == SetCondition::kAlways) {
      cond = SetCondition::kIfNotExists;
    }
    else if(caseInsensitiveEquals(request[i], "xx") && cond == SetCondition::kAlways) {
      cond = SetCondition::kIfExists;
    }
    else if((caseInsensitiveEquals(request[i], "ex") || caseInsensitiveEquals(request[i], "px"))
            && expiration == 0 && i+1 < request.size()) {

      int64_t amount;
      if(!ParseUtils::parseInteger(request[i+1], amount)) return Formatter::errInteger();

      int64_t unitMs = caseInsensitiveEquals(request[i], "ex") ? 1000 : 1;
      if(amount <= 0 || !deadlineFromNow(store.nowMs(), amount, unitMs, expiration)) {
        return Formatter::err("invalid expire time in 'set' command");
      }

      i++;
    }
    else {
      return Formatter::err("syntax error");
    }
  }

  bool performed = false;
  Status st = store.set(request[1], request[2], expiration, cond, performed);
  if(!st.ok()) return Formatter::fromStatus(st);
  if(!performed) return Formatter::null();
  return Formatter::ok();
}

RedisEncodedResponse RedisDispatcher::dispatchEXPIRE(RedisRequest &request, int64_t unitMs) {
  if(request.size() != 3) return errArgs(request);

  int64_t amount;
  if(!ParseUtils::parseInteger(request[2], amount)) return Formatter::errInteger();

  int64_t deadline;
  if(!deadlineFromNow(store.nowMs(), amount, unitMs, deadline)) {
    return Formatter::err(SSTR("invalid expire time in '" << StringUtils::toLower(request[0]) << "' command"));
  }

  bool applied = false;
  Status st = store.expireAt(request[1], deadline, applied);
  if(!st.ok()) return Formatter::fromStatus(st);
  return Formatter::integer(applied);
}

RedisEncodedResponse RedisDispatcher::dispatchTTL(RedisRequest &request, int64_t unitMs) {
  if(request.size() != 2) return errArgs(request);

  int64_t ttl;
  Status st = store.pttl(request[1], ttl);
  if(!st.ok()) return Formatter::fromStatus(st);

  // -1 and -2 are markers, not durations
  if(ttl < 0) return Formatter::integer(ttl);
  return Formatter::integer(ttl / unitMs + ((ttl % unitMs) * 2 >= unitMs ? 1 : 0));
}

RedisEncodedResponse RedisDispatcher::dispatchWrite(RedisRequest &request) {
  sdb_assert(request.getCommandType() == CommandType::WRITE);

  switch(request.getCommand()) {
    case RedisCommand::FLUSHALL: {
      if(request.size() != 1) return errArgs(request);
      Status st = store.flushall();
      return Formatter::fromStatus(st);
    }
    case RedisCommand::SET: {
      return dispatchSET(request);
    }
    case RedisCommand::APPEND: {
      if(request.size() != 3) return errArgs(request);
      int64_t length = 0;
      Status st = store.append(request[1], request[2], length);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(length);
    }
    case RedisCommand::DEL: {
      if(request.size() <= 1) return errArgs(request);
      int64_t count = 0;
      Status st = store.del(request.begin()+1, request.end(), count);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(count);
    }
    case RedisCommand::EXPIRE: {
      return dispatchEXPIRE(request, 1000);
    }
    case RedisCommand::PEXPIRE: {
      return dispatchEXPIRE(request, 1);
    }
    case RedisCommand::PERSIST: {
      if(request.size() != 2) return errArgs(request);
      bool removed = false;
      Status st = store.persist(request[1], removed);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(removed);
    }
    case RedisCommand::LPUSH: {
      if(request.size() < 3) return errArgs(request);
      int64_t length;
      Status st = store.lpush(request[1], request.begin()+2, request.end(), length);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(length);
    }
    case RedisCommand::RPUSH: {
      if(request.size() < 3) return errArgs(request);
      int64_t length;
      Status st = store.rpush(request[1], request.begin()+2, request.end(), length);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(length);
    }
    case RedisCommand::LPOP: {
      if(request.size() != 2) return errArgs(request);
      std::string item;
      Status st = store.lpop(request[1], item);
      if(st.IsNotFound()) return Formatter::null();
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::string(item);
    }
    case RedisCommand::RPOP: {
      if(request.size() != 2) return errArgs(request);
      std::string item;
      Status st = store.rpop(request[1], item);
      if(st.IsNotFound()) return Formatter::null();
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::string(item);
    }
    case RedisCommand::LSET: {
      if(request.size() != 4) return errArgs(request);
      int64_t index;
      if(!ParseUtils::parseInteger(request[2], index)) return Formatter::errInteger();
      Status st = store.lset(request[1], index, request[3]);
      return Formatter::fromStatus(st);
    }
    case RedisCommand::LINSERT: {
      if(request.size() != 5) return errArgs(request);

      bool before;
      if(caseInsensitiveEquals(request[2], "before")) {
        before = true;
      }
      else if(caseInsensitiveEquals(request[2], "after")) {
        before = false;
      }
      else {
        return Formatter::err("syntax error");
      }

      int64_t length = 0;
      Status st = store.linsert(request[1], before, request[3], request[4], length);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(length);
    }
    case RedisCommand::LREM: {
      if(request.size() != 4) return errArgs(request);
      int64_t count;
      if(!ParseUtils::parseInteger(request[2], count)) return Formatter::errInteger();

      int64_t removed = 0;
      Status st = store.lrem(request[1], count, request[3], removed);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(removed);
    }
    case RedisCommand::HSET: {
      if(request.size() < 4 || request.size() % 2 != 0) return errArgs(request);
      int64_t created = 0;
      Status st = store.hset(request[1], request.begin()+2, request.end(), created);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(created);
    }
    case RedisCommand::HDEL: {
      if(request.size() <= 2) return errArgs(request);
      int64_t count = 0;
      Status st = store.hdel(request[1], request.begin()+2, request.end(), count);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(count);
    }
    case RedisCommand::SADD: {
      if(request.size() <= 2) return errArgs(request);
      int64_t count = 0;
      Status st = store.sadd(request[1], request.begin()+2, request.end(), count);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(count);
    }
    case RedisCommand::SREM: {
      if(request.size() <= 2) return errArgs(request);
      int64_t count = 0;
      Status st = store.srem(request[1], request.begin()+2, request.end(), count);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(count);
    }
    default: {
      return dispatchingError(request);
    }
  }
}

RedisEncodedResponse RedisDispatcher::dispatchRead(RedisRequest &request) {
  switch(request.getCommand()) {
    case RedisCommand::GET: {
      if(request.size() != 2) return errArgs(request);

      std::string value;
      Status st = store.get(request[1], value);
      if(st.IsNotFound()) return Formatter::null();
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::string(value);
    }
    case RedisCommand::STRLEN: {
      if(request.size() != 2) return errArgs(request);

      int64_t length = 0;
      Status st = store.strlen(request[1], length);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(length);
    }
    case RedisCommand::EXISTS: {
      if(request.size() <= 1) return errArgs(request);

      int64_t count = 0;
      Status st = store.exists(request.begin()+1, request.end(), count);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(count);
    }
    case RedisCommand::TYPE: {
      if(request.size() != 2) return errArgs(request);

      std::string keyType;
      Status st = store.getType(request[1], keyType);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::status(keyType);
    }
    case RedisCommand::KEYS: {
      if(request.size() != 2) return errArgs(request);

      std::vector<std::string> ret;
      Status st = store.keys(request[1], ret);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::vector(ret);
    }
    case RedisCommand::TTL: {
      return dispatchTTL(request, 1000);
    }
    case RedisCommand::PTTL: {
      return dispatchTTL(request, 1);
    }
    case RedisCommand::LLEN: {
      if(request.size() != 2) return errArgs(request);

      size_t len;
      Status st = store.llen(request[1], len);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(len);
    }
    case RedisCommand::LRANGE: {
      if(request.size() != 4) return errArgs(request);

      int64_t start, stop;
      if(!ParseUtils::parseInteger(request[2], start)) return Formatter::errInteger();
      if(!ParseUtils::parseInteger(request[3], stop)) return Formatter::errInteger();

      std::vector<std::string> items;
      Status st = store.lrange(request[1], start, stop, items);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::vector(items);
    }
    case RedisCommand::LINDEX: {
      if(request.size() != 3) return errArgs(request);

      int64_t index;
      if(!ParseUtils::parseInteger(request[2], index)) return Formatter::errInteger();

      std::string item;
      Status st = store.lindex(request[1], index, item);
      if(st.IsNotFound()) return Formatter::null();
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::string(item);
    }
    case RedisCommand::HGET: {
      if(request.size() != 3) return errArgs(request);

      std::string value;
      Status st = store.hget(request[1], request[2], value);
      if(st.IsNotFound()) return Formatter::null();
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::string(value);
    }
    case RedisCommand::HEXISTS: {
      if(request.size() != 3) return errArgs(request);

      Status st = store.hexists(request[1], request[2]);
      if(st.ok()) return Formatter::integer(1);
      if(st.IsNotFound()) return Formatter::integer(0);
      return Formatter::fromStatus(st);
    }
    case RedisCommand::HLEN: {
      if(request.size() != 2) return errArgs(request);

      size_t len;
      Status st = store.hlen(request[1], len);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(len);
    }
    case RedisCommand::HGETALL: {
      if(request.size() != 2) return errArgs(request);

      std::vector<std::string> vec;
      Status st = store.hgetall(request[1], vec);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::vector(vec);
    }
    case RedisCommand::HKEYS: {
      if(request.size() != 2) return errArgs(request);

      std::vector<std::string> keys;
      Status st = store.hkeys(request[1], keys);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::vector(keys);
    }
    case RedisCommand::HVALS: {
      if(request.size() != 2) return errArgs(request);

      std::vector<std::string> vals;
      Status st = store.hvals(request[1], vals);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::vector(vals);
    }
    case RedisCommand::SMEMBERS: {
      if(request.size() != 2) return errArgs(request);

      std::vector<std::string> members;
      Status st = store.smembers(request[1], members);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::vector(members);
    }
    case RedisCommand::SISMEMBER: {
      if(request.size() != 3) return errArgs(request);

      Status st = store.sismember(request[1], request[2]);
      if(st.ok()) return Formatter::integer(1);
      if(st.IsNotFound()) return Formatter::integer(0);
      return Formatter::fromStatus(st);
    }
    case RedisCommand::SCARD: {
      if(request.size() != 2) return errArgs(request);

      size_t count;
      Status st = store.scard(request[1], count);
      if(!st.ok()) return Formatter::fromStatus(st);
      return Formatter::integer(count);
    }
    default: {
      return dispatchingError(request);
    }
  }
}
