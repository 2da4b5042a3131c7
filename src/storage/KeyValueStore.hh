// ----------------------------------------------------------------------
// File: KeyValueStore.hh
// Author: SlotDB authors
// ----------------------------------------------------------------------

/************************************************************************
 * slotdb - a sharded, replicated redis-compatible key-value store      *
 * Copyright (C) 2026 SlotDB authors                                    *
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

#ifndef SLOTDB_STORAGE_KEY_VALUE_STORE_HH
#define SLOTDB_STORAGE_KEY_VALUE_STORE_HH

#include <memory>
#include <shared_mutex>
#include "storage/Value.hh"
#include "utils/ClockWrapper.hh"
#include "RedisRequest.hh"
#include "Status.hh"

namespace slotdb {

enum class SetCondition {
  kAlways,
  kIfNotExists,
  kIfExists
};

//------------------------------------------------------------------------------
// In-memory keyspace. Every public operation runs under the store-wide lock,
// exclusive for writes and shared for reads, so no operation observes a
// partially applied sibling.
//
// Expiration is lazy: an expired key reads as missing, and is physically
// dropped the next time a write touches it.
//
// Collections are never stored empty - removing the last element of a list,
// hash or set removes the key.
//------------------------------------------------------------------------------
class KeyValueStore {
public:
  using Contents = std::map<std::string, Entry, std::less<>>;

  KeyValueStore(SystemClock *clock = nullptr);
  DISALLOW_COPY_AND_ASSIGN(KeyValueStore);

  // strings
  Status get(std::string_view key, std::string &value);
  Status set(std::string_view key, std::string_view value);
  Status set(std::string_view key, std::string_view value, int64_t expiration, SetCondition cond, bool &performed);
  Status append(std::string_view key, std::string_view value, int64_t &length);
  Status strlen(std::string_view key, int64_t &length);

  // generic
  Status del(const ReqIterator &start, const ReqIterator &end, int64_t &removed);
  Status exists(const ReqIterator &start, const ReqIterator &end, int64_t &count);
  Status getType(std::string_view key, std::string &keyType);
  Status keys(const std::string &pattern, std::vector<std::string> &result);
  Status expireAt(std::string_view key, int64_t deadlineMs, bool &applied);
  Status pttl(std::string_view key, int64_t &ttl);
  Status persist(std::string_view key, bool &removed);
  Status flushall();
  size_t size();

  // lists
  Status lpush(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &length);
  Status rpush(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &length);
  Status lpop(std::string_view key, std::string &item);
  Status rpop(std::string_view key, std::string &item);
  Status llen(std::string_view key, size_t &len);
  Status lrange(std::string_view key, int64_t start, int64_t stop, std::vector<std::string> &items);
  Status lindex(std::string_view key, int64_t index, std::string &item);
  Status lset(std::string_view key, int64_t index, std::string_view value);
  Status linsert(std::string_view key, bool before, std::string_view pivot, std::string_view value, int64_t &length);
  Status lrem(std::string_view key, int64_t count, std::string_view value, int64_t &removed);

  // hashes
  Status hset(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &created);
  Status hget(std::string_view key, std::string_view field, std::string &value);
  Status hdel(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &removed);
  Status hexists(std::string_view key, std::string_view field);
  Status hlen(std::string_view key, size_t &len);
  Status hgetall(std::string_view key, std::vector<std::string> &res);
  Status hkeys(std::string_view key, std::vector<std::string> &keys);
  Status hvals(std::string_view key, std::vector<std::string> &vals);

  // sets
  Status sadd(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &added);
  Status srem(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &removed);
  Status smembers(std::string_view key, std::vector<std::string> &members);
  Status sismember(std::string_view key, std::string_view element);
  Status scard(std::string_view key, size_t &count);

  //----------------------------------------------------------------------------
  // Point-in-time copy of all live entries, taken under the shared lock
  //----------------------------------------------------------------------------
  void copyContents(Contents &out);

  //----------------------------------------------------------------------------
  // Replace the entire keyspace
  //----------------------------------------------------------------------------
  void replaceContents(Contents &&contents);

  int64_t nowMs() const {
    return clock->nowMs();
  }

private:
  std::shared_mutex mtx;
  Contents contents;

  std::unique_ptr<SystemClock> clockOwnership;
  SystemClock *clock;

  const Entry* lookupForRead(std::string_view key);
  Contents::iterator lookupForWrite(std::string_view key);

  template<typename T>
  Status readValue(std::string_view key, const T* &value);

  template<typename T>
  Status writeValue(std::string_view key, bool create, Contents::iterator &it, T* &value);

  void removeIfEmpty(Contents::iterator it);

  Status push(std::string_view key, const ReqIterator &start, const ReqIterator &end, bool front, int64_t &length);
  Status pop(std::string_view key, bool front, std::string &item);
};

}

#endif
