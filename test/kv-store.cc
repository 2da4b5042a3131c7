// ----------------------------------------------------------------------
// File: kv-store.cc
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

#include "storage/KeyValueStore.hh"
#include "test-utils.hh"
#include <gtest/gtest.h>
#include <limits>

using namespace slotdb;

class Key_Value_Store : public ::testing::Test {
protected:
  Key_Value_Store() : clock(true), store(&clock) {
    clock.set(SystemClock::time_point() + std::chrono::seconds(1000));
  }

  SystemClock clock;
  KeyValueStore store;
};

TEST_F(Key_Value_Store, Strings) {
  std::string tmp;
  ASSERT_TRUE(store.get("doc:1:line:3", tmp).IsNotFound());

  ASSERT_TRUE(store.set("doc:1:line:3", "hello").ok());
  ASSERT_TRUE(store.get("doc:1:line:3", tmp).ok());
  ASSERT_EQ(tmp, "hello");

  // setting the same value twice leaves the same state
  ASSERT_TRUE(store.set("doc:1:line:3", "hello").ok());
  ASSERT_EQ(store.size(), 1u);

  int64_t length;
  ASSERT_TRUE(store.append("doc:1:line:3", " world", length).ok());
  ASSERT_EQ(length, 11);
  ASSERT_TRUE(store.strlen("doc:1:line:3", length).ok());
  ASSERT_EQ(length, 11);
  ASSERT_TRUE(store.strlen("not-there", length).ok());
  ASSERT_EQ(length, 0);

  ASSERT_TRUE(store.append("fresh", "abc", length).ok());
  ASSERT_EQ(length, 3);
}

TEST_F(Key_Value_Store, SetConditions) {
  bool performed;
  ASSERT_TRUE(store.set("k", "v1", 0, SetCondition::kIfExists, performed).ok());
  ASSERT_FALSE(performed);

  ASSERT_TRUE(store.set("k", "v1", 0, SetCondition::kIfNotExists, performed).ok());
  ASSERT_TRUE(performed);

  ASSERT_TRUE(store.set("k", "v2", 0, SetCondition::kIfNotExists, performed).ok());
  ASSERT_FALSE(performed);

  ASSERT_TRUE(store.set("k", "v3", 0, SetCondition::kIfExists, performed).ok());
  ASSERT_TRUE(performed);

  std::string tmp;
  ASSERT_TRUE(store.get("k", tmp).ok());
  ASSERT_EQ(tmp, "v3");
}

TEST_F(Key_Value_Store, WrongTypeLeavesStoreUntouched) {
  RedisRequest items = {"a", "b"};
  int64_t length;
  ASSERT_TRUE(store.rpush("mylist", items.begin(), items.end(), length).ok());

  std::string tmp;
  ASSERT_TRUE(store.get("mylist", tmp).IsWrongType());
  ASSERT_TRUE(store.append("mylist", "x", length).IsWrongType());

  int64_t created;
  RedisRequest pairs = {"f", "v"};
  ASSERT_TRUE(store.hset("mylist", pairs.begin(), pairs.end(), created).IsWrongType());

  std::vector<std::string> contents;
  ASSERT_TRUE(store.lrange("mylist", 0, -1, contents).ok());
  ASSERT_EQ(contents, make_vec("a", "b"));

  ASSERT_TRUE(store.getType("mylist", tmp).ok());
  ASSERT_EQ(tmp, "list");
}

TEST_F(Key_Value_Store, Lists) {
  RedisRequest items = {"1", "2", "3"};
  int64_t length;
  ASSERT_TRUE(store.lpush("list", items.begin(), items.end(), length).ok());
  ASSERT_EQ(length, 3);

  std::vector<std::string> contents;
  ASSERT_TRUE(store.lrange("list", 0, -1, contents).ok());
  ASSERT_EQ(contents, make_vec("3", "2", "1"));

  ASSERT_TRUE(store.lrange("list", -2, 100, contents).ok());
  ASSERT_EQ(contents, make_vec("2", "1"));

  ASSERT_TRUE(store.lrange("list", 5, 10, contents).ok());
  ASSERT_TRUE(contents.empty());

  std::string item;
  ASSERT_TRUE(store.lindex("list", -1, item).ok());
  ASSERT_EQ(item, "1");
  ASSERT_TRUE(store.lindex("list", 3, item).IsNotFound());

  ASSERT_TRUE(store.lset("list", 0, "three").ok());
  ASSERT_EQ(store.lset("list", 7, "x").getErrc(), Status::kOutOfRange);
  ASSERT_TRUE(store.lset("nope", 0, "x").IsNotFound());

  ASSERT_TRUE(store.linsert("list", true, "2", "1.5", length).ok());
  ASSERT_EQ(length, 4);
  ASSERT_TRUE(store.linsert("list", false, "missing", "x", length).ok());
  ASSERT_EQ(length, -1);

  ASSERT_TRUE(store.lrange("list", 0, -1, contents).ok());
  ASSERT_EQ(contents, make_vec("three", "1.5", "2", "1"));

  int64_t removed;
  ASSERT_TRUE(store.lrem("list", 0, "2", removed).ok());
  ASSERT_EQ(removed, 1);

  ASSERT_TRUE(store.lpop("list", item).ok());
  ASSERT_EQ(item, "three");
  ASSERT_TRUE(store.rpop("list", item).ok());
  ASSERT_EQ(item, "1");
  ASSERT_TRUE(store.rpop("list", item).ok());
  ASSERT_EQ(item, "1.5");

  // last element popped, key is gone
  ASSERT_TRUE(store.lpop("list", item).IsNotFound());
  ASSERT_EQ(store.size(), 0u);

  std::string keyType;
  ASSERT_TRUE(store.getType("list", keyType).ok());
  ASSERT_EQ(keyType, "none");
}

TEST_F(Key_Value_Store, ListRemoveCounts) {
  RedisRequest items = {"a", "b", "a", "c", "a"};
  int64_t length;
  ASSERT_TRUE(store.rpush("l", items.begin(), items.end(), length).ok());

  int64_t removed;
  std::vector<std::string> contents;
  ASSERT_TRUE(store.lrem("l", -1, "a", removed).ok());
  ASSERT_EQ(removed, 1);
  ASSERT_TRUE(store.lrange("l", 0, -1, contents).ok());
  ASSERT_EQ(contents, make_vec("a", "b", "a", "c"));

  ASSERT_TRUE(store.lrem("l", 1, "a", removed).ok());
  ASSERT_EQ(removed, 1);
  ASSERT_TRUE(store.lrange("l", 0, -1, contents).ok());
  ASSERT_EQ(contents, make_vec("b", "a", "c"));

  ASSERT_TRUE(store.rpush("l", items.begin(), items.end(), length).ok());
  ASSERT_EQ(length, 8);

  // the most negative count removes every match, from the tail
  ASSERT_TRUE(store.lrem("l", std::numeric_limits<int64_t>::min(), "a", removed).ok());
  ASSERT_EQ(removed, 4);
  ASSERT_TRUE(store.lrange("l", 0, -1, contents).ok());
  ASSERT_EQ(contents, make_vec("b", "c", "b", "c"));

  ASSERT_TRUE(store.lrem("l", std::numeric_limits<int64_t>::max(), "c", removed).ok());
  ASSERT_EQ(removed, 2);

  size_t len;
  ASSERT_TRUE(store.llen("l", len).ok());
  ASSERT_EQ(len, 2u);
}

TEST_F(Key_Value_Store, Hashes) {
  RedisRequest pairs = {"f1", "v1", "f2", "v2"};
  int64_t created;
  ASSERT_TRUE(store.hset("hash", pairs.begin(), pairs.end(), created).ok());
  ASSERT_EQ(created, 2);

  RedisRequest update = {"f1", "v1-new"};
  ASSERT_TRUE(store.hset("hash", update.begin(), update.end(), created).ok());
  ASSERT_EQ(created, 0);

  RedisRequest odd = {"f1"};
  ASSERT_FALSE(store.hset("hash", odd.begin(), odd.end(), created).ok());

  std::string value;
  ASSERT_TRUE(store.hget("hash", "f1", value).ok());
  ASSERT_EQ(value, "v1-new");
  ASSERT_TRUE(store.hget("hash", "f3", value).IsNotFound());
  ASSERT_TRUE(store.hexists("hash", "f2").ok());
  ASSERT_TRUE(store.hexists("hash", "f3").IsNotFound());

  size_t len;
  ASSERT_TRUE(store.hlen("hash", len).ok());
  ASSERT_EQ(len, 2u);

  std::vector<std::string> res;
  ASSERT_TRUE(store.hgetall("hash", res).ok());
  ASSERT_EQ(res, make_vec("f1", "v1-new", "f2", "v2"));
  ASSERT_TRUE(store.hkeys("hash", res).ok());
  ASSERT_EQ(res, make_vec("f1", "f2"));
  ASSERT_TRUE(store.hvals("hash", res).ok());
  ASSERT_EQ(res, make_vec("v1-new", "v2"));

  int64_t removed;
  RedisRequest fields = {"f1", "f2", "f3"};
  ASSERT_TRUE(store.hdel("hash", fields.begin(), fields.end(), removed).ok());
  ASSERT_EQ(removed, 2);
  ASSERT_EQ(store.size(), 0u);
}

TEST_F(Key_Value_Store, Sets) {
  RedisRequest members = {"a", "b", "a", "c"};
  int64_t added;
  ASSERT_TRUE(store.sadd("set", members.begin(), members.end(), added).ok());
  ASSERT_EQ(added, 3);

  ASSERT_TRUE(store.sismember("set", "b").ok());
  ASSERT_TRUE(store.sismember("set", "z").IsNotFound());

  size_t count;
  ASSERT_TRUE(store.scard("set", count).ok());
  ASSERT_EQ(count, 3u);

  std::vector<std::string> res;
  ASSERT_TRUE(store.smembers("set", res).ok());
  ASSERT_EQ(res, make_vec("a", "b", "c"));

  int64_t removed;
  ASSERT_TRUE(store.srem("set", members.begin(), members.end(), removed).ok());
  ASSERT_EQ(removed, 3);
  ASSERT_TRUE(store.scard("set", count).ok());
  ASSERT_EQ(count, 0u);
}

TEST_F(Key_Value_Store, Expiration) {
  ASSERT_TRUE(store.set("key", "value").ok());

  int64_t ttl;
  ASSERT_TRUE(store.pttl("key", ttl).ok());
  ASSERT_EQ(ttl, -1);
  ASSERT_TRUE(store.pttl("nope", ttl).ok());
  ASSERT_EQ(ttl, -2);

  bool applied;
  ASSERT_TRUE(store.expireAt("key", store.nowMs() + 5000, applied).ok());
  ASSERT_TRUE(applied);
  ASSERT_TRUE(store.pttl("key", ttl).ok());
  ASSERT_EQ(ttl, 5000);

  ASSERT_TRUE(store.expireAt("nope", store.nowMs() + 5000, applied).ok());
  ASSERT_FALSE(applied);

  clock.advance(std::chrono::milliseconds(4999));
  std::string tmp;
  ASSERT_TRUE(store.get("key", tmp).ok());

  clock.advance(std::chrono::milliseconds(1));
  ASSERT_TRUE(store.get("key", tmp).IsNotFound());
  ASSERT_EQ(store.size(), 0u);

  // a plain SET clears the expiration
  bool performed;
  ASSERT_TRUE(store.set("key2", "v", store.nowMs() + 1000, SetCondition::kAlways, performed).ok());
  ASSERT_TRUE(store.set("key2", "v").ok());
  ASSERT_TRUE(store.pttl("key2", ttl).ok());
  ASSERT_EQ(ttl, -1);

  ASSERT_TRUE(store.expireAt("key2", store.nowMs() + 1000, applied).ok());
  bool removed;
  ASSERT_TRUE(store.persist("key2", removed).ok());
  ASSERT_TRUE(removed);
  ASSERT_TRUE(store.persist("key2", removed).ok());
  ASSERT_FALSE(removed);

  // deadline in the past deletes immediately
  ASSERT_TRUE(store.expireAt("key2", store.nowMs() - 1, applied).ok());
  ASSERT_TRUE(applied);
  ASSERT_TRUE(store.get("key2", tmp).IsNotFound());
}

TEST_F(Key_Value_Store, GenericOperations) {
  ASSERT_TRUE(store.set("doc:1:line:1", "a").ok());
  ASSERT_TRUE(store.set("doc:1:line:2", "b").ok());
  ASSERT_TRUE(store.set("doc:2:line:1", "c").ok());
  ASSERT_TRUE(store.set("other", "d").ok());

  std::vector<std::string> keys;
  ASSERT_TRUE(store.keys("doc:1:*", keys).ok());
  ASSERT_EQ(keys, make_vec("doc:1:line:1", "doc:1:line:2"));

  ASSERT_TRUE(store.keys("doc:?:line:1", keys).ok());
  ASSERT_EQ(keys, make_vec("doc:1:line:1", "doc:2:line:1"));

  ASSERT_TRUE(store.keys("*", keys).ok());
  ASSERT_EQ(keys.size(), 4u);

  RedisRequest toCheck = {"doc:1:line:1", "doc:1:line:1", "missing"};
  int64_t count;
  ASSERT_TRUE(store.exists(toCheck.begin(), toCheck.end(), count).ok());
  ASSERT_EQ(count, 2);

  int64_t removed;
  ASSERT_TRUE(store.del(toCheck.begin(), toCheck.end(), removed).ok());
  ASSERT_EQ(removed, 1);
  ASSERT_EQ(store.size(), 3u);

  ASSERT_TRUE(store.flushall().ok());
  ASSERT_EQ(store.size(), 0u);
}

TEST_F(Key_Value_Store, CopyAndReplace) {
  ASSERT_TRUE(store.set("a", "1").ok());
  bool performed;
  ASSERT_TRUE(store.set("b", "2", store.nowMs() + 10, SetCondition::kAlways, performed).ok());

  clock.advance(std::chrono::milliseconds(10));

  KeyValueStore::Contents contents;
  store.copyContents(contents);
  ASSERT_EQ(contents.size(), 1u);
  ASSERT_EQ(std::get<std::string>(contents["a"].value), "1");

  KeyValueStore other;
  other.replaceContents(std::move(contents));

  std::string tmp;
  ASSERT_TRUE(other.get("a", tmp).ok());
  ASSERT_EQ(tmp, "1");
  ASSERT_EQ(other.size(), 1u);
}
