// ----------------------------------------------------------------------
// File: e2e.cc
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

#include "SlotDBNode.hh"
#include "netio/AsioPoller.hh"
#include "utils/StringUtils.hh"
#include "Utils.hh"
#include "test-utils.hh"
#include "test-reply-macros.hh"
#include <gtest/gtest.h>
#include <qclient/QClient.hh>
#include <qclient/pubsub/MessageQueue.hh>
#include <qclient/pubsub/BaseSubscriber.hh>

using namespace slotdb;
using namespace qclient;

class e2e : public SingleNodeFixture {};
class e2eSharded : public TwoShardsFixture {};

TestTopology protectedTopology() {
  TestTopology topology = TestTopology::twoShardsReplicated();
  topology.password = "hunter2";
  return topology;
}

class e2eAuth : public TestCluster, public ::testing::Test {
public:
  e2eAuth() : TestCluster(protectedTopology()) {}
};

TestTopology idleTopology() {
  TestTopology topology = TestTopology::single();
  topology.idleTimeout = 1;
  return topology;
}

class e2eIdle : public TestCluster, public ::testing::Test {
public:
  e2eIdle() : TestCluster(idleTopology()) {}
};

bool storeHasValue(SlotDBNode *node, const std::string &key, const std::string &expected) {
  std::string value;
  return node->getStore().get(key, value).ok() && value == expected;
}

int64_t replicationCounter(SlotDBNode *node, const std::string &name) {
  std::vector<std::string> replicas = node->info().replicas;
  if(replicas.empty()) return -1;

  std::string prefix = name + "=";
  for(const std::string &part : split(replicas[0], " ")) {
    int64_t value;
    if(StringUtils::startsWith(part, prefix) && my_strtoll(part.substr(prefix.size()), value)) {
      return value;
    }
  }

  return -1;
}

bool writeReachesReplica(QClient *primary, SlotDBNode *replica, const std::string &key, const std::string &value) {
  redisReplyPtr reply = primary->exec("set", key, value).get();
  if(!reply || reply->type != REDIS_REPLY_STATUS) return false;
  return storeHasValue(replica, key, value);
}

size_t countMessages(qclient::MessageQueue *queue, const std::string &channel, const std::string &payload) {
  size_t found = 0;
  auto iterator = queue->begin();

  for(size_t i = 0; i < queue->size(); i++) {
    Message& item = iterator.item();

    if(item.getMessageType() == MessageType::kMessage &&
       item.getChannel() == channel &&
       item.getPayload() == payload) {
      found++;
    }

    iterator.next();
  }

  return found;
}

TEST_F(e2e, BasicOperations) {
  spinup(0);

  ASSERT_REPLY(client(0)->exec("ping"), "PONG");
  ASSERT_NIL(client(0)->exec("get", "doc:1:line:3"));
  ASSERT_REPLY(client(0)->exec("set", "doc:1:line:3", "hello"), "OK");
  ASSERT_REPLY(client(0)->exec("get", "doc:1:line:3"), "hello");
  ASSERT_REPLY(client(0)->exec("append", "doc:1:line:3", " world"), 11);
  ASSERT_REPLY(client(0)->exec("strlen", "doc:1:line:3"), 11);
  ASSERT_REPLY(client(0)->exec("type", "doc:1:line:3"), "string");

  ASSERT_REPLY(client(0)->exec("rpush", "list", "a", "b", "c"), 3);
  ASSERT_REPLY(client(0)->exec("lrange", "list", "0", "-1"), make_vec("a", "b", "c"));
  ASSERT_REPLY(client(0)->exec("lpop", "list"), "a");

  ASSERT_REPLY(client(0)->exec("hset", "hash", "f1", "v1"), 1);
  ASSERT_REPLY(client(0)->exec("hget", "hash", "f1"), "v1");

  ASSERT_REPLY(client(0)->exec("sadd", "set", "m1", "m2", "m1"), 2);
  ASSERT_REPLY(client(0)->exec("scard", "set"), 2);

  ASSERT_ERR(client(0)->exec("lpush", "hash", "x"), "WRONGTYPE Operation against a key holding the wrong kind of value");
  ASSERT_ERR(client(0)->exec("not-a-command"), "ERR unknown command 'not-a-command'");
  ASSERT_REPLY(client(0)->exec("dbsize"), 4);
}

TEST_F(e2e, PipelinedClients) {
  spinup(0);

  std::unique_ptr<QClient> client2 = node(0)->makeClient();
  std::unique_ptr<QClient> client3 = node(0)->makeClient();

  std::vector<std::future<redisReplyPtr>> futures;
  for(size_t i = 0; i < 100; i++) {
    futures.emplace_back(client(0)->exec("rpush", "{list}1", SSTR("a-" << i)));
    futures.emplace_back(client2->exec("rpush", "{list}2", SSTR("b-" << i)));
    futures.emplace_back(client3->exec("set", SSTR("key-" << i), SSTR(i)));
  }

  for(size_t i = 0; i < futures.size(); i++) {
    redisReplyPtr reply = futures[i].get();
    ASSERT_NE(reply, nullptr);
    ASSERT_NE(reply->type, REDIS_REPLY_ERROR);
  }

  // replies on a single connection come back in request order
  ASSERT_REPLY(client(0)->exec("lindex", "{list}1", "99"), "a-99");
  ASSERT_REPLY(client2->exec("lindex", "{list}2", "0"), "b-0");
  ASSERT_REPLY(client3->exec("get", "key-57"), "57");
  ASSERT_REPLY(client(0)->exec("llen", "{list}2"), 100);
  ASSERT_REPLY(client(0)->exec("dbsize"), 102);

  ASSERT_EQ(node(0)->poller()->activeConnections(), 3u);
}

TEST_F(e2e, ExpirationTakesEffect) {
  spinup(0);

  ASSERT_REPLY(client(0)->exec("set", "ephemeral", "v", "px", "300"), "OK");
  ASSERT_REPLY(client(0)->exec("set", "permanent", "v"), "OK");
  ASSERT_REPLY(client(0)->exec("ttl", "permanent"), -1);
  ASSERT_REPLY(client(0)->exec("ttl", "missing"), -2);

  RETRY_ASSERT_TRUE(qclient::describeRedisReply(client(0)->exec("get", "ephemeral").get()) == "(nil)");
  ASSERT_REPLY(client(0)->exec("exists", "ephemeral"), 0);
  ASSERT_REPLY(client(0)->exec("get", "permanent"), "v");
}

TEST_F(e2e, ClusterCommands) {
  spinup(0);

  ASSERT_REPLY(client(0)->exec("cluster", "keyslot", "foo"), 12182);
  ASSERT_REPLY(client(0)->exec("cluster", "keyslot", "{foo}bar"), 12182);

  redisReplyPtr reply = client(0)->exec("cluster", "slots").get();
  ASSERT_NE(reply, nullptr);
  ASSERT_EQ(reply->type, REDIS_REPLY_ARRAY);
  ASSERT_EQ(reply->elements, 1u);

  redisReply *shard = reply->element[0];
  ASSERT_EQ(shard->type, REDIS_REPLY_ARRAY);
  ASSERT_EQ(shard->elements, 3u);
  ASSERT_EQ(shard->element[0]->integer, 0);
  ASSERT_EQ(shard->element[1]->integer, 16383);

  redisReply *primary = shard->element[2];
  ASSERT_EQ(primary->elements, 2u);
  ASSERT_EQ(std::string(primary->element[0]->str, primary->element[0]->len), "localhost");
  ASSERT_EQ(primary->element[1]->integer, 23456);
}

TEST_F(e2e, PubSub) {
  spinup(0);

  std::shared_ptr<qclient::MessageQueue> mq = std::make_shared<qclient::MessageQueue>();
  qclient::Members members;
  members.push_back(node(0)->myself().hostname, node(0)->myself().port);
  qclient::BaseSubscriber subscriber(members, mq, qclient::SubscriptionOptions());

  ASSERT_REPLY(client(0)->exec("publish", "test-channel", "giraffes"), 0);
  subscriber.subscribe( {"test-channel", "__keyspace__:doc:1:line:3"} );

  RETRY_ASSERT_TRUE(
    qclient::describeRedisReply(client(0)->exec("publish", "test-channel", "penguins").get()) ==
    "(integer) 1"
  );

  ASSERT_REPLY(client(0)->exec("publish", "test-channel", "chickens"), 1);
  ASSERT_REPLY(client(0)->exec("set", "doc:1:line:3", "hello"), "OK");
  ASSERT_REPLY(client(0)->exec("del", "doc:1:line:3"), 1);

  RETRY_ASSERT_TRUE(countMessages(mq.get(), "test-channel", "chickens") == 1);
  RETRY_ASSERT_TRUE(countMessages(mq.get(), "__keyspace__:doc:1:line:3", "set") == 1);
  RETRY_ASSERT_TRUE(countMessages(mq.get(), "__keyspace__:doc:1:line:3", "del") == 1);
  ASSERT_EQ(countMessages(mq.get(), "test-channel", "giraffes"), 0u);

  ASSERT_EQ(node(0)->node()->getPublisher().channelCount(), 2u);
}

TEST_F(e2e, SnapshotSurvivesRestart) {
  spinup(0);

  ASSERT_REPLY(client(0)->exec("set", "doc:1:line:3", "hello"), "OK");
  ASSERT_REPLY(client(0)->exec("sadd", "set", "a", "b"), 2);
  ASSERT_REPLY(client(0)->exec("save"), "OK");
  ASSERT_REPLY(client(0)->exec("set", "after-save", "still-there"), "OK");

  spindown(0);
  spinup(0);

  ASSERT_REPLY(client(0)->exec("get", "doc:1:line:3"), "hello");
  ASSERT_REPLY(client(0)->exec("get", "after-save"), "still-there");
  ASSERT_REPLY(client(0)->exec("sismember", "set", "b"), 1);
  ASSERT_REPLY(client(0)->exec("dbsize"), 3);
}

TEST_F(e2eSharded, Redirects) {
  spinup(0); spinup(2);

  ASSERT_ERR(client(0)->exec("set", "foo", "bar"), "MOVED 12182 localhost:23458");
  ASSERT_REPLY(client(2)->exec("set", "foo", "bar"), "OK");
  ASSERT_REPLY(client(2)->exec("get", "foo"), "bar");
  ASSERT_ERR(client(2)->exec("get", "bar"), "MOVED 5061 localhost:23456");
  ASSERT_ERR(client(0)->exec("del", "bar", "foo"), "CROSSSLOT Keys in request don't hash to the same slot");

  // nothing leaked into the wrong shard
  ASSERT_EQ(node(0)->node()->getStore().size(), 0u);
  ASSERT_EQ(node(2)->node()->getStore().size(), 1u);
}

TEST_F(e2eSharded, Replication) {
  // replicas first, so the primaries find them listening
  spinup(1); spinup(3);
  spinup(0); spinup(2);

  ASSERT_REPLY(client(0)->exec("set", "bar", "1"), "OK");
  ASSERT_REPLY(client(0)->exec("rpush", "{bar}list", "a", "b"), 2);
  ASSERT_REPLY(client(2)->exec("set", "foo", "2"), "OK");

  RETRY_ASSERT_TRUE(storeHasValue(node(1)->node(), "bar", "1"));
  RETRY_ASSERT_TRUE(storeHasValue(node(3)->node(), "foo", "2"));
  RETRY_ASSERT_TRUE(node(1)->node()->getStore().size() == 2u);
  ASSERT_EQ(node(3)->node()->getStore().size(), 1u);

  // replicas serve reads, but redirect writes to their primary
  ASSERT_REPLY(client(1)->exec("get", "bar"), "1");
  ASSERT_REPLY(client(1)->exec("lrange", "{bar}list", "0", "-1"), make_vec("a", "b"));
  ASSERT_ERR(client(1)->exec("set", "bar", "3"), "MOVED 5061 localhost:23456");
  ASSERT_ERR(client(1)->exec("get", "foo"), "MOVED 12182 localhost:23458");

  // writes are applied on the replica in the order the primary applied them
  for(size_t i = 0; i < 50; i++) {
    client(0)->exec("set", "bar", SSTR(i));
  }

  ASSERT_REPLY(client(0)->exec("del", "{bar}list"), 1);
  RETRY_ASSERT_TRUE(storeHasValue(node(1)->node(), "bar", "49"));
  RETRY_ASSERT_TRUE(node(1)->node()->getStore().size() == 1u);

  RETRY_ASSERT_TRUE(node(0)->node()->info().replicas[0].find("failed=0") != std::string::npos);
}

TEST_F(e2eSharded, UnreachableReplica) {
  spinup(0);

  // the replica is down, clients of the primary don't notice
  ASSERT_REPLY(client(0)->exec("set", "{bar}missed", "1"), "OK");
  ASSERT_REPLY(client(0)->exec("get", "{bar}missed"), "1");
  RETRY_ASSERT_TRUE(replicationCounter(node(0)->node(), "failed") >= 1);
  ASSERT_EQ(replicationCounter(node(0)->node(), "acknowledged"), 0);

  // once it comes up, later writes flow again
  spinup(1);
  RETRY_ASSERT_TRUE(writeReachesReplica(client(0), node(1)->node(), "bar", "2"));
  RETRY_ASSERT_TRUE(replicationCounter(node(0)->node(), "acknowledged") >= 1);

  // what was dropped while it was down stays dropped
  std::string value;
  ASSERT_TRUE(node(1)->node()->getStore().get("{bar}missed", value).IsNotFound());
}

TEST_F(e2eAuth, Authentication) {
  spinup(1);
  spinup(0);

  ASSERT_ERR(client(0)->exec("get", "bar"), "NOAUTH Authentication required.");
  ASSERT_ERR(client(0)->exec("auth", "hunter3"), "WRONGPASS invalid username-password pair");
  ASSERT_REPLY(client(0)->exec("auth", "hunter2"), "OK");
  ASSERT_REPLY(client(0)->exec("set", "bar", "protected"), "OK");

  // the primary authenticates its replication link with the same password
  RETRY_ASSERT_TRUE(storeHasValue(node(1)->node(), "bar", "protected"));

  std::unique_ptr<QClient> other = node(0)->makeClient();
  ASSERT_ERR(other->exec("get", "bar"), "NOAUTH Authentication required.");
  ASSERT_REPLY(other->exec("ping"), "PONG");
}

TEST_F(e2eIdle, IdleConnectionsAreClosed) {
  spinup(0);

  ASSERT_REPLY(client(0)->exec("set", "a", "b"), "OK");
  ASSERT_EQ(node(0)->poller()->activeConnections(), 1u);

  RETRY_ASSERT_TRUE(node(0)->poller()->activeConnections() == 0u);

  // the client reconnects transparently
  ASSERT_REPLY(client(0)->exec("get", "a"), "b");
}
