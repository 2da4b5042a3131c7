// ----------------------------------------------------------------------
// File: test-utils.hh
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

#ifndef SLOTDB_TEST_UTILS_HH
#define SLOTDB_TEST_UTILS_HH

#include <vector>
#include <memory>
#include <thread>
#include "Common.hh"
#include "RedisRequest.hh"
#include "Configuration.hh"
#include <qclient/QClient.hh>
#include <gtest/gtest.h>

namespace slotdb {

class SlotDBNode; class AsioPoller;

#define RETRY_ASSERT_TRUE_3(cond, retry, waitInterval) { \
  size_t nretries = 0; \
  while(nretries++ < retry) { \
    std::this_thread::sleep_for(std::chrono::milliseconds(waitInterval)); \
    if((cond)) { \
      sdb_info("Condition '" << #cond << "' is true after " << nretries << " attempts"); \
      break; \
    } \
  } \
  ASSERT_TRUE(cond) << " - failure after " << nretries << " retries "; \
}

// retry every 10ms, for up to 10 seconds
#define RETRY_ASSERT_TRUE(cond) RETRY_ASSERT_TRUE_3(cond, 1000, 10)

// necessary because C macros are dumb and don't undestand
// universal initialization with brackets {}
template<typename... Args>
RedisRequest make_req(Args... args) {
  return RedisRequest { args... };
}

template<typename... Args>
std::vector<std::string> make_vec(Args... args) {
  return std::vector<std::string> { args... };
}

class GlobalEnv : public testing::Environment {
public:
  virtual void SetUp() override;
  virtual void TearDown() override;

  void clearTestDirectory();

  const std::string testdir = "/tmp/slotdb-tests";
  static NodeAddress server(int id);
};
extern GlobalEnv &commonState;

//------------------------------------------------------------------------------
// Describes a cluster layout, and renders the configuration file of any of
// its members.
//------------------------------------------------------------------------------
struct TestTopology {
  struct Shard {
    int64_t start;
    int64_t end;
    std::vector<int> servers; // first one is the primary
  };

  std::vector<Shard> shards;
  std::string password;
  int64_t snapshotInterval = 0;
  int64_t idleTimeout = 0;

  std::string renderConfiguration(int id) const;
  Configuration makeConfiguration(int id) const;

  // a single shard holding all slots, served by one node
  static TestTopology single();

  // two shards, each with a primary and a replica: servers 0 and 1 serve
  // slots 0-8191, servers 2 and 3 serve slots 8192-16383
  static TestTopology twoShardsReplicated();
};

//------------------------------------------------------------------------------
// Everything needed to run one member of the cluster in-process: the node,
// the poller serving it, and a client talking to it. Everything is
// initialized lazily, except the node itself.
//------------------------------------------------------------------------------
class TestNode {
public:
  TestNode(const TestTopology &topology, int id);
  ~TestNode();

  SlotDBNode* node();
  AsioPoller* poller();
  qclient::QClient* client();

  // a fresh client, not sharing the connection of client()
  std::unique_ptr<qclient::QClient> makeClient();

  NodeAddress myself() const {
    return address;
  }

  // stop serving, write the final snapshot, and drop everything
  void spindown();

private:
  NodeAddress address;
  Configuration configuration;

  std::unique_ptr<SlotDBNode> nodeptr;
  std::unique_ptr<AsioPoller> pollerptr;
  std::unique_ptr<qclient::QClient> clientptr;
};

// Brings up the given servers of a topology on demand.
class TestCluster {
public:
  TestCluster(const TestTopology &topology);
  ~TestCluster();

  TestNode* node(int id);
  qclient::QClient* client(int id) { return node(id)->client(); }

  void spinup(int id);
  void spindown(int id);

private:
  TestTopology topology;
  std::map<int, std::unique_ptr<TestNode>> testnodes;
};

class SingleNodeFixture : public TestCluster, public ::testing::Test {
public:
  SingleNodeFixture() : TestCluster(TestTopology::single()) {}
};

class TwoShardsFixture : public TestCluster, public ::testing::Test {
public:
  TwoShardsFixture() : TestCluster(TestTopology::twoShardsReplicated()) {}
};

}

#endif
