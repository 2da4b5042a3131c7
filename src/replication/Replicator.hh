// ----------------------------------------------------------------------
// File: Replicator.hh
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

#ifndef SLOTDB_REPLICATION_REPLICATOR_HH
#define SLOTDB_REPLICATION_REPLICATOR_HH

#include <qclient/QClient.hh>
#include "cluster/SlotMap.hh"
#include "utils/AssistedThread.hh"
#include "RedisRequest.hh"
#include <condition_variable>
#include <deque>
#include <future>

namespace slotdb {

//------------------------------------------------------------------------------
// Ordered stream of writes towards a single replica. Requests are pipelined
// on one qclient connection, so the replica receives them in the order
// forward() was called. Replies are collected in the background and only
// logged: the client that caused the write has long been acknowledged.
//------------------------------------------------------------------------------
class ReplicaTalker {
public:
  ReplicaTalker(const NodeAddress &replica, const ShardInfo &shard, const std::string &password);
  ~ReplicaTalker();
  DISALLOW_COPY_AND_ASSIGN(ReplicaTalker);

  void forward(const RedisRequest &req);

  const NodeAddress& getReplica() const {
    return replica;
  }

  int64_t getAcknowledged() const {
    return acknowledged;
  }

  int64_t getFailed() const {
    return failed;
  }

private:
  void reaper(ThreadAssistant &assistant);
  void reportFailure(const std::string &msg);

  NodeAddress replica;
  std::unique_ptr<qclient::QClient> qcl;

  std::mutex mtx;
  std::condition_variable cv;
  std::deque<std::future<qclient::redisReplyPtr>> inflight;

  std::atomic<int64_t> acknowledged {0};
  std::atomic<int64_t> failed {0};

  // rate limiting of failure messages
  std::chrono::steady_clock::time_point lastReport;
  int64_t suppressed = 0;

  AssistedThread reaperThread;
};

//------------------------------------------------------------------------------
// Fans out the writes applied on a primary to every replica of its shard.
//------------------------------------------------------------------------------
class Replicator {
public:
  Replicator(const ShardInfo &shard, const NodeAddress &myself, const std::string &password);
  DISALLOW_COPY_AND_ASSIGN(Replicator);

  void forward(const RedisRequest &req);

  size_t size() const {
    return talkers.size();
  }

  std::vector<std::string> describe() const;

private:
  std::vector<std::unique_ptr<ReplicaTalker>> talkers;
};

}

#endif
