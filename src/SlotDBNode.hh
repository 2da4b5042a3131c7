// ----------------------------------------------------------------------
// File: SlotDBNode.hh
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

#ifndef SLOTDB_NODE_HH
#define SLOTDB_NODE_HH

#include <atomic>
#include <chrono>
#include <mutex>

#include "Dispatcher.hh"
#include "Configuration.hh"
#include "auth/AuthenticationDispatcher.hh"
#include "pubsub/Publisher.hh"
#include "storage/KeyValueStore.hh"
#include "storage/SnapshotManager.hh"

namespace slotdb {

struct SlotDBInfo {
  NodeRole role;
  ShardInfo shard;
  NodeAddress myself;
  size_t keys;
  size_t channels;
  std::vector<std::string> replicas;
  std::string snapshotPath;
  int64_t snapshotsWritten;
  int64_t bootTime;
  int64_t uptime;

  std::vector<std::string> toVector() const;
};

class Replicator;

//------------------------------------------------------------------------------
// Everything a single cluster member does with a request: authentication,
// subscription mode, slot ownership and redirects, execution against the
// store, keyspace notifications and replication of applied writes.
//------------------------------------------------------------------------------
class SlotDBNode : public Dispatcher {
public:
  SlotDBNode(const Configuration &config, SystemClock *clock = nullptr);
  ~SlotDBNode();

  //----------------------------------------------------------------------------
  // Load the snapshot and start periodic snapshotting. Throws
  // PersistenceError if the snapshot on disk is corrupt.
  //----------------------------------------------------------------------------
  void start();

  //----------------------------------------------------------------------------
  // Stop periodic snapshotting, and write a final snapshot. Call only once
  // no more requests are being dispatched.
  //----------------------------------------------------------------------------
  void shutdown();

  virtual LinkStatus dispatch(Connection *conn, RedisRequest &req) override final;
  virtual void notifyDisconnect(Connection *conn) override final;

  const Configuration& getConfiguration() const {
    return configuration;
  }

  KeyValueStore& getStore() {
    return store;
  }

  Publisher& getPublisher() {
    return publisher;
  }

  SnapshotManager& getSnapshotManager() {
    return snapshotManager;
  }

  SlotDBInfo info();

private:
  LinkStatus dispatchControl(Connection *conn, RedisRequest &req);
  LinkStatus dispatchCluster(Connection *conn, RedisRequest &req);
  LinkStatus dispatchReplicationHandshake(Connection *conn, RedisRequest &req);
  LinkStatus dispatchKeyed(Connection *conn, RedisRequest &req);

  //----------------------------------------------------------------------------
  // Returns an empty response if this node may execute the request, or the
  // redirect / error to send instead.
  //----------------------------------------------------------------------------
  RedisEncodedResponse checkOwnership(Connection *conn, const RedisRequest &req);
  void notifyKeyspace(const RedisRequest &req);

  Configuration configuration;
  NodeAddress myself;
  ShardInfo myShard;
  NodeRole role;

  KeyValueStore store;
  RedisDispatcher redisDispatcher;
  Publisher publisher;
  AuthenticationDispatcher authDispatcher;
  SnapshotManager snapshotManager;
  std::unique_ptr<Replicator> replicator;

  // Applying a write and queueing it for replication happen atomically, so
  // replicas observe writes in the order the primary applied them.
  std::mutex writeOrderMtx;

  std::atomic<bool> stopped {false};
  std::chrono::steady_clock::time_point bootStart;
  std::chrono::steady_clock::time_point bootEnd;
};

}
#endif
