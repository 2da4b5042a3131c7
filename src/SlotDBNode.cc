// ----------------------------------------------------------------------
// File: SlotDBNode.cc
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

#include "SlotDBNode.hh"
#include "replication/Replicator.hh"
#include "redis/ArrayResponseBuilder.hh"
#include "utils/FileUtils.hh"
#include "utils/StringUtils.hh"
#include "utils/TimeFormatting.hh"

#include <sys/stat.h>

using namespace slotdb;

SlotDBNode::SlotDBNode(const Configuration &config, SystemClock *clock)
: configuration(config), myself(config.getMyself()), myShard(config.getMyShard()),
  role(config.getRole()), store(clock), redisDispatcher(store),
  authDispatcher(config.extractPasswordOrDie()),
  snapshotManager(store,
    SnapshotManager::filename(config.getSnapshotDir(), config.getMyShard(), config.getMyself().port),
    config.getSnapshotInterval()) {

  bootStart = std::chrono::steady_clock::now();

  if(role == NodeRole::kPrimary && myShard.nodes.size() > 1) {
    replicator.reset(new Replicator(myShard, myself, config.extractPasswordOrDie()));
  }

  bootEnd = std::chrono::steady_clock::now();
}

SlotDBNode::~SlotDBNode() {
  sdb_info("Shutting down SlotDB node.");
}

void SlotDBNode::start() {
  std::string err;
  if(!mkpath(configuration.getSnapshotDir() + "/", S_IRWXU | S_IRGRP | S_IXGRP, err)) {
    throw PersistenceError(SSTR("cannot create snapshot directory: " << err));
  }

  snapshotManager.restore();
  snapshotManager.start();

  sdb_event("Node " << myself.toString() << " serving slots " << myShard.start << "-" << myShard.end
    << " as " << roleToString(role));
}

void SlotDBNode::shutdown() {
  if(stopped.exchange(true)) return;

  snapshotManager.stop();

  std::string err;
  if(snapshotManager.snapshot(err)) {
    sdb_event("Final snapshot written to " << snapshotManager.getPath());
  }
}

void SlotDBNode::notifyDisconnect(Connection *conn) {
  publisher.notifyDisconnect(conn);
}

LinkStatus SlotDBNode::dispatch(Connection *conn, RedisRequest &req) {
  if(authDispatcher.isEnabled() && !conn->authorized) {
    switch(req.getCommand()) {
      case RedisCommand::AUTH:
      case RedisCommand::PING:
      case RedisCommand::SLOTDB_REPLICATION_HANDSHAKE: {
        break;
      }
      default: {
        return conn->noauth("Authentication required.");
      }
    }
  }

  if(conn->isSubscribed()) {
    switch(req.getCommand()) {
      case RedisCommand::SUBSCRIBE:
      case RedisCommand::UNSUBSCRIBE:
      case RedisCommand::PING: {
        break;
      }
      default: {
        return conn->err("only (UN)SUBSCRIBE / PING allowed in this context");
      }
    }
  }

  switch(req.getCommandType()) {
    case CommandType::AUTHENTICATION: {
      return authDispatcher.dispatch(conn, req);
    }
    case CommandType::REPLICATION: {
      return dispatchReplicationHandshake(conn, req);
    }
    case CommandType::PUBSUB: {
      return publisher.dispatch(conn, req);
    }
    case CommandType::CONTROL: {
      return dispatchControl(conn, req);
    }
    case CommandType::READ:
    case CommandType::WRITE: {
      return dispatchKeyed(conn, req);
    }
    default: {
      return conn->err(SSTR("unknown command " << quotes(req[0])));
    }
  }
}

LinkStatus SlotDBNode::dispatchControl(Connection *conn, RedisRequest &req) {
  switch(req.getCommand()) {
    case RedisCommand::PING: {
      if(conn->isSubscribed() && req.size() <= 2) {
        // subscribers expect an array, like every other push they receive
        return conn->raw(Formatter::vector({"pong", req.size() == 2 ? req[1] : std::string()}));
      }

      return conn->raw(handlePing(req));
    }
    case RedisCommand::ECHO: {
      return conn->raw(handleEcho(req));
    }
    case RedisCommand::CLIENT: {
      if(req.size() != 2) return conn->errArgs(req[0]);
      if(caseInsensitiveEquals(req[1], "id")) {
        return conn->integer(conn->getID());
      }

      return conn->err(SSTR("unknown subcommand " << quotes(req[1])));
    }
    case RedisCommand::CLUSTER: {
      return dispatchCluster(conn, req);
    }
    case RedisCommand::SAVE: {
      if(req.size() != 1) return conn->errArgs(req[0]);

      std::string err;
      if(!snapshotManager.snapshot(err)) {
        return conn->err(SSTR("snapshot failed: " << err));
      }

      return conn->ok();
    }
    case RedisCommand::DBSIZE: {
      if(req.size() != 1) return conn->errArgs(req[0]);
      return conn->integer(store.size());
    }
    case RedisCommand::SLOTDB_INFO: {
      if(req.size() != 1) return conn->errArgs(req[0]);
      return conn->raw(Formatter::statusVector(info().toVector()));
    }
    default: {
      sdb_throw("internal dispatching error for " << req.toPrintableString());
    }
  }
}

LinkStatus SlotDBNode::dispatchCluster(Connection *conn, RedisRequest &req) {
  if(req.size() < 2) return conn->errArgs(req[0]);

  if(caseInsensitiveEquals(req[1], "keyslot")) {
    if(req.size() != 3) return conn->errArgs("cluster keyslot");
    return conn->integer(SlotMap::slotForKey(req[2]));
  }

  if(caseInsensitiveEquals(req[1], "slots")) {
    if(req.size() != 2) return conn->errArgs("cluster slots");

    const std::vector<ShardInfo> &shards = configuration.getSlotMap().getShards();
    ArrayResponseBuilder builder(shards.size());

    for(const ShardInfo &shard : shards) {
      ArrayResponseBuilder shardBuilder(2 + shard.nodes.size());
      shardBuilder.push_back(Formatter::integer(shard.start));
      shardBuilder.push_back(Formatter::integer(shard.end));

      for(const NodeAddress &node : shard.nodes) {
        ArrayResponseBuilder nodeBuilder(2);
        nodeBuilder.push_back(Formatter::string(node.hostname));
        nodeBuilder.push_back(Formatter::integer(node.port));
        shardBuilder.push_back(nodeBuilder.buildResponse());
      }

      builder.push_back(shardBuilder.buildResponse());
    }

    return conn->raw(builder.buildResponse());
  }

  return conn->err(SSTR("unknown subcommand " << quotes(req[1])));
}

LinkStatus SlotDBNode::dispatchReplicationHandshake(Connection *conn, RedisRequest &req) {
  if(req.size() != 4) return conn->errArgs(req[0]);

  if(role == NodeRole::kPrimary) {
    sdb_warn("Rejecting replication handshake from " << conn->describe() << ", this node is a primary");
    return conn->err("replication handshake rejected: this node is a primary");
  }

  int64_t start, end;
  if(!my_strtoll(req[1], start) || !my_strtoll(req[2], end)) {
    return conn->raw(Formatter::errInteger());
  }

  if(start != myShard.start || end != myShard.end) {
    sdb_warn("Rejecting replication handshake from " << conn->describe() << " for slots " << start << "-" << end
      << ", this node serves " << myShard.start << "-" << myShard.end);
    return conn->err(SSTR("replication handshake rejected: shard range mismatch, this node serves "
      << myShard.start << "-" << myShard.end));
  }

  if(!authDispatcher.validate(req[3])) {
    sdb_warn("Rejecting replication handshake from " << conn->describe() << ", invalid password");
    return conn->err("replication handshake rejected: invalid password");
  }

  sdb_event("Accepted replication link from " << conn->describe());
  conn->authorized = true;
  conn->replicationLink = true;
  return conn->ok();
}

RedisEncodedResponse SlotDBNode::checkOwnership(Connection *conn, const RedisRequest &req) {
  bool isWrite = (req.getCommandType() == CommandType::WRITE);

  // Keyless commands act on this node's contents only.
  if(req.getCommand() == RedisCommand::KEYS || req.getCommand() == RedisCommand::FLUSHALL) {
    if(isWrite && role == NodeRole::kReplica && !conn->replicationLink) {
      return Formatter::err(SSTR("writes must be sent to the primary " << myShard.primary().toString()));
    }

    return {};
  }

  // Malformed, let the store dispatcher produce the arity error.
  if(req.size() < 2) return {};

  ReqIterator start = req.begin() + 1;
  ReqIterator end = req.begin() + 2;
  if(req.getCommand() == RedisCommand::DEL || req.getCommand() == RedisCommand::EXISTS) {
    end = req.end();
  }

  int64_t slot = SlotMap::slotForKey(*start);
  for(auto it = start + 1; it != end; it++) {
    if(SlotMap::slotForKey(*it) != slot) {
      return Formatter::crossSlot();
    }
  }

  if(!myShard.ownsSlot(slot)) {
    const ShardInfo *owner = configuration.getSlotMap().getShardForSlot(slot);
    sdb_assert(owner);
    return Formatter::moved(slot, owner->primary());
  }

  if(isWrite && role == NodeRole::kReplica && !conn->replicationLink) {
    return Formatter::moved(slot, myShard.primary());
  }

  return {};
}

void SlotDBNode::notifyKeyspace(const RedisRequest &req) {
  if(req.getCommand() == RedisCommand::FLUSHALL) return;

  std::string event = StringUtils::toLower(req[0]);
  const std::string &prefix = configuration.getNotifyPrefix();

  if(req.getCommand() == RedisCommand::DEL) {
    for(auto it = req.begin() + 1; it != req.end(); it++) {
      publisher.publish(prefix + *it, event);
    }
    return;
  }

  publisher.publish(prefix + req[1], event);
}

LinkStatus SlotDBNode::dispatchKeyed(Connection *conn, RedisRequest &req) {
  RedisEncodedResponse redirect = checkOwnership(conn, req);
  if(!redirect.empty()) {
    return conn->raw(std::move(redirect));
  }

  if(req.getCommandType() == CommandType::READ) {
    return conn->raw(redisDispatcher.dispatch(req));
  }

  RedisEncodedResponse resp;

  {
    std::lock_guard<std::mutex> lock(writeOrderMtx);
    resp = redisDispatcher.dispatch(req);

    if(!resp.isError()) {
      if(replicator) replicator->forward(req);
      notifyKeyspace(req);
    }
  }

  return conn->raw(std::move(resp));
}

SlotDBInfo SlotDBNode::info() {
  SlotDBInfo ret;
  ret.role = role;
  ret.shard = myShard;
  ret.myself = myself;
  ret.keys = store.size();
  ret.channels = publisher.channelCount();
  if(replicator) ret.replicas = replicator->describe();
  ret.snapshotPath = snapshotManager.getPath();
  ret.snapshotsWritten = snapshotManager.getSnapshotCount();
  ret.bootTime = std::chrono::duration_cast<std::chrono::seconds>(bootEnd - bootStart).count();
  ret.uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - bootEnd).count();
  return ret;
}

std::vector<std::string> SlotDBInfo::toVector() const {
  std::vector<std::string> ret;
  ret.emplace_back(SSTR("ROLE " << roleToString(role)));
  ret.emplace_back(SSTR("SLOTS " << shard.start << "-" << shard.end));
  ret.emplace_back(SSTR("MYSELF " << myself.toString()));
  ret.emplace_back(SSTR("PRIMARY " << shard.primary().toString()));
  ret.emplace_back(SSTR("KEYS " << keys));
  ret.emplace_back(SSTR("CHANNELS " << channels));
  ret.emplace_back(SSTR("REPLICAS " << replicas.size()));
  for(const std::string &replica : replicas) {
    ret.emplace_back(SSTR("REPLICA " << replica));
  }
  ret.emplace_back(SSTR("SNAPSHOT-PATH " << snapshotPath));
  ret.emplace_back(SSTR("SNAPSHOTS-WRITTEN " << snapshotsWritten));
  ret.emplace_back(SSTR("BOOT-TIME " << bootTime << " (" << formatTime(std::chrono::seconds(bootTime)) << ")"));
  ret.emplace_back(SSTR("UPTIME " << uptime << " (" << formatTime(std::chrono::seconds(uptime)) << ")"));
  return ret;
}
