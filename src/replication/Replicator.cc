// ----------------------------------------------------------------------
// File: Replicator.cc
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

#include "replication/Replicator.hh"
#include <qclient/Logger.hh>

using namespace slotdb;

class ReplicationHandshake : public qclient::Handshake {
public:
  virtual ~ReplicationHandshake() override {}

  ReplicationHandshake(const ShardInfo &sh, const std::string &pw)
  : shard(sh), password(pw) {
    restart();
  }

  virtual std::vector<std::string> provideHandshake() override {
    return {"SLOTDB_REPLICATION_HANDSHAKE", std::to_string(shard.start), std::to_string(shard.end), password };
  }

  virtual Status validateResponse(const qclient::redisReplyPtr &reply) override {
    if(!reply) {
      return Status::INVALID;
    }

    if(reply->type != REDIS_REPLY_STATUS) {
      sdb_warn("Replication handshake rejected: " << qclient::describeRedisReply(reply));
      return Status::INVALID;
    }

    if(std::string(reply->str, reply->len) != "OK") {
      return Status::INVALID;
    }

    return Status::VALID_COMPLETE;
  }

  virtual void restart() override {}

private:
  ShardInfo shard;
  std::string password;
};

class SlotDBLogger : public qclient::Logger {
public:

  SlotDBLogger() {
    logLevel = qclient::LogLevel::kWarn;
  }

  void print(qclient::LogLevel level, int line, const std::string &file, const std::string &msg) override {
    ___log("QCLIENT (" << qclient::logLevelToString(level) << "): " << msg);
  }
};

ReplicaTalker::ReplicaTalker(const NodeAddress &rep, const ShardInfo &shard, const std::string &password)
: replica(rep) {

  qclient::Options opts;

  opts.transparentRedirects = false;
  opts.retryStrategy = qclient::RetryStrategy::NoRetries();
  opts.backpressureStrategy = qclient::BackpressureStrategy::Default();
  opts.logger.reset(new SlotDBLogger());
  opts.chainHandshake(std::unique_ptr<qclient::Handshake>(new ReplicationHandshake(shard, password)));

  qcl.reset(new qclient::QClient(replica.hostname, replica.port, std::move(opts)));
  reaperThread.reset(&ReplicaTalker::reaper, this);
}

ReplicaTalker::~ReplicaTalker() {
  reaperThread.stop();
  cv.notify_all();
  reaperThread.join();
  qcl.reset();
}

void ReplicaTalker::forward(const RedisRequest &req) {
  std::lock_guard<std::mutex> lock(mtx);
  inflight.emplace_back(qcl->execute(req.getContents()));
  cv.notify_one();
}

void ReplicaTalker::reportFailure(const std::string &msg) {
  failed++;

  std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
  if(now - lastReport < std::chrono::seconds(10)) {
    suppressed++;
    return;
  }

  sdb_warn("Replication towards " << replica.toString() << " failed: " << msg <<
    " (" << suppressed << " similar messages suppressed)");

  lastReport = now;
  suppressed = 0;
}

void ReplicaTalker::reaper(ThreadAssistant &assistant) {
  while(!assistant.terminationRequested()) {
    std::future<qclient::redisReplyPtr> fut;

    {
      std::unique_lock<std::mutex> lock(mtx);
      if(inflight.empty()) {
        cv.wait_for(lock, std::chrono::milliseconds(100));
        continue;
      }

      fut = std::move(inflight.front());
      inflight.pop_front();
    }

    while(fut.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
      if(assistant.terminationRequested()) return;
    }

    qclient::redisReplyPtr reply = fut.get();
    if(!reply) {
      reportFailure("replica unreachable, write dropped");
    }
    else if(reply->type == REDIS_REPLY_ERROR) {
      reportFailure(qclient::describeRedisReply(reply));
    }
    else {
      acknowledged++;
    }
  }
}

Replicator::Replicator(const ShardInfo &shard, const NodeAddress &myself, const std::string &password) {
  for(const NodeAddress &node : shard.replicas()) {
    if(node == myself) continue;
    talkers.emplace_back(new ReplicaTalker(node, shard, password));
  }
}

void Replicator::forward(const RedisRequest &req) {
  for(size_t i = 0; i < talkers.size(); i++) {
    talkers[i]->forward(req);
  }
}

std::vector<std::string> Replicator::describe() const {
  std::vector<std::string> ret;
  for(size_t i = 0; i < talkers.size(); i++) {
    ret.emplace_back(SSTR(talkers[i]->getReplica().toString() << " acknowledged=" <<
      talkers[i]->getAcknowledged() << " failed=" << talkers[i]->getFailed()));
  }
  return ret;
}
