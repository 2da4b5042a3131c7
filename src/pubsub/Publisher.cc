// ----------------------------------------------------------------------
// File: Publisher.cc
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

#include "pubsub/Publisher.hh"
#include "Formatter.hh"

using namespace slotdb;

Publisher::~Publisher() {
  purgeListeners(Formatter::err("unavailable"));
}

void Publisher::purgeListeners(RedisEncodedResponse resp) {
  std::lock_guard<std::mutex> lock(mtx);

  std::set<std::shared_ptr<PendingQueue>> notified;
  for(auto it = channelSubscriptions.begin(); it != channelSubscriptions.end(); it++) {
    for(const std::shared_ptr<PendingQueue> &queue : it->second) {
      if(notified.insert(queue).second) {
        queue->appendIfAttached(RedisEncodedResponse(resp));
      }
    }
  }

  channelSubscriptions.clear();
}

bool Publisher::unsubscribeNoLock(const std::shared_ptr<PendingQueue> &connection, const std::string &channel) {
  connection->unsubscribe(channel);

  auto it = channelSubscriptions.find(channel);
  if(it == channelSubscriptions.end()) return false;

  bool existed = it->second.erase(connection);
  if(it->second.empty()) {
    channelSubscriptions.erase(it);
  }

  return existed;
}

bool Publisher::unsubscribe(std::shared_ptr<PendingQueue> connection, std::string_view channel) {
  std::lock_guard<std::mutex> lock(mtx);
  return unsubscribeNoLock(connection, std::string(channel));
}

bool Publisher::subscribeNoLock(const std::shared_ptr<PendingQueue> &connection, const std::string &channel) {
  connection->subscribe(channel);
  return channelSubscriptions[channel].insert(connection).second;
}

bool Publisher::subscribe(std::shared_ptr<PendingQueue> connection, std::string_view channel) {
  std::lock_guard<std::mutex> lock(mtx);
  return subscribeNoLock(connection, std::string(channel));
}

int Publisher::publish(std::string_view channel, std::string_view payload) {
  std::lock_guard<std::mutex> lock(mtx);

  auto it = channelSubscriptions.find(channel);
  if(it == channelSubscriptions.end()) return 0;

  std::string chan(channel);
  int hits = 0;

  for(auto sub = it->second.begin(); sub != it->second.end(); ) {
    bool stillAlive = (*sub)->addMessageIfAttached(chan, Formatter::message(channel, payload));

    if(!stillAlive) {
      sub = it->second.erase(sub);
    }
    else {
      hits++;
      sub++;
    }
  }

  if(it->second.empty()) {
    channelSubscriptions.erase(it);
  }

  return hits;
}

size_t Publisher::channelCount() {
  std::lock_guard<std::mutex> lock(mtx);
  return channelSubscriptions.size();
}

void Publisher::notifyDisconnect(Connection *conn) {
  std::shared_ptr<PendingQueue> queue = conn->getQueue();
  std::lock_guard<std::mutex> lock(mtx);

  for(const std::string &channel : queue->getSubscriptions()) {
    unsubscribeNoLock(queue, channel);
  }
}

LinkStatus Publisher::dispatch(Connection *conn, RedisRequest &req) {
  switch(req.getCommand()) {
    case RedisCommand::SUBSCRIBE: {
      if(req.size() <= 1) return conn->errArgs(req[0]);

      // The confirmation goes out under the lock, so it always precedes the
      // first message published on the channel.
      std::shared_ptr<PendingQueue> queue = conn->getQueue();
      std::lock_guard<std::mutex> lock(mtx);

      int retval = 1;
      for(size_t i = 1; i < req.size(); i++) {
        subscribeNoLock(queue, req[i]);

        if(retval >= 0) {
          retval = conn->raw(Formatter::subscribe(req[i], queue->subscriptionCount()));
        }
      }

      return retval;
    }
    case RedisCommand::UNSUBSCRIBE: {
      std::vector<std::string> channels;
      if(req.size() == 1) {
        channels = conn->getQueue()->getSubscriptions();
        if(channels.empty()) {
          return conn->raw(Formatter::unsubscribeNone());
        }
      }
      else {
        channels.assign(req.begin()+1, req.end());
      }

      int retval = 1;
      for(const std::string &channel : channels) {
        unsubscribe(conn->getQueue(), channel);

        if(retval >= 0) {
          retval = conn->raw(Formatter::unsubscribe(channel, conn->getQueue()->subscriptionCount()));
        }
      }

      return retval;
    }
    case RedisCommand::PUBLISH: {
      if(req.size() != 3) return conn->errArgs(req[0]);
      int hits = publish(req[1], req[2]);
      return conn->integer(hits);
    }
    default: {
      sdb_throw("should never reach here");
    }
  }
}
