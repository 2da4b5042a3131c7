// ----------------------------------------------------------------------
// File: Connection.hh
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

#ifndef SLOTDB_CONNECTION_HH
#define SLOTDB_CONNECTION_HH

#include "Link.hh"
#include "RedisParser.hh"
#include "BufferedWriter.hh"
#include "Formatter.hh"
#include "pubsub/SubscriptionTracker.hh"
#include <chrono>
#include <memory>

namespace slotdb {

//------------------------------------------------------------------------------
// The outbound side of a Connection, which may outlive it.
//
// The publisher holds on to these for as long as a connection is subscribed
// to something, and may try to push messages through a queue whose connection
// has disconnected in the meantime. Once detached, all pushes are dropped.
//------------------------------------------------------------------------------
class Connection;
class PendingQueue {
public:
  PendingQueue(Connection *c) : conn(c) {}
  ~PendingQueue() {}

  void detachConnection() {
    std::lock_guard<std::mutex> lock(mtx);
    conn = nullptr;
  }

  LinkStatus appendResponse(RedisEncodedResponse &&raw);
  bool appendIfAttached(RedisEncodedResponse &&raw);

  //----------------------------------------------------------------------------
  // Deliver a published message, but only if we are still subscribed to the
  // channel. Returns false if the connection is gone, so the publisher can
  // forget about us.
  //----------------------------------------------------------------------------
  bool addMessageIfAttached(const std::string &channel, RedisEncodedResponse &&raw);

  bool subscribe(const std::string &channel);
  bool unsubscribe(const std::string &channel);
  std::vector<std::string> getSubscriptions();
  size_t subscriptionCount();

private:
  LinkStatus appendResponseNoLock(RedisEncodedResponse &&raw);

  Connection *conn;
  std::mutex mtx;
  SubscriptionTracker subscriptionTracker;
};

//------------------------------------------------------------------------------
// Keeps track of connection-specific state.
//------------------------------------------------------------------------------
class Dispatcher; class InFlightTracker;

class Connection {
public:
  Connection(Link *link);
  ~Connection();
  std::string describe() const;
  int64_t getID() const { return id; }

  LinkStatus raw(RedisEncodedResponse &&encoded);
  LinkStatus err(std::string_view msg);
  LinkStatus errArgs(std::string_view cmd);
  LinkStatus string(std::string_view str);
  LinkStatus status(std::string_view msg);
  LinkStatus ok();
  LinkStatus integer(int64_t number);
  LinkStatus noauth(std::string_view msg);

  // Set once AUTH succeeds, or when no password is configured
  bool authorized = false;

  // Set once the peer completes the replication handshake
  bool replicationLink = false;

  LinkStatus processRequests(Dispatcher *dispatcher, const InFlightTracker &tracker);
  void setResponseBuffering(bool value);
  void flush();

  std::shared_ptr<PendingQueue> getQueue() {
    return pendingQueue;
  }

  bool isSubscribed() {
    return pendingQueue->subscriptionCount() != 0;
  }

  //----------------------------------------------------------------------------
  // Time since the last complete request was received, ignoring connections
  // in subscription mode: subscribers are legitimately silent.
  //----------------------------------------------------------------------------
  bool isIdle(std::chrono::seconds timeout);

  class FlushGuard {
  public:
    FlushGuard(Connection *c) : conn(c) { }
    ~FlushGuard() { if(conn) { conn->flush(); } }
  private:
    Connection *conn;
  };

private:
  BufferedWriter writer;

  RedisRequest currentRequest;
  RedisParser parser;
  std::shared_ptr<PendingQueue> pendingQueue;

  std::string description;
  int64_t id;
  std::chrono::steady_clock::time_point lastActivity;

  friend class PendingQueue;
};

}

#endif
