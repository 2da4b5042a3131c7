// ----------------------------------------------------------------------
// File: Publisher.hh
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

#ifndef SLOTDB_PUBLISHER_HH
#define SLOTDB_PUBLISHER_HH

#include "../Connection.hh"
#include "../Dispatcher.hh"
#include <map>
#include <mutex>
#include <memory>
#include <set>

namespace slotdb {

class PendingQueue;
class RedisRequest;

//------------------------------------------------------------------------------
// Channel registry and message fan-out.
//
// All publishing happens under a single lock, and every subscriber's outbound
// queue is ordered, so messages published on one channel reach each
// subscriber in the order they were published.
//------------------------------------------------------------------------------
class Publisher : public Dispatcher {
public:
  ~Publisher();

  // Subscribe connection to given channel. Return false if the subscription
  // existed already.
  bool subscribe(std::shared_ptr<PendingQueue> connection, std::string_view channel);
  bool unsubscribe(std::shared_ptr<PendingQueue> connection, std::string_view channel);

  // Returns number of subscribers the message was delivered to
  int publish(std::string_view channel, std::string_view payload);
  void purgeListeners(RedisEncodedResponse resp);

  size_t channelCount();

  virtual LinkStatus dispatch(Connection *conn, RedisRequest &req) override final;
  virtual void notifyDisconnect(Connection *conn) override final;

private:
  std::mutex mtx;
  std::map<std::string, std::set<std::shared_ptr<PendingQueue>>, std::less<>> channelSubscriptions;

  bool subscribeNoLock(const std::shared_ptr<PendingQueue> &connection, const std::string &channel);
  bool unsubscribeNoLock(const std::shared_ptr<PendingQueue> &connection, const std::string &channel);
};

}

#endif
