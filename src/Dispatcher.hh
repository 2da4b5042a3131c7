// ----------------------------------------------------------------------
// File: Dispatcher.hh
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

#ifndef SLOTDB_DISPATCHER_HH
#define SLOTDB_DISPATCHER_HH

#include "Common.hh"
#include "Link.hh"
#include "Commands.hh"
#include "Connection.hh"

namespace slotdb {

class Dispatcher {
public:
  virtual LinkStatus dispatch(Connection *conn, RedisRequest &req) = 0;
  virtual void notifyDisconnect(Connection *conn) = 0;

  RedisEncodedResponse handlePing(RedisRequest &req);
  RedisEncodedResponse handleEcho(RedisRequest &req);
  virtual ~Dispatcher() {}
};

class KeyValueStore;

//------------------------------------------------------------------------------
// Executes READ and WRITE commands against the store. Knows nothing about
// slots, replication or notifications, the node layers those on top.
//------------------------------------------------------------------------------
class RedisDispatcher : public Dispatcher {
public:
  RedisDispatcher(KeyValueStore &store);
  virtual LinkStatus dispatch(Connection *conn, RedisRequest &req) override final;
  virtual void notifyDisconnect(Connection *conn) override final {}

  RedisEncodedResponse dispatch(RedisRequest &req);

private:
  RedisEncodedResponse dispatchRead(RedisRequest &req);
  RedisEncodedResponse dispatchWrite(RedisRequest &req);
  RedisEncodedResponse errArgs(RedisRequest &request);
  RedisEncodedResponse dispatchingError(RedisRequest &request);

  RedisEncodedResponse dispatchSET(RedisRequest &req);
  RedisEncodedResponse dispatchEXPIRE(RedisRequest &req, int64_t unitMs);
  RedisEncodedResponse dispatchTTL(RedisRequest &req, int64_t unitMs);

  KeyValueStore &store;
};

}

#endif
