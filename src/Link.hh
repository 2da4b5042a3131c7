// ----------------------------------------------------------------------
// File: Link.hh
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

#ifndef SLOTDB_LINK_HH
#define SLOTDB_LINK_HH

#include <sstream>
#include <mutex>
#include <asio.hpp>

namespace slotdb {

//------------------------------------------------------------------------------
// Return code from link operations.
// 1 or higher means success. The value is typically the number of bytes read.
// 0 means slow link, ie there's not enough data yet to complete the operation.
//   This is not an error, and you should retry later.
// Negative means an error occured.
//------------------------------------------------------------------------------
using LinkStatus = int;

//------------------------------------------------------------------------------
// Our link class either maps to an asio socket, to a raw file descriptor, or
// to an internal buffer. The last one is needed for unit tests: anything
// sent on it can be read back with Recv.
//
// Sends never block. Whatever the socket does not accept right away is
// kept in an outbound buffer, and retried with flushPending() once the
// socket becomes writable again. A peer which does not drain its socket
// will eventually overflow the buffer, at which point the link is declared
// dead.
//------------------------------------------------------------------------------
class Link {
public:
  Link();
  Link(asio::ip::tcp::socket &socket);
  Link(int fd_);
  ~Link();

  LinkStatus Recv(char *buff, int blen, int timeout);
  LinkStatus Send(const char *buff, int blen);
  LinkStatus Send(const std::string &str);
  LinkStatus Close(int defer = 0);

  LinkStatus flushPending();
  bool hasPendingWrites();
  size_t pendingBytes();

  std::string describe() const;
  int64_t getID() const { return id; }

  // Set global connection logging config
  static void setConnectionLogging(bool val);

  // Maximum amount of outbound bytes buffered for a single link
  static void setMaxPendingBytes(size_t val);

private:
  std::stringstream stream;
  asio::ip::tcp::socket *asioSocket = nullptr;
  int fd = -1;
  bool dead = false;
  bool closed = false;

  int64_t id;
  std::string host;

  std::mutex outboundMtx;
  std::string outbound;

  LinkStatus streamRecv(char *buff, int blen, int timeout);
  LinkStatus streamSend(const char *buff, int blen);
  LinkStatus streamClose(int defer = 0);

  LinkStatus asioRecv(char *buff, int blen, int timeout);
  LinkStatus asioSend(const char *buff, int blen);
  LinkStatus asioClose(int defer = 0);

  LinkStatus fdRecv(char *buff, int blen, int timeout);
  LinkStatus fdSend(const char *buff, int blen);
  LinkStatus fdClose(int defer = 0);

  LinkStatus rawSend(const char *buff, int blen);
  LinkStatus flushPendingNoLock();
};

}
#endif
