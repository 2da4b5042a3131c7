// ----------------------------------------------------------------------
// File: AsioPoller.hh
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

#ifndef SLOTDB_ASIO_POLLER_HH
#define SLOTDB_ASIO_POLLER_HH

#include "utils/AssistedThread.hh"
#include "utils/InFlightTracker.hh"
#include <asio.hpp>
#include <chrono>
#include <map>
#include <memory>

namespace slotdb {

class Dispatcher;
class Link;
class Connection;

//------------------------------------------------------------------------------
// One accepted client. All handlers touching an entry run on its strand, so
// reading requests, flushing deferred writes and closing never overlap.
//------------------------------------------------------------------------------
struct ActiveEntry {
  ActiveEntry(asio::io_context &ctx, asio::ip::tcp::socket &&sock);
  ~ActiveEntry();

  asio::ip::tcp::socket socket;
  asio::strand<asio::io_context::executor_type> strand;
  asio::steady_timer timer;

  std::unique_ptr<Link> link;
  std::unique_ptr<Connection> conn;

  bool closed = false;
  bool waitingForWrite = false;
};

//------------------------------------------------------------------------------
// Listens at a specific network port, and handles redis connections using
// the given dispatcher. Throws FatalException if the port cannot be bound.
//------------------------------------------------------------------------------
class AsioPoller {
public:
  AsioPoller(int port, size_t threadPoolSize, Dispatcher *disp,
    std::chrono::seconds idleTimeout = std::chrono::seconds(0));
  ~AsioPoller();

  void workerThread(ThreadAssistant &assistant);

  size_t activeConnections();

  static constexpr std::chrono::milliseconds kTickInterval {100};

private:
  void requestAccept4();
  void requestAccept6();

  void handleAccept(asio::ip::tcp::socket socket);
  void handleAccept4(const std::error_code& ec);
  void handleAccept6(const std::error_code& ec);

  void armRead(const std::shared_ptr<ActiveEntry> &entry);
  void armWrite(const std::shared_ptr<ActiveEntry> &entry);
  void armTimer(const std::shared_ptr<ActiveEntry> &entry);

  void handleRead(const std::shared_ptr<ActiveEntry> &entry, const std::error_code& ec);
  void handleWrite(const std::shared_ptr<ActiveEntry> &entry, const std::error_code& ec);
  void handleTick(const std::shared_ptr<ActiveEntry> &entry, const std::error_code& ec);

  void closeEntry(const std::shared_ptr<ActiveEntry> &entry, const std::string &reason);

  std::atomic<bool> mShutdown {false};

  int mPort;
  size_t mThreadPoolSize;
  Dispatcher* mDispatcher;
  std::chrono::seconds mIdleTimeout;
  std::vector<AssistedThread> mThreadPool;

  InFlightTracker mInFlightTracker;

  asio::io_context mContext;
  asio::ip::tcp::acceptor mAcceptor4;
  asio::ip::tcp::acceptor mAcceptor6;

  asio::ip::tcp::socket mNextSocket4;
  asio::ip::tcp::socket mNextSocket6;

  std::mutex mEntriesMtx;
  std::map<ActiveEntry*, std::shared_ptr<ActiveEntry>> mEntries;
};

}

#endif
