// ----------------------------------------------------------------------
// File: AsioPoller.cc
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

#include "netio/AsioPoller.hh"
#include "Dispatcher.hh"
#include "Link.hh"
#include "Connection.hh"

namespace slotdb {

constexpr std::chrono::milliseconds AsioPoller::kTickInterval;

ActiveEntry::ActiveEntry(asio::io_context &ctx, asio::ip::tcp::socket &&sock)
: socket(std::move(sock)), strand(asio::make_strand(ctx)), timer(strand) {}

ActiveEntry::~ActiveEntry() {
  conn.reset();
  link.reset();
}

//------------------------------------------------------------------------------
// Bind one acceptor. Returns false if the address family is not available
// on this host, throws if the port itself cannot be bound.
//------------------------------------------------------------------------------
static bool bindAcceptor(asio::ip::tcp::acceptor &acceptor, const asio::ip::tcp &protocol, int port) {
  std::error_code ec;
  acceptor.open(protocol, ec);
  if(ec) return false;

  acceptor.set_option(asio::socket_base::reuse_address(true), ec);

  if(protocol == asio::ip::tcp::v6()) {
    acceptor.set_option(asio::ip::v6_only(true), ec);
  }

  acceptor.bind(asio::ip::tcp::endpoint(protocol, port), ec);
  if(ec) {
    sdb_throw("unable to bind to port " << port << ": " << ec.message());
  }

  acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    sdb_throw("unable to listen on port " << port << ": " << ec.message());
  }

  return true;
}

AsioPoller::AsioPoller(int port, size_t threadPoolSize, Dispatcher *disp, std::chrono::seconds idleTimeout)
: mPort(port), mThreadPoolSize(threadPoolSize), mDispatcher(disp), mIdleTimeout(idleTimeout),
  mAcceptor4(mContext),
  mAcceptor6(mContext),
  mNextSocket4(mContext),
  mNextSocket6(mContext)
 {

  bool have4 = bindAcceptor(mAcceptor4, asio::ip::tcp::v4(), mPort);
  bool have6 = bindAcceptor(mAcceptor6, asio::ip::tcp::v6(), mPort);

  if(!have4 && !have6) {
    sdb_throw("unable to open a listening socket on port " << mPort);
  }

  if(have4) requestAccept4();
  if(have6) requestAccept6();

  if(mThreadPoolSize == 0) mThreadPoolSize = 1;
  for(size_t i = 0; i < mThreadPoolSize; i++) {
    mThreadPool.emplace_back(&AsioPoller::workerThread, this);
  }

  sdb_info("Listening on port " << mPort << " with " << mThreadPoolSize << " worker threads");
}

AsioPoller::~AsioPoller() {
  mShutdown = true;

  std::error_code ignored;
  mAcceptor4.close(ignored);
  mAcceptor6.close(ignored);

  mInFlightTracker.setAcceptingRequests(false);
  mContext.stop();

  for(size_t i = 0; i < mThreadPool.size(); i++) {
    mThreadPool[i].join();
  }

  std::lock_guard<std::mutex> lock(mEntriesMtx);
  for(auto it = mEntries.begin(); it != mEntries.end(); it++) {
    mDispatcher->notifyDisconnect(it->second->conn.get());
  }

  mEntries.clear();
}

void AsioPoller::workerThread(ThreadAssistant &assistant) {
  mContext.run();
}

size_t AsioPoller::activeConnections() {
  std::lock_guard<std::mutex> lock(mEntriesMtx);
  return mEntries.size();
}

void AsioPoller::requestAccept4() {
  mNextSocket4 = asio::ip::tcp::socket(mContext);
  mAcceptor4.async_accept(mNextSocket4, std::bind(&AsioPoller::handleAccept4, this, std::placeholders::_1));
}

void AsioPoller::requestAccept6() {
  mNextSocket6 = asio::ip::tcp::socket(mContext);
  mAcceptor6.async_accept(mNextSocket6, std::bind(&AsioPoller::handleAccept6, this, std::placeholders::_1));
}

void AsioPoller::handleAccept4(const std::error_code& ec) {
  if(!ec) {
    handleAccept(std::move(mNextSocket4));
  }

  if(!mShutdown) {
    requestAccept4();
  }
}

void AsioPoller::handleAccept6(const std::error_code& ec) {
  if(!ec) {
    handleAccept(std::move(mNextSocket6));
  }

  if(!mShutdown) {
    requestAccept6();
  }
}

void AsioPoller::handleAccept(asio::ip::tcp::socket socket) {
  std::error_code ec;
  socket.non_blocking(true, ec);
  if(ec) {
    sdb_warn("Dropping incoming connection, unable to make socket non-blocking: " << ec.message());
    return;
  }

  socket.set_option(asio::ip::tcp::no_delay(true), ec);

  std::shared_ptr<ActiveEntry> entry = std::make_shared<ActiveEntry>(mContext, std::move(socket));
  entry->link.reset(new Link(entry->socket));
  entry->conn.reset(new Connection(entry->link.get()));

  sdb_debug("Accepted connection " << entry->conn->describe());

  {
    std::lock_guard<std::mutex> lock(mEntriesMtx);
    mEntries[entry.get()] = entry;
  }

  asio::post(entry->strand, [this, entry]() {
    armRead(entry);
    armTimer(entry);
  });
}

void AsioPoller::armRead(const std::shared_ptr<ActiveEntry> &entry) {
  entry->socket.async_wait(asio::ip::tcp::socket::wait_read,
    asio::bind_executor(entry->strand, std::bind(&AsioPoller::handleRead, this, entry, std::placeholders::_1)));
}

void AsioPoller::armWrite(const std::shared_ptr<ActiveEntry> &entry) {
  if(entry->waitingForWrite) return;

  entry->waitingForWrite = true;
  entry->socket.async_wait(asio::ip::tcp::socket::wait_write,
    asio::bind_executor(entry->strand, std::bind(&AsioPoller::handleWrite, this, entry, std::placeholders::_1)));
}

void AsioPoller::armTimer(const std::shared_ptr<ActiveEntry> &entry) {
  entry->timer.expires_after(kTickInterval);
  entry->timer.async_wait(
    asio::bind_executor(entry->strand, std::bind(&AsioPoller::handleTick, this, entry, std::placeholders::_1)));
}

void AsioPoller::handleRead(const std::shared_ptr<ActiveEntry> &entry, const std::error_code& ec) {
  if(entry->closed) return;

  if(ec) {
    closeEntry(entry, ec.message());
    return;
  }

  LinkStatus status = entry->conn->processRequests(mDispatcher, mInFlightTracker);
  if(status < 0) {
    closeEntry(entry, "connection closed");
    return;
  }

  if(entry->link->hasPendingWrites()) {
    armWrite(entry);
  }

  armRead(entry);
}

void AsioPoller::handleWrite(const std::shared_ptr<ActiveEntry> &entry, const std::error_code& ec) {
  entry->waitingForWrite = false;
  if(entry->closed) return;

  if(ec) {
    closeEntry(entry, ec.message());
    return;
  }

  if(entry->link->flushPending() < 0) {
    closeEntry(entry, "unable to flush pending writes");
    return;
  }

  if(entry->link->hasPendingWrites()) {
    armWrite(entry);
  }
}

//------------------------------------------------------------------------------
// Periodic per-connection housekeeping: deferred writes queued by other
// connections (pub/sub messages) are pushed out, and idle clients dropped.
//------------------------------------------------------------------------------
void AsioPoller::handleTick(const std::shared_ptr<ActiveEntry> &entry, const std::error_code& ec) {
  if(entry->closed || ec == asio::error::operation_aborted) return;

  if(entry->conn->isIdle(mIdleTimeout)) {
    closeEntry(entry, SSTR("idle for more than " << mIdleTimeout.count() << " seconds"));
    return;
  }

  if(entry->link->hasPendingWrites()) {
    if(entry->link->flushPending() < 0) {
      closeEntry(entry, "unable to flush pending writes");
      return;
    }

    if(entry->link->hasPendingWrites()) {
      armWrite(entry);
    }
  }

  armTimer(entry);
}

void AsioPoller::closeEntry(const std::shared_ptr<ActiveEntry> &entry, const std::string &reason) {
  if(entry->closed) return;
  entry->closed = true;

  sdb_debug("Closing connection " << entry->conn->describe() << ": " << reason);

  mDispatcher->notifyDisconnect(entry->conn.get());
  entry->link->Close();

  std::error_code ignored;
  entry->timer.cancel();
  entry->socket.cancel(ignored);

  std::lock_guard<std::mutex> lock(mEntriesMtx);
  mEntries.erase(entry.get());
}

}
