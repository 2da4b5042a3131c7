// ----------------------------------------------------------------------
// File: Link.cc
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

#include <iostream>
#include <limits>
#include <atomic>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>

#include "Link.hh"
#include "Common.hh"
#include "Utils.hh"

using namespace slotdb;

namespace {
  // No external linkage
  bool connectionLogging = true;
  size_t maxPendingBytes = 64 * 1024 * 1024;
  std::atomic<int64_t> nextLinkId {1};
}

void Link::setConnectionLogging(bool val) {
  connectionLogging = val;
}

void Link::setMaxPendingBytes(size_t val) {
  maxPendingBytes = val;
}

Link::Link() : id(nextLinkId++) {
  host = "internal-buffer";
}

Link::Link(asio::ip::tcp::socket &socket)
: id(nextLinkId++) {
  asioSocket = &socket;

  std::error_code ec;
  asio::ip::tcp::endpoint endpoint = socket.remote_endpoint(ec);
  if(!ec) {
    host = SSTR(endpoint.address().to_string() << ":" << endpoint.port());
  }
  else {
    host = "unknown";
  }

  if(connectionLogging) sdb_info("New link from " << describe());
}

Link::Link(int fd_)
: id(nextLinkId++) {
  fd = fd_;
  host = SSTR("fd-" << fd);
  fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
}

Link::~Link() {
  if(asioSocket && connectionLogging) sdb_info("Shutting down link from " << describe());
  Close();
}

std::string Link::describe() const {
  return SSTR(host << " [" << id << "]");
}

LinkStatus Link::Recv(char *buff, int blen, int timeout) {
  if(closed) return -1;
  if(asioSocket) return asioRecv(buff, blen, timeout);
  if(fd >= 0) return fdRecv(buff, blen, timeout);
  return streamRecv(buff, blen, timeout);
}

LinkStatus Link::Close(int defer) {
  if(closed) return 0;
  closed = true;
  dead = true;

  std::lock_guard<std::mutex> lock(outboundMtx);
  outbound.clear();

  if(asioSocket) return asioClose(defer);
  if(fd >= 0) return fdClose(defer);
  return streamClose(defer);
}

LinkStatus Link::rawSend(const char *buff, int blen) {
  if(asioSocket) return asioSend(buff, blen);
  if(fd >= 0) return fdSend(buff, blen);
  return streamSend(buff, blen);
}

LinkStatus Link::Send(const char *buff, int blen) {
  std::lock_guard<std::mutex> lock(outboundMtx);
  if(dead) return -1;

  if(!outbound.empty()) {
    // Preserve ordering: everything goes behind what is already queued.
    outbound.append(buff, blen);
    LinkStatus rc = flushPendingNoLock();
    if(rc < 0) return rc;
    return blen;
  }

  LinkStatus rc = rawSend(buff, blen);
  if(rc < 0) {
    dead = true;
    return rc;
  }

  if(rc < blen) {
    outbound.append(buff + rc, blen - rc);

    if(outbound.size() > maxPendingBytes) {
      sdb_warn("Outbound buffer of " << describe() << " exceeded " << maxPendingBytes << " bytes, peer is not consuming replies - dropping link");
      dead = true;
      outbound.clear();
      return -1;
    }
  }

  return blen;
}

LinkStatus Link::Send(const std::string &str) {
  return Send(str.c_str(), str.size());
}

LinkStatus Link::flushPending() {
  std::lock_guard<std::mutex> lock(outboundMtx);
  if(dead) return -1;
  return flushPendingNoLock();
}

LinkStatus Link::flushPendingNoLock() {
  if(outbound.empty()) return 1;

  LinkStatus rc = rawSend(outbound.c_str(), outbound.size());
  if(rc < 0) {
    dead = true;
    outbound.clear();
    return rc;
  }

  outbound.erase(0, rc);

  if(outbound.size() > maxPendingBytes) {
    sdb_warn("Outbound buffer of " << describe() << " exceeded " << maxPendingBytes << " bytes, peer is not consuming replies - dropping link");
    dead = true;
    outbound.clear();
    return -1;
  }

  return 1;
}

bool Link::hasPendingWrites() {
  std::lock_guard<std::mutex> lock(outboundMtx);
  return !outbound.empty();
}

size_t Link::pendingBytes() {
  std::lock_guard<std::mutex> lock(outboundMtx);
  return outbound.size();
}

LinkStatus Link::asioRecv(char *buff, int blen, int timeout) {
  asio::mutable_buffer asioBuff(buff, blen);

  std::error_code ec;
  int len = asioSocket->receive(asioBuff, 0, ec);

  if(ec.value() == 0) {
    // A readable socket returning zero bytes means the peer hung up.
    if(len == 0 && blen > 0) return -1;
    return len;
  }
  else if(ec == asio::error::would_block || ec == asio::error::try_again) {
    return 0;
  }

  return -1;
}

LinkStatus Link::asioSend(const char *buff, int blen) {
  std::error_code ec;
  size_t len = asioSocket->send(asio::buffer(buff, blen), 0, ec);

  if(ec.value() == 0) return len;
  if(ec == asio::error::would_block || ec == asio::error::try_again) return 0;
  return -1;
}

LinkStatus Link::asioClose(int defer) {
  std::error_code ignored_ec;
  asioSocket->shutdown(asio::ip::tcp::socket::shutdown_both, ignored_ec);
  return 0;
}

LinkStatus Link::streamSend(const char *buff, int blen) {
  if(stream.eof()) return -1;
  stream.write(buff, blen);
  return blen;
}

LinkStatus Link::streamClose(int defer) {
  stream.ignore(std::numeric_limits<std::streamsize>::max());
  return 0;
}

LinkStatus Link::streamRecv(char *buff, int blen, int timeout) {
  if(stream.eof()) return -1;

  int totalRead = 0;
  while(true) {
    int rc = stream.readsome(buff, blen);
    totalRead += rc;

    blen -= rc;
    buff += rc;

    if(rc == 0 || blen == 0) break;
  }

  return totalRead;
}

LinkStatus Link::fdRecv(char *buff, int blen, int timeout) {
  int rc = recv(fd, buff, blen, 0);
  if(rc == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
  if(rc == 0 && blen > 0) return -1;
  return rc;
}

LinkStatus Link::fdSend(const char *buff, int blen) {
  int rc = send(fd, buff, blen, MSG_NOSIGNAL);
  if(rc == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
  return rc;
}

LinkStatus Link::fdClose(int defer) {
  int rc = close(fd);
  fd = -1;
  return rc;
}
