// ----------------------------------------------------------------------
// File: Connection.cc
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

#include "Connection.hh"
#include "Dispatcher.hh"
#include "Formatter.hh"
#include "utils/InFlightTracker.hh"
using namespace slotdb;

bool PendingQueue::subscribe(const std::string &channel) {
  std::lock_guard<std::mutex> lock(mtx);
  return subscriptionTracker.addChannel(channel);
}

bool PendingQueue::unsubscribe(const std::string &channel) {
  std::lock_guard<std::mutex> lock(mtx);
  return subscriptionTracker.removeChannel(channel);
}

std::vector<std::string> PendingQueue::getSubscriptions() {
  std::lock_guard<std::mutex> lock(mtx);
  return subscriptionTracker.getChannels();
}

size_t PendingQueue::subscriptionCount() {
  std::lock_guard<std::mutex> lock(mtx);
  return subscriptionTracker.size();
}

bool PendingQueue::addMessageIfAttached(const std::string &channel, RedisEncodedResponse &&raw) {
  std::lock_guard<std::mutex> lock(mtx);
  if(!conn) return false;

  if(!subscriptionTracker.hasChannel(channel)) return true;
  Connection::FlushGuard guard(conn);
  appendResponseNoLock(std::move(raw));
  return true;
}

bool PendingQueue::appendIfAttached(RedisEncodedResponse &&raw) {
  std::lock_guard<std::mutex> lock(mtx);

  if(!conn) return false;
  Connection::FlushGuard guard(conn);
  appendResponseNoLock(std::move(raw));
  return true;
}

LinkStatus PendingQueue::appendResponseNoLock(RedisEncodedResponse &&raw) {
  if(!conn) sdb_throw("attempted to append a raw response to a pendingQueue while being detached from a Connection. Contents: '" << raw.val << "'");
  return conn->writer.send(std::move(raw.val));
}

LinkStatus PendingQueue::appendResponse(RedisEncodedResponse &&raw) {
  std::lock_guard<std::mutex> lock(mtx);
  return appendResponseNoLock(std::move(raw));
}

Connection::Connection(Link *l)
: writer(l), parser(l), pendingQueue(new PendingQueue(this)),
  description(l->describe()), id(l->getID()),
  lastActivity(std::chrono::steady_clock::now()) {
}

Connection::~Connection() {
  pendingQueue->detachConnection();
}

LinkStatus Connection::raw(RedisEncodedResponse &&encoded) {
  return pendingQueue->appendResponse(std::move(encoded));
}

LinkStatus Connection::err(std::string_view msg) {
  return pendingQueue->appendResponse(Formatter::err(msg));
}

LinkStatus Connection::errArgs(std::string_view cmd) {
  return pendingQueue->appendResponse(Formatter::errArgs(cmd));
}

LinkStatus Connection::string(std::string_view str) {
  return pendingQueue->appendResponse(Formatter::string(str));
}

LinkStatus Connection::status(std::string_view msg) {
  return pendingQueue->appendResponse(Formatter::status(msg));
}

LinkStatus Connection::ok() {
  return pendingQueue->appendResponse(Formatter::ok());
}

LinkStatus Connection::integer(int64_t number) {
  return pendingQueue->appendResponse(Formatter::integer(number));
}

LinkStatus Connection::noauth(std::string_view msg) {
  return pendingQueue->appendResponse(Formatter::noauth(msg));
}

LinkStatus Connection::processRequests(Dispatcher *dispatcher, const InFlightTracker &inFlightTracker) {
  FlushGuard guard(this);

  while(inFlightTracker.isAcceptingRequests()) {
    LinkStatus status = parser.fetch(currentRequest);

    if(status == RedisParser::kProtocolError) {
      // Framing is lost, nothing after this point can be trusted. Tell the
      // client why, then have the caller close the connection.
      this->err(SSTR("Protocol error: " << parser.getError()));
      return status;
    }

    if(status < 0) {
      return status; // link error
    }

    if(status == 0) {
      return 1; // slow link
    }

    lastActivity = std::chrono::steady_clock::now();
    if(dispatcher->dispatch(this, currentRequest) < 0) {
      return -1; // could not write the reply, link is dead
    }
  }

  return 1;
}

bool Connection::isIdle(std::chrono::seconds timeout) {
  if(timeout.count() <= 0 || isSubscribed()) return false;
  return std::chrono::steady_clock::now() - lastActivity >= timeout;
}

void Connection::setResponseBuffering(bool value) {
  writer.setActive(value);
}

void Connection::flush() {
  writer.flush();
}

std::string Connection::describe() const {
  return description;
}
