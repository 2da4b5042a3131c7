// ----------------------------------------------------------------------
// File: Formatter.cc
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

#include "RedisRequest.hh"
#include "Common.hh"
#include "Formatter.hh"
using namespace slotdb;

RedisEncodedResponse Formatter::moved(int64_t slot, const NodeAddress &location) {
  return RedisEncodedResponse(SSTR("-MOVED " << slot << " " << location.toString() << "\r\n"));
}

RedisEncodedResponse Formatter::crossSlot() {
  return RedisEncodedResponse("-CROSSSLOT Keys in request don't hash to the same slot\r\n");
}

RedisEncodedResponse Formatter::err(std::string_view err) {
  return RedisEncodedResponse(SSTR("-ERR " << err << "\r\n"));
}

RedisEncodedResponse Formatter::errArgs(std::string_view cmd) {
  sdb_debug("Received malformed " << quotes(cmd) << " command - wrong number of arguments");
  return RedisEncodedResponse(SSTR("-ERR wrong number of arguments for '" << cmd << "' command\r\n"));
}

RedisEncodedResponse Formatter::errInteger() {
  return Formatter::err("value is not an integer or out of range");
}

RedisEncodedResponse Formatter::rawError(std::string_view msg) {
  return RedisEncodedResponse(SSTR("-" << msg << "\r\n"));
}

RedisEncodedResponse Formatter::pong() {
  return RedisEncodedResponse(SSTR("+PONG\r\n"));
}

void Formatter::string(std::ostringstream &ss, std::string_view str) {
  ss  << "$" << str.length() << "\r\n" << str << "\r\n";
}

RedisEncodedResponse Formatter::string(std::string_view str) {
  std::ostringstream ss;
  Formatter::string(ss, str);
  return RedisEncodedResponse(ss.str());
}

void Formatter::status(std::ostringstream &ss, std::string_view str) {
  ss << "+" << str << "\r\n";
}

RedisEncodedResponse Formatter::status(std::string_view str) {
  std::ostringstream ss;
  status(ss, str);
  return RedisEncodedResponse(ss.str());
}

RedisEncodedResponse Formatter::ok() {
  return RedisEncodedResponse("+OK\r\n");
}

RedisEncodedResponse Formatter::null() {
  return RedisEncodedResponse("$-1\r\n");
}

void Formatter::integer(std::ostringstream &ss, int64_t number) {
  ss << ":" << number << "\r\n";
}

RedisEncodedResponse Formatter::integer(int64_t number) {
  std::ostringstream ss;
  integer(ss, number);
  return RedisEncodedResponse(ss.str());
}

RedisEncodedResponse Formatter::fromStatus(const Status &status) {
  if(status.ok()) return Formatter::ok();
  if(status.IsWrongType()) return Formatter::rawError(status.getMsg());
  return Formatter::err(status.getMsg());
}

RedisEncodedResponse Formatter::vector(const std::vector<std::string> &vec) {
  std::ostringstream ss;
  ss << "*" << vec.size() << "\r\n";
  for(std::vector<std::string>::const_iterator it = vec.begin(); it != vec.end(); it++) {
    string(ss, *it);
  }
  return RedisEncodedResponse(ss.str());
}

RedisEncodedResponse Formatter::statusVector(const std::vector<std::string> &vec) {
  std::ostringstream ss;
  ss << "*" << vec.size() << "\r\n";
  for(std::vector<std::string>::const_iterator it = vec.begin(); it != vec.end(); it++) {
    status(ss, *it);
  }
  return RedisEncodedResponse(ss.str());
}

RedisEncodedResponse Formatter::redisRequest(const RedisRequest &req) {
  return Formatter::vector(req.getContents());
}

RedisEncodedResponse Formatter::noauth(std::string_view str) {
  return RedisEncodedResponse(SSTR("-NOAUTH " << str << "\r\n"));
}

RedisEncodedResponse Formatter::subscribe(std::string_view channel, size_t active) {
  return strstrint("subscribe", channel, active);
}

RedisEncodedResponse Formatter::unsubscribe(std::string_view channel, size_t active) {
  return strstrint("unsubscribe", channel, active);
}

RedisEncodedResponse Formatter::unsubscribeNone() {
  std::ostringstream ss;
  ss << "*3\r\n";
  Formatter::string(ss, "unsubscribe");
  ss << "$-1\r\n";
  Formatter::integer(ss, 0);
  return RedisEncodedResponse(ss.str());
}

RedisEncodedResponse Formatter::message(std::string_view channel, std::string_view payload) {
  std::ostringstream ss;
  ss << "*3\r\n";
  ss << "$7\r\nmessage\r\n";
  Formatter::string(ss, channel);
  Formatter::string(ss, payload);
  return RedisEncodedResponse(ss.str());
}

RedisEncodedResponse Formatter::strstrint(std::string_view str1, std::string_view str2, int num) {
  std::ostringstream ss;
  ss << "*3\r\n";
  Formatter::string(ss, str1);
  Formatter::string(ss, str2);
  Formatter::integer(ss, num);
  return RedisEncodedResponse(ss.str());
}
