// ----------------------------------------------------------------------
// File: utils.cc
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

#include "utils/IntToBinaryString.hh"
#include "utils/ParseUtils.hh"
#include "utils/StringUtils.hh"
#include "utils/FileUtils.hh"
#include "utils/TimeFormatting.hh"
#include "utils/AssistedThread.hh"
#include "utils/InFlightTracker.hh"
#include "Utils.hh"
#include <gtest/gtest.h>

using namespace slotdb;

TEST(Utils, BinaryStringConversions) {
  std::string buffer;
  appendU32(buffer, 1u);
  ASSERT_EQ(buffer, std::string("\x00\x00\x00\x01", 4));
  ASSERT_EQ(binaryStringToU32(buffer.data()), 1u);

  buffer.clear();
  appendU64(buffer, 16583415634u);
  ASSERT_EQ(buffer.size(), 8u);
  ASSERT_EQ(binaryStringToU64(buffer.data()), 16583415634u);

  buffer.clear();
  appendI64(buffer, -1234169761);
  ASSERT_EQ(binaryStringToI64(buffer.data()), -1234169761);

  buffer.clear();
  appendU8(buffer, 0xAB);
  appendU32(buffer, 0xDEADBEEF);
  ASSERT_EQ(buffer.size(), 5u);
  ASSERT_EQ((uint8_t) buffer[0], 0xAB);
  ASSERT_EQ(binaryStringToU32(buffer.data()+1), 0xDEADBEEF);
}

TEST(Utils, my_strtoll) {
  int64_t ret;
  ASSERT_TRUE(my_strtoll("123", ret));
  ASSERT_EQ(ret, 123);

  ASSERT_TRUE(my_strtoll("-9223372036854775808", ret));
  ASSERT_EQ(ret, std::numeric_limits<int64_t>::min());

  ASSERT_FALSE(my_strtoll("", ret));
  ASSERT_FALSE(my_strtoll("12a", ret));
  ASSERT_FALSE(my_strtoll("1.5", ret));
  ASSERT_FALSE(my_strtoll("9223372036854775808", ret));
}

TEST(Utils, parseServer) {
  NodeAddress srv;
  ASSERT_TRUE(parseServer("localhost:7000", srv));
  ASSERT_EQ(srv, NodeAddress("localhost", 7000));

  ASSERT_TRUE(parseServer("::1:7001", srv));
  ASSERT_EQ(srv, NodeAddress("::1", 7001));

  ASSERT_FALSE(parseServer("localhost", srv));
  ASSERT_FALSE(parseServer(":7000", srv));
  ASSERT_FALSE(parseServer("localhost:0", srv));
  ASSERT_FALSE(parseServer("localhost:65536", srv));
  ASSERT_FALSE(parseServer("localhost:abc", srv));

  std::vector<NodeAddress> servers;
  ASSERT_TRUE(parseServers("a:1,b:2", servers));
  ASSERT_EQ(servers.size(), 2u);
  ASSERT_EQ(serializeNodes(servers), "a:1,b:2");
  ASSERT_FALSE(parseServers("a:1,a:1", servers));
  ASSERT_FALSE(parseServers("a:1,", servers));
}

TEST(Utils, split) {
  ASSERT_EQ(split("a,b,c", ","), std::vector<std::string>({"a", "b", "c"}));
  ASSERT_EQ(split("abc", ","), std::vector<std::string>({"abc"}));
  ASSERT_EQ(split("a,,b", ","), std::vector<std::string>({"a", "", "b"}));
}

TEST(Utils, caseInsensitiveEquals) {
  ASSERT_TRUE(caseInsensitiveEquals("GET", "get"));
  ASSERT_TRUE(caseInsensitiveEquals("SeT", "sEt"));
  ASSERT_FALSE(caseInsensitiveEquals("GET", "GETS"));
  ASSERT_FALSE(caseInsensitiveEquals("GET", "SET"));
}

TEST(Utils, pathJoin) {
  ASSERT_EQ(pathJoin("/home/", "test"), "/home/test");
  ASSERT_EQ(pathJoin("/home", "test"), "/home/test");
  ASSERT_EQ(pathJoin("", "test"), "/test");
  ASSERT_EQ(pathJoin("/home", ""), "/home");
}

TEST(StringUtils, StartsWith) {
  ASSERT_TRUE(StringUtils::startsWith("__keyspace__:foo", "__keyspace__:"));
  ASSERT_TRUE(StringUtils::startsWith("abc", ""));
  ASSERT_FALSE(StringUtils::startsWith("ab", "abc"));
  ASSERT_FALSE(StringUtils::startsWith("abd", "abc"));
}

TEST(StringUtils, EscapeNonPrintable) {
  ASSERT_TRUE(StringUtils::isPrintable("abc"));
  ASSERT_FALSE(StringUtils::isPrintable(std::string("a\0b", 3)));

  ASSERT_EQ(StringUtils::escapeNonPrintable("abc"), "abc");
  ASSERT_EQ(StringUtils::escapeNonPrintable(std::string("a\0b", 3)), "a\\x00b");
  ASSERT_EQ(StringUtils::escapeNonPrintable("\xab\r"), "\\xAB\\x0D");
}

TEST(StringUtils, ToLower) {
  ASSERT_EQ(StringUtils::toLower("LPUSH"), "lpush");
  ASSERT_EQ(StringUtils::toLower("Set-1"), "set-1");
}

TEST(StringUtils, GlobMatch) {
  ASSERT_TRUE(StringUtils::globMatch("*", "anything"));
  ASSERT_TRUE(StringUtils::globMatch("user:*", "user:1"));
  ASSERT_TRUE(StringUtils::globMatch("h?llo", "hello"));
  ASSERT_TRUE(StringUtils::globMatch("h[ae]llo", "hallo"));
  ASSERT_FALSE(StringUtils::globMatch("h[ae]llo", "hillo"));
  ASSERT_TRUE(StringUtils::globMatch("a\\*b", "a*b"));
  ASSERT_FALSE(StringUtils::globMatch("a\\*b", "axb"));
  ASSERT_FALSE(StringUtils::globMatch("*", std::string("a\0b", 3)));
}

TEST(ParseUtils, BasicSanity) {
  bool b;
  ASSERT_TRUE(ParseUtils::parseBool("yes", b));
  ASSERT_TRUE(b);
  ASSERT_TRUE(ParseUtils::parseBool("false", b));
  ASSERT_FALSE(b);
  ASSERT_FALSE(ParseUtils::parseBool("maybe", b));

  TraceLevel level;
  ASSERT_TRUE(ParseUtils::parseTraceLevel("warning", level));
  ASSERT_EQ(level, TraceLevel::warning);
  ASSERT_TRUE(ParseUtils::parseTraceLevel("off", level));
  ASSERT_EQ(level, TraceLevel::off);
  ASSERT_FALSE(ParseUtils::parseTraceLevel("verbose", level));
}

TEST(TimeFormatting, BasicSanity) {
  using namespace std::chrono;

  auto dur = Days(3) + hours(23) + minutes(45) + seconds(7);
  ASSERT_EQ(formatTime(dur), "3 days, 23 hours, 45 minutes, 7 seconds");

  dur = Days(6) + hours(0) + minutes(59) + seconds(32);
  ASSERT_EQ(formatTime(dur), "6 days, 0 hours, 59 minutes, 32 seconds");

  ASSERT_EQ(formatTime(seconds(61)), "1 minutes, 1 seconds");
  ASSERT_EQ(formatTime(seconds(60)), "1 minutes, 0 seconds");
  ASSERT_EQ(formatTime(seconds(11299)), "3 hours, 8 minutes, 19 seconds");
  ASSERT_EQ(formatTime(seconds(0)), "0 seconds");
}

void waitUntilTerminated(ThreadAssistant &assistant) {
  while(!assistant.terminationRequested()) {
    assistant.wait_for(std::chrono::milliseconds(10));
  }
}

TEST(AssistedThread, StopAndJoin) {
  AssistedThread thread(waitUntilTerminated);
  thread.stop();
  thread.join();
  thread.join();
}

TEST(AssistedThread, Vector) {
  std::vector<AssistedThread> threads;
  for(size_t i = 0; i < 3; i++) {
    threads.emplace_back(waitUntilTerminated);
  }

  for(size_t i = 0; i < threads.size(); i++) {
    threads[i].join();
  }
}

TEST(InFlightTracker, BasicSanity) {
  InFlightTracker tracker;
  ASSERT_EQ(tracker.getInFlight(), 0);

  {
    InFlightRegistration registration(tracker);
    ASSERT_TRUE(registration.ok());
    ASSERT_EQ(tracker.getInFlight(), 1);
  }

  ASSERT_EQ(tracker.getInFlight(), 0);

  tracker.setAcceptingRequests(false);
  InFlightRegistration registration(tracker);
  ASSERT_FALSE(registration.ok());
  ASSERT_EQ(tracker.getInFlight(), 0);
  tracker.spinUntilNoRequestsInFlight();
}
