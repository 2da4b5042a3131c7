// ----------------------------------------------------------------------
// File: formatter.cc
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

#include "Formatter.hh"
#include "redis/ArrayResponseBuilder.hh"
#include <qclient/ResponseBuilder.hh>
#include <qclient/QClient.hh>
#include <gtest/gtest.h>

using namespace slotdb;
using namespace qclient;

static std::string describe(const RedisEncodedResponse &resp) {
  qclient::ResponseBuilder builder;
  builder.feed(resp.val);

  redisReplyPtr ans;
  EXPECT_EQ(builder.pull(ans), qclient::ResponseBuilder::Status::kOk);
  return qclient::describeRedisReply(ans);
}

TEST(Formatter, Basic) {
  ASSERT_EQ(Formatter::err("test").val, "-ERR test\r\n");
  ASSERT_EQ(Formatter::ok().val, "+OK\r\n");
  ASSERT_EQ(Formatter::pong().val, "+PONG\r\n");
  ASSERT_EQ(Formatter::null().val, "$-1\r\n");
  ASSERT_EQ(Formatter::status("test").val, "+test\r\n");
  ASSERT_EQ(Formatter::noauth("asdf").val, "-NOAUTH asdf\r\n");
  ASSERT_EQ(Formatter::integer(-42).val, ":-42\r\n");
  ASSERT_EQ(Formatter::string("").val, "$0\r\n\r\n");
  ASSERT_EQ(Formatter::errArgs("get").val, "-ERR wrong number of arguments for 'get' command\r\n");
  ASSERT_EQ(Formatter::errInteger().val, "-ERR value is not an integer or out of range\r\n");
}

TEST(Formatter, Redirects) {
  ASSERT_EQ(Formatter::moved(3000, NodeAddress("example.com", 7001)).val, "-MOVED 3000 example.com:7001\r\n");
  ASSERT_EQ(Formatter::crossSlot().val, "-CROSSSLOT Keys in request don't hash to the same slot\r\n");
  ASSERT_TRUE(Formatter::moved(1, NodeAddress("a", 1)).isError());
  ASSERT_FALSE(Formatter::ok().isError());
}

TEST(Formatter, FromStatus) {
  ASSERT_EQ(Formatter::fromStatus(Status::OK()).val, "+OK\r\n");
  ASSERT_EQ(Formatter::fromStatus(Status::WrongType()).val, "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n");
  ASSERT_EQ(Formatter::fromStatus(Status::InvalidArgument("index out of range")).val, "-ERR index out of range\r\n");
}

TEST(Formatter, Vectors) {
  ASSERT_EQ(Formatter::vector( {"abc", "de"} ).val, "*2\r\n$3\r\nabc\r\n$2\r\nde\r\n");
  ASSERT_EQ(Formatter::statusVector( {"ROLE primary"} ).val, "*1\r\n+ROLE primary\r\n");
  ASSERT_EQ(Formatter::vector( {} ).val, "*0\r\n");
}

TEST(ArrayResponseBuilder, BasicSanity) {
  ArrayResponseBuilder builder(3);
  ASSERT_THROW(builder.buildResponse(), FatalException);

  builder.push_back(Formatter::ok());
  builder.push_back(Formatter::integer(999));
  builder.push_back(Formatter::string("whee"));
  ASSERT_THROW(builder.push_back(Formatter::integer(123)), FatalException);

  RedisEncodedResponse resp = builder.buildResponse();
  ASSERT_EQ(resp.val, "*3\r\n+OK\r\n:999\r\n$4\r\nwhee\r\n");
}

TEST(Formatter, subscribe) {
  ASSERT_EQ(describe(Formatter::subscribe("channel-name", 3)),
    "1) \"subscribe\"\n"
    "2) \"channel-name\"\n"
    "3) (integer) 3\n");
}

TEST(Formatter, unsubscribe) {
  ASSERT_EQ(describe(Formatter::unsubscribe("channel-name", 5)),
    "1) \"unsubscribe\"\n"
    "2) \"channel-name\"\n"
    "3) (integer) 5\n");

  ASSERT_EQ(Formatter::unsubscribeNone().val, "*3\r\n$11\r\nunsubscribe\r\n$-1\r\n:0\r\n");
}

TEST(Formatter, message) {
  ASSERT_EQ(describe(Formatter::message("doc:1", "set")),
    "1) \"message\"\n"
    "2) \"doc:1\"\n"
    "3) \"set\"\n");
}
