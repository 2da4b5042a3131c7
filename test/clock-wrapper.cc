// ----------------------------------------------------------------------
// File: clock-wrapper.cc
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

#include "utils/ClockWrapper.hh"
#include <gtest/gtest.h>

using namespace slotdb;

TEST(ClockWrapper, Fake) {
  SystemClock systemClock(true);
  ASSERT_TRUE(systemClock.fake());

  ASSERT_EQ(systemClock.now(), SystemClock::time_point());
  ASSERT_EQ(systemClock.nowMs(), 0);

  SystemClock::time_point startOfTime;
  systemClock.advance(std::chrono::seconds(5));
  ASSERT_EQ(systemClock.now(), startOfTime+std::chrono::seconds(5));

  systemClock.advance(std::chrono::milliseconds(10));
  ASSERT_EQ(systemClock.nowMs(), 5010);

  systemClock.set(startOfTime+std::chrono::seconds(1)); // go backwards
  ASSERT_EQ(systemClock.now(), startOfTime+std::chrono::seconds(1));
  ASSERT_EQ(systemClock.nowMs(), 1000);
}

TEST(ClockWrapper, Real) {
  SystemClock systemClock;
  ASSERT_FALSE(systemClock.fake());

  SystemClock::time_point before = std::chrono::system_clock::now();
  systemClock.advance(std::chrono::hours(24));
  SystemClock::time_point now = systemClock.now();

  ASSERT_GE(now, before);
  ASSERT_LT(now, before + std::chrono::hours(1));
}
