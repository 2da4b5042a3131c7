// ----------------------------------------------------------------------
// File: ArrayResponseBuilder.cc
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

#include "utils/Macros.hh"
#include "redis/ArrayResponseBuilder.hh"
using namespace slotdb;

ArrayResponseBuilder::ArrayResponseBuilder(size_t size)
: itemsRemaining(size) {
  ss << "*" << size << "\r\n";
}

void ArrayResponseBuilder::push_back(const RedisEncodedResponse &item) {
  sdb_assert(itemsRemaining != 0);
  itemsRemaining--;

  ss << item.val;
}

RedisEncodedResponse ArrayResponseBuilder::buildResponse() const {
  sdb_assert(itemsRemaining == 0);
  return RedisEncodedResponse(ss.str());
}
