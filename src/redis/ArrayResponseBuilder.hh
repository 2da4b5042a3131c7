// ----------------------------------------------------------------------
// File: ArrayResponseBuilder.hh
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

#ifndef SLOTDB_REDIS_ARRAY_RESPONSE_BUILDER_HH
#define SLOTDB_REDIS_ARRAY_RESPONSE_BUILDER_HH

#include <sstream>
#include "RedisEncodedResponse.hh"

namespace slotdb {

//------------------------------------------------------------------------------
// Assemble an array reply out of already-encoded elements, which may be
// arrays themselves. The number of elements must be known up front.
//------------------------------------------------------------------------------
class ArrayResponseBuilder {
public:
  ArrayResponseBuilder(size_t size);
  void push_back(const RedisEncodedResponse &item);
  RedisEncodedResponse buildResponse() const;

private:
  size_t itemsRemaining;
  std::stringstream ss;
};

}

#endif
