// ----------------------------------------------------------------------
// File: IntToBinaryString.hh
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

#ifndef SLOTDB_UTILS_INT_TO_BINARY_STRING_HH
#define SLOTDB_UTILS_INT_TO_BINARY_STRING_HH

#include <endian.h>
#include <memory.h>
#include <stdint.h>
#include <string>

// Utilities to store/retrieve fixed-width integers to binary strings.
// Little endian encoding, as used by the snapshot format.

namespace slotdb {

inline void appendU8(std::string &dest, uint8_t num) {
  dest.push_back(char(num));
}

inline void appendU32(std::string &dest, uint32_t num) {
  uint32_t le = htole32(num);
  dest.append((const char*) &le, sizeof(le));
}

inline void appendU64(std::string &dest, uint64_t num) {
  uint64_t le = htole64(num);
  dest.append((const char*) &le, sizeof(le));
}

inline void appendI64(std::string &dest, int64_t num) {
  appendU64(dest, uint64_t(num));
}

inline uint32_t binaryStringToU32(const char* buff) {
  uint32_t result;
  memcpy(&result, buff, sizeof(result));
  return le32toh(result);
}

inline uint64_t binaryStringToU64(const char* buff) {
  uint64_t result;
  memcpy(&result, buff, sizeof(result));
  return le64toh(result);
}

inline int64_t binaryStringToI64(const char* buff) {
  return int64_t(binaryStringToU64(buff));
}

}

#endif
