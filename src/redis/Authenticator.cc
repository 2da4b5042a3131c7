// ----------------------------------------------------------------------
// File: Authenticator.cc
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

#include "Authenticator.hh"
#include "../utils/Macros.hh"

#include <openssl/crypto.h>
#include <openssl/sha.h>

namespace slotdb {

Authenticator::Authenticator(std::string_view secret)
: enabled(!secret.empty()), secretDigest(sha256(secret)) {
}

std::string Authenticator::sha256(std::string_view data) {
  std::string ret;
  ret.resize(SHA256_DIGEST_LENGTH);

  SHA256((const unsigned char*) data.data(), data.size(), (unsigned char*) ret.data());
  return ret;
}

Authenticator::ValidationStatus Authenticator::validate(std::string_view candidate) const {
  if(!enabled) {
    return ValidationStatus::kNoPasswordSet;
  }

  std::string candidateDigest = sha256(candidate);
  sdb_assert(candidateDigest.size() == secretDigest.size());

  if(CRYPTO_memcmp(candidateDigest.data(), secretDigest.data(), SHA256_DIGEST_LENGTH) != 0) {
    return ValidationStatus::kInvalidPassword;
  }

  return ValidationStatus::kOk;
}

}
