// ----------------------------------------------------------------------
// File: ConfigurationReader.cc
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

#include "config/ConfigurationReader.hh"
#include "utils/Macros.hh"
#include <sstream>

namespace slotdb {

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
ConfigurationReader::ConfigurationReader(const std::string &str)
: mContents(str), mPosition(0) {

  mPosition = findNextNonWhitespace(0);
}

//------------------------------------------------------------------------------
// Get current word
//------------------------------------------------------------------------------
std::string ConfigurationReader::getCurrentWord() const {
  if(mPosition >= mContents.size()) {
    return "";
  }

  std::ostringstream ss;
  size_t pos = mPosition;

  while(pos < mContents.size() && !isspace(mContents[pos])) {
    ss << mContents[pos];
    pos++;
  }

  return ss.str();
}

//------------------------------------------------------------------------------
// Rest of the line
//------------------------------------------------------------------------------
std::string ConfigurationReader::getRestOfLine() const {
  size_t start = findNextWhitespace();
  size_t end = mContents.find('\n', start);
  if(end == std::string::npos) {
    end = mContents.size();
  }

  while(start < end && isspace(mContents[start])) start++;
  while(end > start && isspace(mContents[end-1])) end--;

  return mContents.substr(start, end - start);
}

//------------------------------------------------------------------------------
// Advance to next word
//------------------------------------------------------------------------------
void ConfigurationReader::advanceWord() {
  mPosition = findNextWhitespace();
  mPosition = findNextNonWhitespace(mPosition);
}

//------------------------------------------------------------------------------
// Advance to next line
//------------------------------------------------------------------------------
void ConfigurationReader::advanceLine() {
  size_t newline = mContents.find('\n', mPosition);
  if(newline == std::string::npos) {
    mPosition = mContents.size();
    return;
  }

  mPosition = findNextNonWhitespace(newline + 1);
}

//------------------------------------------------------------------------------
// Last word on the line?
//------------------------------------------------------------------------------
bool ConfigurationReader::lastWordOnLine() const {
  size_t pos = findNextWhitespace();

  while(pos < mContents.size() && isspace(mContents[pos])) {
    if(mContents[pos] == '\n') return true;
    pos++;
  }

  return pos >= mContents.size();
}

//------------------------------------------------------------------------------
// Reached EOF?
//------------------------------------------------------------------------------
bool ConfigurationReader::eof() const {
  return mPosition >= mContents.size();
}

//------------------------------------------------------------------------------
// Find next whitespace
//------------------------------------------------------------------------------
size_t ConfigurationReader::findNextWhitespace() const {
  size_t pos = mPosition;

  while(pos < mContents.size() && !isspace(mContents[pos])) {
    pos++;
  }

  return pos;
}

//------------------------------------------------------------------------------
// Find next non-whitespace
//------------------------------------------------------------------------------
size_t ConfigurationReader::findNextNonWhitespace(size_t pos) const {
  while(pos < mContents.size() && isspace(mContents[pos])) {
    pos++;
  }

  return pos;
}

}
