// ----------------------------------------------------------------------
// File: ConfigurationReader.hh
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

#ifndef SLOTDB_CONFIGURATION_READER_HH
#define SLOTDB_CONFIGURATION_READER_HH

#include <string>

namespace slotdb {

//------------------------------------------------------------------------------
// Helper class to move through the contents of a configuration file
//------------------------------------------------------------------------------
class ConfigurationReader {
public:
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  ConfigurationReader(const std::string &str);

  //----------------------------------------------------------------------------
  // Get current word
  //----------------------------------------------------------------------------
  std::string getCurrentWord() const;

  //----------------------------------------------------------------------------
  // Everything after the current word until the end of the line, with
  // surrounding whitespace trimmed
  //----------------------------------------------------------------------------
  std::string getRestOfLine() const;

  //----------------------------------------------------------------------------
  // Advance to next word
  //----------------------------------------------------------------------------
  void advanceWord();

  //----------------------------------------------------------------------------
  // Advance to the first word of the next non-empty line
  //----------------------------------------------------------------------------
  void advanceLine();

  //----------------------------------------------------------------------------
  // Is the current word the last one on its line?
  //----------------------------------------------------------------------------
  bool lastWordOnLine() const;

  //----------------------------------------------------------------------------
  // Reached EOF?
  //----------------------------------------------------------------------------
  bool eof() const;

private:
  //----------------------------------------------------------------------------
  // Find next whitespace
  //----------------------------------------------------------------------------
  size_t findNextWhitespace() const;

  //----------------------------------------------------------------------------
  // Find next non-whitespace
  //----------------------------------------------------------------------------
  size_t findNextNonWhitespace(size_t pos) const;

  std::string mContents;
  size_t mPosition = 0;
};

}

#endif
