
//    --------------------------------------------------------------------
//
//    This file is part of ophys.
//
//    ophys is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    ophys is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with ophys. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------


#include <catch2/catch.hpp>

#include "ophys.h"

#include <sstream>

TEST_CASE( "logger writes only to its own stream" , "[logger]" )
{
  const bool was_silent = globals::silent;
  std::ostringstream out;
  logger_t log( "test" , out );

  globals::silent = false;
  log << "cell " << 3 << "\n";
  log.warning( "no blank" );
  globals::silent = was_silent;

  CHECK( out.str() == "cell 3\n ** warning: no blank ** \n" );
}

TEST_CASE( "silent and switched-off loggers write nothing" , "[logger]" )
{
  const bool was_silent = globals::silent;
  std::ostringstream out;
  logger_t log( "test" , out );

  globals::silent = true;
  log << "x";
  log.warning( "y" );

  globals::silent = false;
  log.off();
  log << "z";
  log.warning( "w" );
  globals::silent = was_silent;

  CHECK( out.str() == "" );
}
