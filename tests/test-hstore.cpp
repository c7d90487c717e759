
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
#include "tests/test-data.h"

#include <fstream>
#include <limits>
#include <stdexcept>

TEST_CASE( "path helpers" , "[hstore]" )
{
  CHECK( hstore_t::parent( "/" ) == "" );
  CHECK( hstore_t::parent( "/cells" ) == "/" );
  CHECK( hstore_t::parent( "/cells/cell_0" ) == "/cells" );
  CHECK( hstore_t::basename( "/cells/cell_0" ) == "cell_0" );
}

TEST_CASE( "groups are created with their parents, in order" , "[hstore]" )
{
  const std::string f = testdata::temp_file( "groups.db" );
  
  {
    hstore_t h( f );
    CHECK( h.has_group( "/" ) );
    h.create_group( "/cells/cell_1" );
    h.create_group( "/cells/cell_0" );
    h.create_group( "/acquisition" );
    h.create_group( "/cells/cell_1" );  // no-op

    CHECK( h.has_group( "/cells" ) );
    CHECK_FALSE( h.has_group( "/cell" ) );
    
    std::vector<std::string> c = h.children( "/cells" );
    REQUIRE( c.size() == 2 );
    CHECK( c[0] == "/cells/cell_1" );
    CHECK( c[1] == "/cells/cell_0" );

    std::vector<std::string> top = h.children( "/" );
    REQUIRE( top.size() == 2 );
    CHECK( top[1] == "/acquisition" );

    CHECK( h.children( "/nowhere" ).size() == 0 );

    CHECK_THROWS_AS( h.create_group( "cells" ) , std::runtime_error );
    CHECK_THROWS_AS( h.create_group( "/cells/" ) , std::runtime_error );
  }

  // persists after closing
  hstore_t h( f , true );
  CHECK( h.children( "/cells" ).size() == 2 );
  CHECK_THROWS_AS( h.create_group( "/more" ) , std::runtime_error );
  h.close();
  
  std::remove( f.c_str() );
}

TEST_CASE( "typed attributes" , "[hstore]" )
{
  const std::string f = testdata::temp_file( "attrs.db" );
  hstore_t h( f );

  h.set_attr( "/fov_metadata" , "animal_name" , "M101" );
  h.set_attr( "/fov_metadata" , "factor" , 2.5 );
  h.set_attr( "/" , "schema_version" , 1 );
  h.set_attr( "/cells/cell_0" , "ROI_responsiveness" , true );
  h.set_attr( "/cells/cell_0" , "fit_bandwidth" , std::numeric_limits<double>::quiet_NaN() );

  hstore_attr_t a = h.get_attr( "/fov_metadata" , "animal_name" );
  CHECK( a.type == ATTR_TEXT );
  CHECK( a.str_value == "M101" );
  CHECK_THROWS_AS( a.as_double() , std::runtime_error );
  
  hstore_attr_t d = h.get_attr( "/fov_metadata" , "factor" );
  CHECK( d.type == ATTR_REAL );
  CHECK( d.as_double() == 2.5 );

  hstore_attr_t i = h.get_attr( "/" , "schema_version" );
  CHECK( i.type == ATTR_INT );
  CHECK( i.int_value == 1 );
  CHECK( i.as_string() == "1" );

  hstore_attr_t b = h.get_attr( "/cells/cell_0" , "ROI_responsiveness" );
  CHECK( b.type == ATTR_BOOL );
  CHECK( b.bool_value );
  CHECK( b.as_double() == 1 );

  hstore_attr_t n = h.get_attr( "/cells/cell_0" , "fit_bandwidth" );
  CHECK( n.type == ATTR_REAL );
  CHECK( std::isnan( n.dbl_value ) );
  CHECK( n == hstore_attr_t( std::numeric_limits<double>::quiet_NaN() ) );
  
  // overwrite, possibly with a new type
  h.set_attr( "/fov_metadata" , "factor" , 3 );
  CHECK( h.get_attr( "/fov_metadata" , "factor" ).type == ATTR_INT );
  CHECK( h.get_attr( "/fov_metadata" , "factor" ).as_double() == 3 );
  
  std::map<std::string,hstore_attr_t> all = h.attrs( "/fov_metadata" );
  CHECK( all.size() == 2 );
  CHECK( all.count( "animal_name" ) == 1 );
  
  CHECK( h.has_attr( "/" , "schema_version" ) );
  CHECK_FALSE( h.has_attr( "/" , "format" ) );
  CHECK_FALSE( h.has_attr( "/nowhere" , "format" ) );
  CHECK_THROWS_AS( h.get_attr( "/" , "format" ) , std::runtime_error );
  CHECK_THROWS_AS( h.get_attr( "/nowhere" , "format" ) , std::runtime_error );

  h.close();
  std::remove( f.c_str() );
}

TEST_CASE( "numeric arrays" , "[hstore]" )
{
  const std::string f = testdata::temp_file( "arrays.db" );
  hstore_t h( f );

  std::vector<double> x = { 1.5 , -2 , 3 , std::numeric_limits<double>::quiet_NaN() , 5 , 6 };
  std::vector<int64_t> ids = { 1 , 2 , 9 };
  std::vector<double> empty;
  
  h.set_array( "/acquisition" , "regOffsets" , x , std::vector<int>{ 3 , 2 } );
  h.set_array( "/acquisition" , "stimID" , ids );
  h.set_array( "/acquisition" , "stimOn" , empty );

  hstore_array_t a = h.get_array( "/acquisition" , "regOffsets" );
  CHECK( a.type == ARRAY_F64 );
  REQUIRE( a.shape.size() == 2 );
  CHECK( a.rows() == 3 );
  CHECK( a.cols() == 2 );
  REQUIRE( a.size() == 6 );
  CHECK( a.dbl_value[0] == 1.5 );
  CHECK( a.dbl_value[1] == -2 );
  CHECK( std::isnan( a.dbl_value[3] ) );

  hstore_array_t b = h.get_array( "/acquisition" , "stimID" );
  CHECK( b.type == ARRAY_I64 );
  CHECK( b.rows() == 3 );
  CHECK( b.cols() == 1 );
  CHECK( b.as_ints()[2] == 9 );
  CHECK( b.as_doubles()[2] == 9.0 );
  
  hstore_array_t e = h.get_array( "/acquisition" , "stimOn" );
  CHECK( e.size() == 0 );
  CHECK( e.rows() == 0 );

  std::set<std::string> keys = h.arrays( "/acquisition" );
  CHECK( keys.size() == 3 );
  CHECK( keys.count( "stimID" ) == 1 );
  CHECK( h.has_array( "/acquisition" , "stimOn" ) );
  CHECK_FALSE( h.has_array( "/acquisition" , "uniqStims" ) );
  
  CHECK_THROWS_AS( h.set_array( "/acquisition" , "bad" , x , std::vector<int>{ 4 , 2 } ) , std::runtime_error );
  CHECK_THROWS_AS( h.get_array( "/acquisition" , "uniqStims" ) , std::runtime_error );
  CHECK_FALSE( h.has_array( "/acquisition" , "bad" ) );

  // non-integral values cannot be read as integers
  CHECK_THROWS_AS( a.as_ints() , std::runtime_error );
  
  h.close();
  std::remove( f.c_str() );
}

TEST_CASE( "read-only opens check the container" , "[hstore]" )
{
  const std::string missing = testdata::temp_file( "missing.db" );
  CHECK_THROWS_AS( hstore_t( missing , true ) , std::runtime_error );

  // a valid SQLite file, but not a container
  const std::string other = testdata::temp_file( "other.db" );
  {
    SQL sql;
    sql.open( other );
    sql.query( "CREATE TABLE t ( x INTEGER );" );
    sql.close();
  }
  CHECK_THROWS_AS( hstore_t( other , true ) , std::runtime_error );
  std::remove( other.c_str() );
}
