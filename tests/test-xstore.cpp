
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
#include <stdexcept>

static cell_extraction_t populated()
{
  cell_extraction_t ce = testdata::session();
  param_t param;
  ce.populate( param );
  return ce;
}

TEST_CASE( "cell group names" , "[xstore]" )
{
  CHECK( xstore::cell_index( "cell_0" ) == 0 );
  CHECK( xstore::cell_index( "cell_12" ) == 12 );
  CHECK( xstore::cell_index( "cell_" ) == -1 );
  CHECK( xstore::cell_index( "cell_x" ) == -1 );
  CHECK( xstore::cell_index( "roi_1" ) == -1 );
}

TEST_CASE( "an extraction survives a save and load" , "[xstore]" )
{
  const std::string f = testdata::temp_file( "roundtrip.db" );
  
  cell_extraction_t ce = populated();
  xstore::save( ce , f );

  CHECK( Helper::fileExists( f ) );
  CHECK_FALSE( Helper::fileExists( f + globals::partial_suffix ) );

  cell_extraction_t ce2 = xstore::load( f );

  // FOV
  CHECK( ce2.fov.animal_name == "M101" );
  CHECK( ce2.fov.recording_date == "2026-10-19" );
  CHECK( ce2.fov.layer == "L2/3" );
  CHECK( ce2.fov.factor == 2 );
  CHECK( ce2.fov.imaging_files == ce.fov.imaging_files );
  CHECK( ce2.fov.spk2_files.size() == 0 );

  // acquisition
  CHECK( ce2.twophotontimes == ce.twophotontimes );
  CHECK( ce2.stimOn == ce.stimOn );
  CHECK( ce2.stimID == ce.stimID );
  CHECK( ce2.uniqStims == ce.uniqStims );
  CHECK( eigen_ops::equal( ce2.regOffsets , ce.regOffsets ) );
  
  // cells
  REQUIRE( ce2.cells.size() == 3 );
  for (int i=0; i<3; i++)
    {
      const cell_t & a = ce.cells[i];
      const cell_t & b = ce2.cells[i];
      CHECK( b.xPos == a.xPos );
      CHECK( b.yPos == a.yPos );
      CHECK( b.raw == a.raw );
      CHECK( b.uniqStims == a.uniqStims );
      CHECK( b.condition_response == a.condition_response );
      CHECK( b.n_dropped == a.n_dropped );
      CHECK( b.ROI_responsiveness == a.ROI_responsiveness );
      CHECK( b.responsive_p == a.responsive_p );
      CHECK( b.blank_id == a.blank_id );
      CHECK( b.has_tuning == a.has_tuning );
      REQUIRE( b.cyc.size() == a.cyc.size() );
      for (int c=0; c<a.cyc.size(); c++)
	CHECK( eigen_ops::equal( b.cyc[c] , a.cyc[c] ) );
    }

  const tuning_t & t1 = ce.cells[0].tuning;
  const tuning_t & t2 = ce2.cells[0].tuning;
  CHECK( t2.pref_dir_fit == t1.pref_dir_fit );
  CHECK( t2.dti_fit == t1.dti_fit );
  CHECK( t2.fit_bandwidth == t1.fit_bandwidth );
  CHECK( t2.kappa == t1.kappa );
  CHECK( t2.n_angles == 8 );
  CHECK( t2.converged == t1.converged );
  CHECK( ce2.cells[0].tuning_curve == ce.cells[0].tuning_curve );
  
  // round-trip of derived values
  CHECK( ce2.responsive_cells() == ce.responsive_cells() );
  
  std::remove( f.c_str() );
}

TEST_CASE( "absent fields are absent after loading" , "[xstore]" )
{
  const std::string f = testdata::temp_file( "sparse.db" );

  cell_extraction_t ce;
  for (int i=0; i<10; i++) ce.twophotontimes.push_back( 0.5 * i );
  ce.add_cell( 3 , 4 , std::vector<double>( 10 , 1.0 ) );
  xstore::save( ce , f );

  {
    hstore_t h( f , true );
    CHECK_FALSE( h.has_group( "/fov_metadata" ) );
    CHECK_FALSE( h.has_array( "/acquisition" , "stimOn" ) );
    CHECK_FALSE( h.has_array( "/acquisition" , "regOffsets" ) );
    CHECK_FALSE( h.has_array( "/cells/cell_0" , "cyc" ) );
    CHECK_FALSE( h.has_attr( "/cells/cell_0" , "pref_dir_fit" ) );
    CHECK( h.get_attr( "/" , "format" ).as_string() == globals::store_format );
  }
  
  cell_extraction_t ce2 = xstore::load( f );
  CHECK( ce2.fov.empty() );
  CHECK( ce2.stimOn.size() == 0 );
  CHECK_FALSE( ce2.has_registration() );
  REQUIRE( ce2.cells.size() == 1 );
  CHECK_FALSE( ce2.cells[0].aligned() );
  CHECK_FALSE( ce2.cells[0].has_tuning );
  CHECK( ce2.cells[0].blank_id == globals::no_blank );
  CHECK( ce2.cells[0].xPos == 3 );
  
  std::remove( f.c_str() );
}

TEST_CASE( "cells load in index order and uniqStims is derived if absent" , "[xstore]" )
{
  const std::string f = testdata::temp_file( "order.db" );
  
  {
    hstore_t h( f );
    std::vector<int64_t> ids = { 3 , 1 , 3 , 2 };
    h.set_array( "/acquisition" , "stimID" , ids );
    h.set_attr( "/cells/cell_10" , "xPos" , 10.0 );
    h.set_attr( "/cells/cell_2" , "xPos" , 2.0 );
    h.set_attr( "/cells/notes" , "text" , "ignored" );
    h.set_attr( "/cells/cell_1" , "xPos" , 1.0 );
  }

  cell_extraction_t ce = xstore::load( f );
  REQUIRE( ce.cells.size() == 3 );
  CHECK( ce.cells[0].xPos == 1 );
  CHECK( ce.cells[1].xPos == 2 );
  CHECK( ce.cells[2].xPos == 10 );

  REQUIRE( ce.uniqStims.size() == 3 );
  CHECK( ce.uniqStims[0] == 1 );
  CHECK( ce.uniqStims[2] == 3 );
  
  std::remove( f.c_str() );
}

TEST_CASE( "malformed containers do not load" , "[xstore]" )
{
  const std::string f = testdata::temp_file( "bad.db" );

  SECTION( "no cells" ) {
    {
      hstore_t h( f );
      h.set_attr( "/" , "format" , globals::store_format );
    }
    CHECK_THROWS_WITH( xstore::load( f ) , Catch::Contains( "no cells group" ) );
  }

  SECTION( "wrong format" ) {
    {
      hstore_t h( f );
      h.set_attr( "/" , "format" , "something-else" );
      h.create_group( "/cells" );
    }
    CHECK_THROWS_AS( xstore::load( f ) , std::runtime_error );
  }

  SECTION( "newer schema" ) {
    {
      hstore_t h( f );
      h.set_attr( "/" , "schema_version" , globals::store_schema_version + 1 );
      h.create_group( "/cells" );
    }
    CHECK_THROWS_WITH( xstore::load( f ) , Catch::Contains( "schema version" ) );
  }
  
  SECTION( "trials without repeat counts" ) {
    {
      hstore_t h( f );
      std::vector<double> cyc( 6 , 0 );
      h.set_array( "/cells/cell_0" , "cyc" , cyc , std::vector<int>{ 2 , 3 } );
    }
    CHECK_THROWS_WITH( xstore::load( f ) , Catch::Contains( "cyc_repeats" ) );
  }

  SECTION( "missing file" ) {
    CHECK_THROWS_AS( xstore::load( f ) , std::runtime_error );
  }
  
  std::remove( f.c_str() );
}

TEST_CASE( "a failed save leaves any earlier file untouched" , "[xstore]" )
{
  const std::string f = testdata::temp_file( "atomic.db" );
  const std::string partial = f + globals::partial_suffix;

  cell_extraction_t ce = populated();
  xstore::save( ce , f );

  // an out-of-range condition index cannot be written
  cell_extraction_t bad = ce;
  bad.cells[1].xPos = 99;
  bad.cells[2].condition_response[ 99 ] = 1.0;
  CHECK_THROWS_AS( xstore::save( bad , f ) , std::runtime_error );

  CHECK_FALSE( Helper::fileExists( partial ) );
  cell_extraction_t ce2 = xstore::load( f );
  REQUIRE( ce2.cells.size() == 3 );
  CHECK( ce2.cells[1].xPos == ce.cells[1].xPos );

  // a stale partial file from an earlier run is replaced
  {
    std::ofstream O1( partial.c_str() );
    O1 << "not a database\n";
  }
  xstore::save( ce , f );
  CHECK_FALSE( Helper::fileExists( partial ) );
  CHECK( xstore::load( f ).cells.size() == 3 );
  
  std::remove( f.c_str() );
}
