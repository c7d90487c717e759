
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

TEST_CASE( "populating a session" , "[extraction]" )
{
  cell_extraction_t ce = testdata::session();

  REQUIRE_NOTHROW( ce.validate() );
  CHECK( ce.n_frames() == 200 );
  CHECK( ce.duration() == 199 );
  CHECK( ce.has_registration() );
  CHECK_FALSE( ce.cells[0].aligned() );

  param_t param;
  ce.populate( param );

  // derived conditions, blank defaults to the last one
  REQUIRE( ce.uniqStims.size() == 9 );
  CHECK( ce.uniqStims[8] == 9 );
  
  for (int i=0; i<3; i++)
    {
      const cell_t & cell = ce.cells[i];
      CHECK( cell.aligned() );
      CHECK( cell.n_conditions() == 9 );
      CHECK( cell.n_samples() == 5 );
      CHECK( cell.n_repeats( 0 ) == 3 );
      CHECK( cell.blank_id == 9 );
      CHECK( cell.has_blank() );
    }

  // two tuned cells, one silent
  std::vector<int> resp = ce.responsive_cells();
  REQUIRE( resp.size() == 2 );
  CHECK( resp[0] == 0 );
  CHECK( resp[1] == 2 );
  CHECK( ce.cells[0].responsive_p < 0.01 );
  CHECK( ce.cells[1].responsive_p > 0.5 );

  // only responsive cells are fitted by default
  CHECK( ce.cells[0].has_tuning );
  CHECK_FALSE( ce.cells[1].has_tuning );
  CHECK( ce.cells[2].has_tuning );
  
  CHECK( ce.cells[0].tuning.pref_dir_fit == Approx( 90 ).margin( 5 ) );
  CHECK( fabs( MiscMath::angle_difference( ce.cells[2].tuning.pref_dir_fit , 180 ) ) < 5 );
  CHECK( ce.cells[0].tuning.fit_r > 0.99 );
  CHECK( ce.cells[0].tuning_curve.size() == 360 );

  // the blank is left out of the tuning input
  std::vector<double> r, a;
  CHECK( ce.cells[0].tuning_input( &r , &a ) == 8 );
  REQUIRE( a.size() == 8 );
  CHECK( a[2] == Approx( 90 ) );
  CHECK( r[2] == Approx( 1.0 ) );

  // populate is one-time
  CHECK_THROWS_WITH( ce.populate( param ) , Catch::Contains( "already populated" ) );

  // re-fitting is not
  tuning_param_t tp;
  tp.fit_all = true;
  CHECK( ce.fit_tuning( tp ) == 3 );
  CHECK( ce.cells[1].has_tuning );
  CHECK( ce.cells[1].tuning.degenerate );
  CHECK( ce.cells[1].tuning.dti_fit == 0 );
}

TEST_CASE( "population options" , "[extraction]" )
{
  cell_extraction_t ce = testdata::session();

  SECTION( "no tuning" ) {
    param_t param;
    param.parse( "tuning=F" );
    ce.populate( param );
    CHECK( ce.responsive_cells().size() == 2 );
    CHECK_FALSE( ce.cells[0].has_tuning );
  }

  SECTION( "no blank" ) {
    param_t param;
    param.parse( "blank=none" );
    ce.populate( param );
    CHECK( ce.cells[0].blank_id == globals::no_blank );
    CHECK_FALSE( ce.cells[0].has_blank() );
    CHECK( ce.cells[0].ROI_responsiveness );
    CHECK( ce.cells[0].tuning.n_angles == 9 );
  }

  SECTION( "unknown blank" ) {
    param_t param;
    param.parse( "blank=12" );
    CHECK_THROWS_AS( ce.populate( param ) , std::runtime_error );
  }

  SECTION( "onsets past the last frame are dropped" ) {
    ce.stimOn.push_back( 250 );
    ce.stimID.push_back( 1 );
    param_t param;
    ce.populate( param );
    CHECK( ce.cells[0].n_dropped[0] == 1 );
    CHECK( ce.cells[0].n_repeats( 0 ) == 3 );
  }
  
}

TEST_CASE( "per-cell arrays" , "[extraction]" )
{
  cell_extraction_t ce = testdata::session();
  param_t param;
  ce.populate( param );

  std::vector<double> x = ce.to_array( "xPos" );
  REQUIRE( x.size() == 3 );
  CHECK( x[0] == 1 );
  CHECK( x[2] == 21 );

  CHECK( ce.to_array( "yPos" )[1] == 22 );
  CHECK( ce.to_array( "ROI_responsiveness" )[1] == 0 );
  
  std::vector<double> pref = ce.to_array( "pref_dir_fit" );
  CHECK( pref[0] == Approx( 90 ).margin( 5 ) );
  CHECK( std::isnan( pref[1] ) );

  std::vector<double> bw = ce.to_array( "fit_bandwidth" );
  CHECK( bw[0] > 0 );
  CHECK( std::isnan( bw[1] ) );
  
  CHECK_THROWS_WITH( ce.to_array( "brightness" ) , Catch::Contains( "unknown cell field" ) );
}

TEST_CASE( "session summary" , "[extraction]" )
{
  cell_extraction_t ce = testdata::session();
  param_t param;
  ce.populate( param );

  const std::string s = ce.summary();
  CHECK_THAT( s , Catch::Contains( "M101 2026-10-19 gratings V1 L2/3" ) );
  CHECK_THAT( s , Catch::Contains( "frames       : 200" ) );
  CHECK_THAT( s , Catch::Contains( "[1,2,3,4,5,6,7,8,9], blank 9" ) );
  CHECK_THAT( s , Catch::Contains( "registration : yes" ) );
  CHECK_THAT( s , Catch::Contains( "responsive   : 2" ) );
  CHECK_THAT( s , Catch::Contains( "tuned        : 2" ) );
}

TEST_CASE( "validation of cells and registration" , "[extraction]" )
{
  cell_extraction_t ce = testdata::session();

  SECTION( "short trace" ) {
    ce.add_cell( 0 , 0 , std::vector<double>( 10 , 0 ) );
    CHECK_THROWS_WITH( ce.validate() , Catch::Contains( "cell 3: raw trace length (10)" ) );
    param_t param;
    CHECK_THROWS_AS( ce.populate( param ) , std::runtime_error );
  }

  SECTION( "registration shape" ) {
    ce.regOffsets.resize( 10 , 2 );
    CHECK_THROWS_WITH( ce.validate() , Catch::Contains( "regOffsets" ) );
  }

  SECTION( "inconsistent uniqStims" ) {
    ce.uniqStims = { 1 , 2 };
    CHECK_THROWS_WITH( ce.validate() , Catch::Contains( "uniqStims" ) );
  }
}

TEST_CASE( "text inputs" , "[extraction]" )
{
  const std::string traces = testdata::temp_file( "traces.txt" );
  const std::string timing = testdata::temp_file( "timing.txt" );
  
  {
    std::ofstream O1( traces.c_str() );
    O1 << "# xPos yPos samples\n"
       << "10 20 0 0 1 1 0 0\n"
       << "30 40 0 0 0 0 1 1\n";
  }

  {
    std::ofstream O1( timing.c_str() );
    O1 << "frames 0 1 2\n"
       << "frames 3 4 5\n"
       << "onsets 1 3\n"
       << "ids 1 2\n"
       << "offsets 0 0 1 1 2 2 3 3 4 4 5 5\n"
       << "animal M7\n"
       << "stim drifting gratings\n"
       << "factor 4\n"
       << "imaging 1 2 3\n";
  }

  cell_extraction_t ce;
  ce.read_traces( traces );
  ce.read_timing( timing );

  REQUIRE( ce.cells.size() == 2 );
  CHECK( ce.cells[1].xPos == 30 );
  CHECK( ce.cells[1].raw.size() == 6 );
  CHECK( ce.cells[1].raw[4] == 1 );

  CHECK( ce.n_frames() == 6 );
  CHECK( ce.stimOn.size() == 2 );
  CHECK( ce.stimID[1] == 2 );
  CHECK( ce.regOffsets.rows() == 6 );
  CHECK( ce.regOffsets(5,1) == 5 );
  CHECK( ce.fov.animal_name == "M7" );
  CHECK( ce.fov.stim_type == "drifting gratings" );
  CHECK( ce.fov.factor == 4 );
  CHECK( ce.fov.imaging_files.size() == 3 );
  
  REQUIRE_NOTHROW( ce.validate() );

  // unknown rows halt
  {
    std::ofstream O1( timing.c_str() , std::ios::app );
    O1 << "colour red\n";
  }
  cell_extraction_t ce2;
  CHECK_THROWS_WITH( ce2.read_timing( timing ) , Catch::Contains( "colour" ) );
  
  std::remove( traces.c_str() );
  std::remove( timing.c_str() );
}
