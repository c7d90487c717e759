
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

#include <stdexcept>

using Catch::Matchers::Contains;

// 100 frames at 1 Hz; the trace value is the frame index
static std::vector<double> frames( const int n = 100 )
{
  std::vector<double> t( n );
  for (int i=0; i<n; i++) t[i] = i;
  return t;
}

TEST_CASE( "alignment builds per-condition trial matrices" , "[align]" )
{
  const std::vector<double> tpt = frames();
  const std::vector<double> raw = frames();
  
  std::vector<double> stimOn = { 10 , 30 , 50 };
  std::vector<int> stimID = { 1 , 2 , 1 };
  std::vector<int> uniq = { 1 , 2 };

  align_param_t param;
  REQUIRE( param.samples() == 5 );
  
  align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , param );

  REQUIRE( res.cyc.size() == 2 );
  CHECK( res.cyc[0].rows() == 2 );
  CHECK( res.cyc[0].cols() == 5 );
  CHECK( res.cyc[1].rows() == 1 );
  CHECK( res.cyc[1].cols() == 5 );

  SECTION( "epochs start at the onset frame" ) {
    CHECK( res.cyc[0](0,0) == 10 );
    CHECK( res.cyc[0](1,4) == 54 );
    CHECK( res.cyc[1](0,0) == 30 );
  }

  SECTION( "condition responses are repeat means of the response window" ) {
    REQUIRE( res.condition_response.size() == 2 );
    CHECK( res.condition_response[0] == Approx( 32 ) );
    CHECK( res.condition_response[1] == Approx( 32 ) );
    REQUIRE( res.trial_response[0].size() == 2 );
    CHECK( res.trial_response[0][0] == Approx( 12 ) );
    CHECK( res.trial_response[0][1] == Approx( 52 ) );
  }

  SECTION( "nothing dropped" ) {
    CHECK( res.total_dropped() == 0 );
  }
}

TEST_CASE( "trials running past the trace are dropped and counted" , "[align]" )
{
  const std::vector<double> tpt = frames();
  const std::vector<double> raw = frames();
  std::vector<int> stimID = { 1 , 2 , 1 };
  std::vector<int> uniq = { 1 , 2 };
  align_param_t param;

  SECTION( "window past the last frame" ) {
    std::vector<double> stimOn = { 10 , 30 , 97 };
    align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , param );
    CHECK( res.cyc[0].rows() == 1 );
    CHECK( res.cyc[1].rows() == 1 );
    CHECK( res.n_dropped[0] == 1 );
    CHECK( res.n_dropped[1] == 0 );
    CHECK( res.total_dropped() == 1 );
  }

  SECTION( "onset after the last frame" ) {
    std::vector<double> stimOn = { 10 , 30 , 99.5 };
    align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , param );
    CHECK( res.cyc[0].rows() == 1 );
    CHECK( res.n_dropped[0] == 1 );
  }

  SECTION( "window before the first frame" ) {
    param_t p;
    p.parse( "pre=15" );
    align_param_t param2( p );
    std::vector<double> stimOn = { 10 , 30 , 50 };
    align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , param2 );
    CHECK( res.cyc[0].rows() == 1 );
    CHECK( res.cyc[0].cols() == 20 );
    CHECK( res.n_dropped[0] == 1 );
  }
}

TEST_CASE( "a condition without valid trials has no response entry" , "[align]" )
{
  const std::vector<double> tpt = frames();
  const std::vector<double> raw = frames();
  std::vector<double> stimOn = { 10 , 30 , 97 };
  std::vector<int> stimID = { 1 , 2 , 3 };
  std::vector<int> uniq = { 1 , 2 , 3 };

  align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , align_param_t() );

  REQUIRE( res.cyc.size() == 3 );
  CHECK( res.cyc[2].rows() == 0 );
  CHECK( res.cyc[2].cols() == 5 );
  CHECK( res.condition_response.count( 2 ) == 0 );
  CHECK( res.condition_response.count( 0 ) == 1 );
}

TEST_CASE( "alignment options" , "[align]" )
{
  const std::vector<double> tpt = frames();
  const std::vector<double> raw = frames();
  std::vector<double> stimOn = { 10 , 30 , 50 };
  std::vector<int> stimID = { 1 , 2 , 1 };
  std::vector<int> uniq = { 1 , 2 };

  SECTION( "baseline subtraction" ) {
    param_t p;
    p.parse( "pre=2" );
    p.parse( "subtract-baseline" );
    align_param_t param( p );
    align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , param );
    CHECK( res.cyc[0].cols() == 7 );
    CHECK( res.cyc[0](0,0) == 8 );
    // mean(10..14) - mean(8,9)
    CHECK( res.trial_response[0][0] == Approx( 3.5 ) );
    CHECK( res.condition_response[0] == Approx( 3.5 ) );
  }

  SECTION( "response sub-window" ) {
    param_t p;
    p.parse( "resp-start=1" );
    p.parse( "resp-stop=3" );
    align_param_t param( p );
    align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , param );
    CHECK( res.trial_response[1][0] == Approx( 31.5 ) );
  }
  
  SECTION( "onset rules" ) {
    std::vector<double> late = { 10.4 , 30.4 , 50.4 };

    param_t p1;
    p1.parse( "onset=first" );
    align_result_t r1 = trials::align( raw , tpt , late , stimID , uniq , align_param_t( p1 ) );
    CHECK( r1.cyc[0](0,0) == 11 );

    param_t p2;
    p2.parse( "onset=nearest" );
    align_result_t r2 = trials::align( raw , tpt , late , stimID , uniq , align_param_t( p2 ) );
    CHECK( r2.cyc[0](0,0) == 10 );
  }

  SECTION( "truncation to the minimum repeat count" ) {
    param_t p;
    p.parse( "truncate" );
    align_result_t res = trials::align( raw , tpt , stimOn , stimID , uniq , align_param_t( p ) );
    CHECK( res.cyc[0].rows() == 1 );
    CHECK( res.cyc[1].rows() == 1 );
    CHECK( res.n_truncated[0] == 1 );
    CHECK( res.n_dropped[0] == 0 );
  }
}

TEST_CASE( "malformed acquisition streams are rejected" , "[align]" )
{
  const std::vector<double> tpt = frames();
  const std::vector<double> raw = frames();
  std::vector<int> uniq = { 1 , 2 };
  align_param_t param;

  SECTION( "stimOn/stimID length mismatch" ) {
    std::vector<double> stimOn = { 10 , 30 , 50 };
    std::vector<int> stimID = { 1 , 2 };
    REQUIRE_THROWS_WITH( trials::align( raw , tpt , stimOn , stimID , uniq , param ) , Contains( "stimOn/stimID" ) );
  }

  SECTION( "trace length differs from twophotontimes" ) {
    std::vector<double> stimOn = { 10 };
    std::vector<int> stimID = { 1 };
    std::vector<double> shorter( 50 , 0 );
    REQUIRE_THROWS_WITH( trials::align( shorter , tpt , stimOn , stimID , uniq , param ) , Contains( "raw trace length" ) );
  }

  SECTION( "twophotontimes not strictly increasing" ) {
    std::vector<double> t2 = tpt;
    t2[40] = t2[39];
    std::vector<double> stimOn = { 10 };
    std::vector<int> stimID = { 1 };
    REQUIRE_THROWS_WITH( trials::align( raw , t2 , stimOn , stimID , uniq , param ) , Contains( "twophotontimes" ) );
  }

  SECTION( "stimOn not strictly increasing" ) {
    std::vector<double> stimOn = { 30 , 10 };
    std::vector<int> stimID = { 1 , 2 };
    REQUIRE_THROWS_WITH( trials::align( raw , tpt , stimOn , stimID , uniq , param ) , Contains( "stimOn" ) );
  }

  SECTION( "empty onsets" ) {
    std::vector<double> stimOn;
    std::vector<int> stimID;
    REQUIRE_THROWS_AS( trials::align( raw , tpt , stimOn , stimID , uniq , param ) , std::runtime_error );
  }

  SECTION( "unknown condition" ) {
    std::vector<double> stimOn = { 10 };
    std::vector<int> stimID = { 7 };
    REQUIRE_THROWS_WITH( trials::align( raw , tpt , stimOn , stimID , uniq , param ) , Contains( "stimID" ) );
  }
}

TEST_CASE( "alignment parameters are checked" , "[align]" )
{
  param_t p;
  p.parse( "subtract-baseline" );
  REQUIRE_THROWS_AS( align_param_t( p ) , std::runtime_error );

  param_t p2;
  p2.parse( "resp-stop=9" );
  REQUIRE_THROWS_AS( align_param_t( p2 ) , std::runtime_error );

  param_t p3;
  p3.parse( "onset=middle" );
  REQUIRE_THROWS_AS( align_param_t( p3 ) , std::runtime_error );
}

TEST_CASE( "unique conditions are sorted" , "[align]" )
{
  std::vector<int> ids = { 3 , 1 , 2 , 3 , 1 };
  std::vector<int> u = trials::unique_stims( ids );
  REQUIRE( u == std::vector<int>( { 1 , 2 , 3 } ) );
}
