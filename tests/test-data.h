
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


#ifndef __OPHYS_TEST_DATA_H__
#define __OPHYS_TEST_DATA_H__

#include "ophys.h"

#include <cmath>
#include <cstdio>

//
// A synthetic session: 200 frames at 1 Hz, 8 directions (ids 1..8,
// 0..315 deg) plus a blank (id 9), each shown 3 times, onsets every 6 s
//
//   cell 0 : von Mises tuned to 90 deg
//   cell 1 : unresponsive
//   cell 2 : von Mises tuned to 180 deg
//

namespace testdata {

  inline double bump( const double theta , const double mu , const double kappa = 2.0 )
  {
    return exp( kappa * ( cos( MiscMath::deg2rad( theta - mu ) ) - 1 ) );
  }
  
  inline cell_extraction_t session()
  {
    cell_extraction_t ce;

    const int nf = 200;
    for (int i=0; i<nf; i++) ce.twophotontimes.push_back( i );

    for (int k=0; k<27; k++)
      {
	ce.stimOn.push_back( 5 + 6 * k );
	ce.stimID.push_back( k % 9 + 1 );
      }
    
    ce.regOffsets.resize( nf , 2 );
    for (int i=0; i<nf; i++)
      {
	ce.regOffsets(i,0) = 0.1 * i;
	ce.regOffsets(i,1) = -0.2 * i;
      }

    ce.fov.animal_name = "M101";
    ce.fov.recording_date = "2026-10-19";
    ce.fov.stim_type = "gratings";
    ce.fov.brain_region = "V1";
    ce.fov.layer = "L2/3";
    ce.fov.factor = 2;
    ce.fov.imaging_files.push_back( 3 );
    ce.fov.imaging_files.push_back( 4 );

    const double prefs[3] = { 90 , -1 , 180 };

    for (int c=0; c<3; c++)
      {
	std::vector<double> raw( nf , 0 );
	for (int k=0; k<27; k++)
	  {
	    const int id = ce.stimID[k];
	    const int rep = k / 9;
	    double amp = 0;
	    if ( prefs[c] >= 0 && id != 9 )
	      amp = bump( ( id - 1 ) * 45.0 , prefs[c] );
	    // small, repeat-specific offsets give within-condition variance
	    const double off = 0.05 * ( rep - 1 );
	    for (int j=0; j<5; j++)
	      raw[ (int)ce.stimOn[k] + j ] = amp + off;
	  }
	ce.add_cell( 10.0 * c + 1 , 20.0 * c + 2 , raw );
      }
    
    return ce;
  }
  
  inline std::string temp_file( const std::string & name )
  {
    const std::string f = "ophys-test-" + name;
    std::remove( f.c_str() );
    std::remove( ( f + globals::partial_suffix ).c_str() );
    return f;
  }
  
}

#endif
