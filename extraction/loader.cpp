
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


#include "extraction/extraction.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;

//
// Segmentation traces: one row per cell
//
//   xPos yPos f0 f1 f2 ...
//

void cell_extraction_t::read_traces( const std::string & f )
{
  
  const std::string filename = Helper::expand( f );
  
  std::vector<std::string> lines = Helper::file2lines( filename );

  const int n0 = cells.size();
  
  for (int l=0; l<lines.size(); l++)
    {
      std::vector<std::string> tok = Helper::parse( lines[l] );

      const std::string what = filename + " line " + Helper::int2str( l + 1 );
      
      if ( tok.size() < 3 )
	Helper::halt( "expecting xPos yPos and at least one sample in " + what );

      std::vector<double> x = Helper::dbl_tokens( tok , 0 , what );
      std::vector<double> raw( x.begin() + 2 , x.end() );
      add_cell( x[0] , x[1] , raw );
    }
  
  logger << "  read " << cells.size() - n0 << " cell traces from " << filename << "\n";
}


//
// Timing and FOV description: tagged rows, e.g.
//
//   frames   0 0.033 0.067 ...
//   onsets   1.0 5.0 9.0 ...
//   ids      1 2 1 ...
//   offsets  dx0 dy0 dx1 dy1 ...
//   animal   M123
//
// numeric rows with the same tag are concatenated
//

void cell_extraction_t::read_timing( const std::string & f )
{

  const std::string filename = Helper::expand( f );
  
  std::vector<std::string> lines = Helper::file2lines( filename );

  std::vector<double> offsets;
  
  for (int l=0; l<lines.size(); l++)
    {
      std::vector<std::string> tok = Helper::parse( lines[l] );
      if ( tok.size() == 0 ) continue;

      const std::string tag = tok[0];
      const std::string what = filename + " (" + tag + ", line " + Helper::int2str( l + 1 ) + ")";

      // remainder of the line, for text fields
      std::vector<std::string> rest( tok.begin() + 1 , tok.end() );
      const std::string text = Helper::stringize( rest , " " );
      
      if ( tag == "frames" )
	{
	  std::vector<double> x = Helper::dbl_tokens( tok , 1 , what );
	  twophotontimes.insert( twophotontimes.end() , x.begin() , x.end() );
	}
      else if ( tag == "onsets" )
	{
	  std::vector<double> x = Helper::dbl_tokens( tok , 1 , what );
	  stimOn.insert( stimOn.end() , x.begin() , x.end() );
	}
      else if ( tag == "ids" )
	{
	  std::vector<int> x = Helper::int_tokens( tok , 1 , what );
	  stimID.insert( stimID.end() , x.begin() , x.end() );
	}
      else if ( tag == "offsets" )
	{
	  std::vector<double> x = Helper::dbl_tokens( tok , 1 , what );
	  offsets.insert( offsets.end() , x.begin() , x.end() );
	}
      else if ( tag == "animal" ) fov.animal_name = text;
      else if ( tag == "date" ) fov.recording_date = text;
      else if ( tag == "stim" ) fov.stim_type = text;
      else if ( tag == "region" ) fov.brain_region = text;
      else if ( tag == "layer" ) fov.layer = text;
      else if ( tag == "factor" )
	{
	  if ( tok.size() != 2 || ! Helper::str2int( tok[1] , &fov.factor ) )
	    Helper::halt( "expecting a single integer in " + what );
	}
      else if ( tag == "imaging" )
	fov.imaging_files = Helper::int_tokens( tok , 1 , what );
      else if ( tag == "spk2" )
	fov.spk2_files = Helper::int_tokens( tok , 1 , what );
      else
	Helper::halt( "unrecognized row [" + tag + "] in " + filename );
    }

  if ( offsets.size() % 2 )
    Helper::halt( "offsets in " + filename + " should be dx,dy pairs" );

  if ( offsets.size() )
    {
      const int n = offsets.size() / 2;
      regOffsets.resize( n , 2 );
      for (int i=0; i<n; i++)
	{
	  regOffsets(i,0) = offsets[ 2*i ];
	  regOffsets(i,1) = offsets[ 2*i + 1 ];
	}
    }
  
  logger << "  read " << twophotontimes.size() << " frames, "
	 << stimOn.size() << " onsets from " << filename << "\n";
}
