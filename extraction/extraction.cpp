
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
#include "trials/align.h"
#include "trials/responsive.h"
#include "tuning/tuning.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"
#include "param.h"

#include <limits>

extern logger_t logger;

void cell_extraction_t::add_cell( const double x , const double y , const std::vector<double> & raw )
{
  cells.push_back( cell_t( x , y , raw ) );
}

double cell_extraction_t::duration() const
{
  if ( twophotontimes.size() < 2 ) return 0;
  return twophotontimes[ twophotontimes.size() - 1 ] - twophotontimes[0];
}

void cell_extraction_t::validate() const
{

  trials::check_streams( twophotontimes , stimOn , stimID );

  const int nf = n_frames();
  
  if ( has_registration() && ( regOffsets.rows() != nf || regOffsets.cols() != 2 ) )
    Helper::halt( "regOffsets is " + Helper::int2str( (int)regOffsets.rows() ) + " x "
		  + Helper::int2str( (int)regOffsets.cols() ) + ", expecting "
		  + Helper::int2str( nf ) + " x 2" );
  
  if ( uniqStims.size() != 0 && uniqStims != trials::unique_stims( stimID ) )
    Helper::halt( "uniqStims does not match the unique values of stimID" );
  
  for (int i=0; i<cells.size(); i++)
    if ( cells[i].raw.size() != nf )
      Helper::halt( "cell " + Helper::int2str(i) + ": raw trace length ("
		    + Helper::int2str( (int)cells[i].raw.size() ) + ") does not match twophotontimes ("
		    + Helper::int2str( nf ) + ")" );
}


void cell_extraction_t::populate( const param_t & param )
{
  align_param_t aparam( param );
  responsive_param_t rparam( param );
  tuning_param_t tparam( param );
  const std::string blank = param.has( "blank" ) ? param.value( "blank" ) : "last" ;
  const bool do_tuning = param.yesno( "tuning" , true , true );
  populate( aparam , rparam , blank , do_tuning ? &tparam : NULL );
}


void cell_extraction_t::populate( const align_param_t & aparam ,
				  const responsive_param_t & rparam ,
				  const std::string & blank ,
				  const tuning_param_t * tparam )
{

  for (int i=0; i<cells.size(); i++)
    if ( cells[i].aligned() )
      Helper::halt( "extraction is already populated" );
  
  validate();

  if ( uniqStims.size() == 0 )
    uniqStims = trials::unique_stims( stimID );

  const int blank_id = trials::blank_condition( uniqStims , blank );
  
  logger << "  aligning " << cells.size() << " cells to "
	 << stimOn.size() << " onsets, "
	 << uniqStims.size() << " conditions ("
	 << ( blank_id == globals::no_blank ? std::string( "no blank" ) : "blank " + Helper::int2str( blank_id ) )
	 << ")\n"
	 << "  " << aparam.describe() << "\n";
  
  if ( cells.size() == 0 )
    Helper::warn( "no cells to align" );

  for (int i=0; i<cells.size(); i++)
    {
      cell_t & cell = cells[i];
      
      align_result_t res = trials::align( cell.raw , twophotontimes , stimOn , stimID , uniqStims , aparam );
      
      cell.cyc = res.cyc;
      cell.condition_response = res.condition_response;
      cell.n_dropped = res.n_dropped;
      cell.uniqStims = uniqStims;
      cell.blank_id = blank_id;

      responsive_result_t rr = trials::responsiveness( res , uniqStims , blank_id , rparam );
      cell.ROI_responsiveness = rr.responsive;
      cell.responsive_p = rr.p;

      // trial structure is the same for every cell: report once
      if ( i == 0 )
	{
	  for (int c=0; c<uniqStims.size(); c++)
	    {
	      if ( res.n_dropped[c] )
		Helper::warn( "condition " + Helper::int2str( uniqStims[c] ) + ": dropped "
			      + Helper::int2str( res.n_dropped[c] ) + " trial(s) with windows outside the trace" );
	      if ( res.cyc[c].rows() == 0 )
		Helper::warn( "condition " + Helper::int2str( uniqStims[c] ) + " has no valid trials" );
	      if ( res.n_truncated[c] )
		logger << "  truncated condition " << uniqStims[c] << " by " << res.n_truncated[c] << " repeat(s)\n";
	    }
	}
    }

  const int nr = responsive_cells().size();
  logger << "  " << nr << " of " << cells.size() << " cells responsive (alpha = " << rparam.alpha << ")\n";
  
  if ( tparam )
    fit_tuning( *tparam );
}


int cell_extraction_t::fit_tuning( const tuning_param_t & param )
{

  int fitted = 0;
  
  for (int i=0; i<cells.size(); i++)
    {
      cell_t & cell = cells[i];

      cell.has_tuning = false;
      cell.tuning = tuning_t();
      cell.tuning_curve.clear();
      
      if ( ! cell.aligned() ) continue;
      if ( ! ( param.fit_all || cell.ROI_responsiveness ) ) continue;

      std::vector<double> responses, angles;
      const int n = cell.tuning_input( &responses , &angles );

      if ( responses.size() == 0 )
	{
	  Helper::warn( "cell " + Helper::int2str(i) + ": no stimulus conditions with valid trials, tuning not fitted" );
	  continue;
	}

      if ( responses.size() < n )
	Helper::warn( "cell " + Helper::int2str(i) + ": fitting tuning on " + Helper::int2str( (int)responses.size() )
		      + " of " + Helper::int2str( n ) + " stimulus conditions" );
      
      cell.tuning = tuning::fit_tuning( responses , angles , &cell.tuning_curve , param );
      cell.has_tuning = true;
      ++fitted;
    }

  logger << "  fitted tuning curves for " << fitted << " cells\n";
  
  return fitted;
}


std::vector<int> cell_extraction_t::responsive_cells() const
{
  std::vector<int> r;
  for (int i=0; i<cells.size(); i++)
    if ( cells[i].ROI_responsiveness ) r.push_back( i );
  return r;
}


std::vector<double> cell_extraction_t::to_array( const std::string & field ) const
{
  
  const double NaN = std::numeric_limits<double>::quiet_NaN();

  std::vector<double> r( cells.size() , NaN );

  const bool tuning_field = field == "pref_dir_fit" || field == "pref_ort_fit"
    || field == "dti_fit" || field == "oti_fit"
    || field == "fit_bandwidth" || field == "fit_r";

  if ( ! ( tuning_field || field == "xPos" || field == "yPos"
	   || field == "responsive_p" || field == "ROI_responsiveness" ) )
    Helper::halt( "unknown cell field: " + field );
  
  for (int i=0; i<cells.size(); i++)
    {
      const cell_t & cell = cells[i];
      if ( field == "xPos" ) r[i] = cell.xPos;
      else if ( field == "yPos" ) r[i] = cell.yPos;
      else if ( field == "responsive_p" ) r[i] = cell.responsive_p;
      else if ( field == "ROI_responsiveness" ) r[i] = cell.ROI_responsiveness;
      else if ( cell.has_tuning )
	{
	  const tuning_t & t = cell.tuning;
	  if ( field == "pref_dir_fit" ) r[i] = t.pref_dir_fit;
	  else if ( field == "pref_ort_fit" ) r[i] = t.pref_ort_fit;
	  else if ( field == "dti_fit" ) r[i] = t.dti_fit;
	  else if ( field == "oti_fit" ) r[i] = t.oti_fit;
	  else if ( field == "fit_bandwidth" ) r[i] = t.fit_bandwidth;
	  else if ( field == "fit_r" ) r[i] = t.fit_r;
	}
    }
  
  return r;
}


std::string cell_extraction_t::summary() const
{

  int ntuned = 0;
  for (int i=0; i<cells.size(); i++)
    if ( cells[i].has_tuning ) ++ntuned;

  const int blank_id = cells.size() ? cells[0].blank_id : globals::no_blank ;
  
  std::stringstream ss;
  
  ss << "  FOV          : " << ( fov.empty() ? std::string( "." ) : fov.label() ) << "\n"
     << "  frames       : " << n_frames() << " (" << Helper::dbl2str( duration() , 2 ) << " s)\n"
     << "  onsets       : " << stimOn.size() << "\n"
     << "  conditions   : " << uniqStims.size();

  if ( uniqStims.size() )
    ss << " [" << Helper::stringize( uniqStims ) << "]";

  if ( blank_id != globals::no_blank )
    ss << ", blank " << blank_id;
  
  ss << "\n"
     << "  registration : " << ( has_registration() ? "yes" : "no" ) << "\n"
     << "  cells        : " << cells.size() << "\n"
     << "  responsive   : " << responsive_cells().size() << "\n"
     << "  tuned        : " << ntuned << "\n";

  return ss.str();
}
