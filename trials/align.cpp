
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


#include "trials/align.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "param.h"

#include <set>

align_param_t::align_param_t()
{
  pre = 0;
  post = 5;
  resp_start = 0;
  resp_stop = post;
  subtract_baseline = false;
  onset = ONSET_FIRST_FRAME;
  truncate = false;
}

align_param_t::align_param_t( const param_t & param )
{
  *this = align_param_t();
  
  if ( param.has( "pre" ) ) pre = param.requires_int( "pre" );
  if ( param.has( "post" ) ) post = param.requires_int( "post" );

  resp_start = param.has( "resp-start" ) ? param.requires_int( "resp-start" ) : 0 ;
  resp_stop  = param.has( "resp-stop" ) ? param.requires_int( "resp-stop" ) : post ;
  
  subtract_baseline = param.yesno( "subtract-baseline" );
  
  if ( param.has( "onset" ) )
    {
      const std::string o = param.requires( "onset" );
      if ( Helper::iequals( o , "first" ) ) onset = ONSET_FIRST_FRAME;
      else if ( Helper::iequals( o , "nearest" ) ) onset = ONSET_NEAREST_FRAME;
      else Helper::halt( "onset should be 'first' or 'nearest'" );
    }

  truncate = param.yesno( "truncate" );
  
  check();
}

void align_param_t::check() const
{
  if ( pre < 0 ) Helper::halt( "pre cannot be negative" );
  if ( post < 1 ) Helper::halt( "post must be at least 1 frame" );
  if ( resp_start < 0 || resp_stop > post || resp_stop <= resp_start )
    Helper::halt( "response window [resp-start,resp-stop) must lie within [0,post)" );
  if ( subtract_baseline && pre == 0 )
    Helper::halt( "subtract-baseline requires pre > 0" );
}

std::string align_param_t::describe() const
{
  std::stringstream ss;
  ss << "pre=" << pre
     << " post=" << post
     << " resp=[" << resp_start << "," << resp_stop << ")"
     << " subtract-baseline=" << ( subtract_baseline ? "T" : "F" )
     << " onset=" << ( onset == ONSET_FIRST_FRAME ? "first" : "nearest" )
     << " truncate=" << ( truncate ? "T" : "F" );
  return ss.str();
}

int align_result_t::total_dropped() const
{
  int t = 0;
  for (int i=0; i<n_dropped.size(); i++) t += n_dropped[i];
  return t;
}


void trials::check_streams( const std::vector<double> & twophotontimes ,
			    const std::vector<double> & stimOn ,
			    const std::vector<int> & stimID )
{
  if ( twophotontimes.size() == 0 )
    Helper::halt( "twophotontimes is empty" );

  if ( stimOn.size() == 0 )
    Helper::halt( "stimOn is empty" );

  if ( stimOn.size() != stimID.size() )
    Helper::halt( "stimOn/stimID length mismatch ("
		  + Helper::int2str( (int)stimOn.size() ) + " vs "
		  + Helper::int2str( (int)stimID.size() ) + ")" );

  int bad = 0;
  if ( ! MiscMath::strictly_increasing( twophotontimes , &bad ) )
    Helper::halt( "twophotontimes is not strictly increasing (at frame " + Helper::int2str( bad ) + ")" );

  if ( ! MiscMath::strictly_increasing( stimOn , &bad ) )
    Helper::halt( "stimOn is not strictly increasing (at onset " + Helper::int2str( bad ) + ")" );
}


std::vector<int> trials::unique_stims( const std::vector<int> & stimID )
{
  std::set<int> s( stimID.begin() , stimID.end() );
  return std::vector<int>( s.begin() , s.end() );
}


std::vector<int> trials::onset_frames( const std::vector<double> & tpt ,
				       const std::vector<double> & stimOn ,
				       const onset_rule_t rule )
{
  std::vector<int> f( stimOn.size() , -1 );
  if ( tpt.size() == 0 ) return f;

  const double t0 = tpt[0];
  const double t1 = tpt[ tpt.size() - 1 ];
  
  for (int i=0; i<stimOn.size(); i++)
    {
      if ( stimOn[i] < t0 || stimOn[i] > t1 ) continue;
      if ( rule == ONSET_FIRST_FRAME )
	f[i] = MiscMath::first_at_or_after( tpt , stimOn[i] );
      else
	f[i] = MiscMath::nearest_idx( tpt , stimOn[i] );
    }
  return f;
}


double trials::trial_response( const Eigen::MatrixXd & cyc , const int r , const align_param_t & param )
{
  const double resp = cyc.block( r , param.pre + param.resp_start , 1 , param.resp_stop - param.resp_start ).mean();
  if ( ! param.subtract_baseline ) return resp;
  return resp - cyc.block( r , 0 , 1 , param.pre ).mean();
}


align_result_t trials::align( const std::vector<double> & raw ,
			      const std::vector<double> & twophotontimes ,
			      const std::vector<double> & stimOn ,
			      const std::vector<int> & stimID ,
			      const std::vector<int> & uniqStims ,
			      const align_param_t & param )
{

  param.check();
  
  check_streams( twophotontimes , stimOn , stimID );
  
  const int n = raw.size();

  if ( n != twophotontimes.size() )
    Helper::halt( "raw trace length (" + Helper::int2str( n ) + ") does not match twophotontimes ("
		  + Helper::int2str( (int)twophotontimes.size() ) + ")" );

  if ( uniqStims.size() == 0 )
    Helper::halt( "uniqStims is empty" );
  
  std::map<int,int> cidx;
  for (int c=0; c<uniqStims.size(); c++)
    {
      if ( cidx.find( uniqStims[c] ) != cidx.end() )
	Helper::halt( "uniqStims has duplicate condition " + Helper::int2str( uniqStims[c] ) );
      cidx[ uniqStims[c] ] = c;
    }
  
  const int nc = uniqStims.size();
  const int ns = param.samples();
  
  const std::vector<int> frames = onset_frames( twophotontimes , stimOn , param.onset );

  align_result_t res;
  res.n_dropped.resize( nc , 0 );
  res.n_truncated.resize( nc , 0 );
  
  // onset frames of kept trials, per condition
  std::vector<std::vector<int> > kept( nc );
  
  for (int i=0; i<stimID.size(); i++)
    {
      std::map<int,int>::const_iterator cc = cidx.find( stimID[i] );
      if ( cc == cidx.end() )
	Helper::halt( "stimID value " + Helper::int2str( stimID[i] ) + " is not in uniqStims" );
      
      const int f = frames[i];
      const int lower = f - param.pre;
      const int upper = f + param.post;
      
      // interval out-of-range
      if ( f < 0 || lower < 0 || upper > n )
	{
	  ++res.n_dropped[ cc->second ];
	  continue;
	}
      
      kept[ cc->second ].push_back( f );
    }

  //
  // optional truncation to a common repeat count
  //
  
  if ( param.truncate )
    {
      int mn = 0;
      for (int c=0; c<nc; c++)
	if ( kept[c].size() > 0 && ( mn == 0 || kept[c].size() < mn ) )
	  mn = kept[c].size();
      
      for (int c=0; c<nc; c++)
	if ( kept[c].size() > mn )
	  {
	    res.n_truncated[c] = kept[c].size() - mn;
	    kept[c].resize( mn );
	  }
    }

  //
  // build epochs
  //
  
  res.cyc.resize( nc );
  res.trial_response.resize( nc );
  
  for (int c=0; c<nc; c++)
    {
      const int nr = kept[c].size();
      Eigen::MatrixXd & X = res.cyc[c];
      X.resize( nr , ns );
      
      for (int r=0; r<nr; r++)
	{
	  const int lower = kept[c][r] - param.pre;
	  for (int j=0; j<ns; j++)
	    X(r,j) = raw[ lower + j ];
	  res.trial_response[c].push_back( trial_response( X , r , param ) );
	}

      // absent, not zero, when nothing survived
      if ( nr > 0 )
	res.condition_response[c] = MiscMath::mean( res.trial_response[c] );
    }
  
  return res;
}
