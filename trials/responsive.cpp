
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


#include "trials/responsive.h"
#include "trials/align.h"
#include "stats/statistics.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "defs/defs.h"
#include "param.h"

responsive_param_t::responsive_param_t()
{
  alpha = 0.01;
}

responsive_param_t::responsive_param_t( const param_t & param )
{
  alpha = param.has( "alpha" ) ? param.requires_dbl( "alpha" ) : 0.01 ;
  if ( alpha <= 0 || alpha >= 1 ) Helper::halt( "alpha should be between 0 and 1" );
}


int trials::blank_condition( const std::vector<int> & uniqStims , const std::string & label )
{
  if ( Helper::iequals( label , "none" ) ) return globals::no_blank;
  
  if ( label == "" || Helper::iequals( label , "last" ) )
    {
      if ( uniqStims.size() == 0 ) return globals::no_blank;
      int mx = uniqStims[0];
      for (int i=1; i<uniqStims.size(); i++) if ( uniqStims[i] > mx ) mx = uniqStims[i];
      return mx;
    }

  int id = 0;
  if ( ! Helper::str2int( label , &id ) )
    Helper::halt( "blank should be a condition id, 'none' or 'last': " + label );
  
  for (int i=0; i<uniqStims.size(); i++)
    if ( uniqStims[i] == id ) return id;

  Helper::halt( "blank condition " + label + " is not one of the stimulus conditions" );
  return globals::no_blank;
}


responsive_result_t trials::responsiveness( const align_result_t & trials ,
					    const std::vector<int> & uniqStims ,
					    const int blank_id ,
					    const responsive_param_t & param )
{
  responsive_result_t res;
  
  if ( trials.trial_response.size() != uniqStims.size() )
    Helper::halt( "internal error: trial responses do not match uniqStims" );
  
  res.p = Statistics::oneway_anova( trials.trial_response , &res.F , &res.df1 , &res.df2 );

  if ( ! ( res.p < param.alpha ) ) return res;

  //
  // best stimulus must exceed the blank
  //
  
  int blank = -1;
  for (int c=0; c<uniqStims.size(); c++)
    if ( uniqStims[c] == blank_id ) blank = c;
  
  if ( blank == -1 )
    {
      res.responsive = true;
      return res;
    }

  std::map<int,double>::const_iterator bb = trials.condition_response.find( blank );
  
  // no blank trials to compare against
  if ( bb == trials.condition_response.end() )
    {
      res.responsive = true;
      return res;
    }
  
  bool any = false;
  double best = 0;
  std::map<int,double>::const_iterator cc = trials.condition_response.begin();
  while ( cc != trials.condition_response.end() )
    {
      if ( cc->first != blank && ( ! any || cc->second > best ) )
	{
	  best = cc->second;
	  any = true;
	}
      ++cc;
    }

  res.responsive = any && best > bb->second;
  return res;
}
