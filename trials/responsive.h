
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


#ifndef __OPHYS_RESPONSIVE_H__
#define __OPHYS_RESPONSIVE_H__

#include <vector>
#include <string>

struct param_t;
struct align_result_t;

struct responsive_param_t {

  responsive_param_t();

  explicit responsive_param_t( const param_t & param );
  
  // p-value threshold
  double alpha;
  
};

struct responsive_result_t {

  responsive_result_t() : responsive( false ) , p( 1 ) , F( 0 ) , df1( 0 ) , df2( 0 ) { } 
  
  bool responsive;
  double p;
  double F;
  int df1;
  int df2;
  
};


namespace trials {

  // blank=<id>|none|last; returns globals::no_blank when there is no blank
  int blank_condition( const std::vector<int> & uniqStims , const std::string & label );

  // one-way ANOVA of per-trial responses across conditions; a responsive
  // cell must also beat the blank, if there is one
  responsive_result_t responsiveness( const align_result_t & trials ,
				      const std::vector<int> & uniqStims ,
				      const int blank_id ,
				      const responsive_param_t & param );
  
}

#endif
