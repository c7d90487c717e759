
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


#ifndef __OPHYS_STATISTICS_H__
#define __OPHYS_STATISTICS_H__

#include <vector>

namespace Statistics { 
  
  template<class T> inline const T SQR(const T a) {return a*a;}
  template<class T> inline const T FNMAX(const T &a, const T &b) {return b > a ? (b) : (a);}
  template<class T> inline const T FNMIN(const T &a, const T &b) {return b < a ? (b) : (a);}

  // ln[Gamma(xx)] for xx > 0
  double gammln(double xx);

  // one-way ANOVA over groups of observations; empty groups are ignored;
  // returns the p-value (1.0 when the test is undefined)
  double oneway_anova( const std::vector<std::vector<double> > & groups ,
		       double * F = 0 , int * df1 = 0 , int * df2 = 0 );
  
}

#endif
