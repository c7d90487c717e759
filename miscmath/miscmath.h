
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


#ifndef __OPHYS_MISCMATH_H__
#define __OPHYS_MISCMATH_H__

#include <vector>
#include <cstddef>
#include <algorithm>

#include <stdint.h>
#include <map>

namespace MiscMath
{
  
  // nearest index [within lwr/upr range]
  int nearest_idx( const std::vector<double> & x , double value , int lwr = -1 , int upr = -1 );

  // first index i with x[i] >= value (x sorted ascending), or -1
  int first_at_or_after( const std::vector<double> & x , double value );

  // strictly increasing sequence? (if not, *bad is the first offending index)
  bool strictly_increasing( const std::vector<double> & x , int * bad = NULL );
  
  // mean
  double mean( const std::vector<double> & x );
  
  double sum( const std::vector<double> & x );

  double min(const std::vector<double> & x );

  void minmax( const std::vector<double> & x , double * mn , double * mx);

  // all values within EPS of each other
  bool flat( const std::vector<double> & x , double EPS = 1e-12 );

  // Pearson correlation (0 if either is flat)
  double correlation( const std::vector<double> & x , const std::vector<double> & y );
  
  // p-values for F-test
  double pF(const double F, const int df1, const int df2);
  double betai(const double a, const double b, const double x);
  double betacf(const double a, const double b, const double x);
  
  // angles/phases

  double rad2deg(double radians);

  double deg2rad(double degrees);

  // map to [0,360)
  double wrap360( double degrees );

  // map to [0,180)
  double wrap180( double degrees );
  
  // signed difference a --> b in (-180,180]
  double angle_difference( double a, double b );

}

#endif
