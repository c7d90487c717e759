
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


#include "stats/statistics.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>
#include <limits>

double Statistics::gammln(double xx)
{
  
  //  Returns the value ln[Γ(xx)] for xx > 0. 
  
  static double cof[6]={76.18009172947146,-86.50532032941677,
			24.01409824083091,-1.231739572450155,
			0.1208650973866179e-2,-0.5395239384953e-5}; 
  
  int j;
  double y=xx, x=xx; 
  double tmp=x+5.5; 
  tmp -= (x+0.5)*log(tmp); 
  double ser=1.000000000190015; 
  for (j=0;j<=5;j++) ser += cof[j]/++y; 
  return -tmp+log(2.5066282746310005*ser/x);
}


double Statistics::oneway_anova( const std::vector<std::vector<double> > & groups ,
				 double * pF , int * pdf1 , int * pdf2 )
{

  int k = 0;
  int n = 0;
  double grand = 0;
  
  for (int g=0; g<groups.size(); g++)
    {
      if ( groups[g].size() == 0 ) continue;
      ++k;
      n += groups[g].size();
      grand += MiscMath::sum( groups[g] );
    }

  const int df1 = k - 1;
  const int df2 = n - k;

  if ( pdf1 ) *pdf1 = df1;
  if ( pdf2 ) *pdf2 = df2;
  if ( pF ) *pF = 0;
  
  if ( df1 < 1 || df2 < 1 ) return 1.0;

  grand /= (double)n;

  double ssb = 0 , ssw = 0;
  
  for (int g=0; g<groups.size(); g++)
    {
      const int ng = groups[g].size();
      if ( ng == 0 ) continue;
      const double m = MiscMath::mean( groups[g] );
      ssb += ng * ( m - grand ) * ( m - grand );
      for (int i=0; i<ng; i++)
	ssw += ( groups[g][i] - m ) * ( groups[g][i] - m );
    }

  const double msb = ssb / (double)df1;
  const double msw = ssw / (double)df2;

  // no within-group variance: any between-group difference is exact
  if ( msw <= 0 )
    {
      if ( pF ) *pF = msb > 0 ? std::numeric_limits<double>::infinity() : 0 ;
      return msb > 0 ? 0.0 : 1.0;
    }

  const double F = msb / msw;
  if ( pF ) *pF = F;
  
  return MiscMath::pF( F , df1 , df2 );
}
