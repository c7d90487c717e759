
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


#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "stats/statistics.h"

#include <cmath>
#include <vector>

#include <iostream>

int MiscMath::nearest_idx( const std::vector<double> & x , double value , int lwr  , int upr )
{
  if ( x.size() == 0 ) return -1;
  int start = lwr >= 0 ? lwr : 0 ;
  int stop  = upr >= 0 ? upr : x.size() - 1 ;
  int nidx = -1;
  double diff = 0;

  for (int i=start;i<=stop;i++)
    {
      double d = fabs( x[i] - value );
      if ( nidx == -1 || d < diff )
	{
	  nidx = i;
	  diff = d;
	}	
    }
  return nidx;
}

int MiscMath::first_at_or_after( const std::vector<double> & x , double value )
{
  std::vector<double>::const_iterator ii = std::lower_bound( x.begin() , x.end() , value );
  if ( ii == x.end() ) return -1;
  return ii - x.begin();
}

bool MiscMath::strictly_increasing( const std::vector<double> & x , int * bad )
{
  for (int i=1; i<x.size(); i++)
    if ( ! ( x[i] > x[i-1] ) )
      {
	if ( bad != NULL ) *bad = i;
	return false;
      }
  return true;
}

double MiscMath::sum( const std::vector<double> & x )
{
  double s = 0;
  for (int i=0;i<x.size();i++) s += x[i];
  return s;
}

double MiscMath::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return 0; // silently fail here
  return sum( x ) / (double)n;
}

double MiscMath::min(const std::vector<double> & x )
{
  double mn, mx;
  minmax( x , &mn , &mx );
  return mn;
}

void MiscMath::minmax( const std::vector<double> & x , double * mn , double * mx)
{

  const int n = x.size();

  if ( n == 0 ) 
    {
      *mn = *mx = 0;
      return;
    }
  
  *mn = *mx = x[0];
  for (int i=1;i<n;i++)
    {
      if      ( x[i] < *mn ) *mn = x[i];
      else if ( x[i] > *mx ) *mx = x[i];
    }
}

bool MiscMath::flat( const std::vector<double> & x , double EPS )
{
  double mn, mx;
  minmax( x , &mn , &mx );
  return mx - mn <= EPS;
}

double MiscMath::correlation( const std::vector<double> & x , const std::vector<double> & y )
{
  const int n = x.size();
  if ( n != y.size() ) Helper::halt( "internal error: correlation() given unequal lengths" );
  if ( n < 2 ) return 0;

  const double mx = mean( x );
  const double my = mean( y );
  double sxy = 0 , sxx = 0 , syy = 0;
  for (int i=0; i<n; i++)
    {
      sxy += ( x[i] - mx ) * ( y[i] - my );
      sxx += ( x[i] - mx ) * ( x[i] - mx );
      syy += ( y[i] - my ) * ( y[i] - my );
    }
  
  if ( sxx <= 0 || syy <= 0 ) return 0;
  return sxy / sqrt( sxx * syy );
}


//
// angles
//

double MiscMath::rad2deg(double radians) 
{ 
  return radians * (180.0 / M_PI); 
}

double MiscMath::deg2rad(double degrees) 
{ 
  return degrees * (M_PI / 180.0); 
}

double MiscMath::wrap360( double d )
{
  double r = fmod( d , 360.0 );
  if ( r < 0 ) r += 360.0;
  // fmod of e.g. -1e-17 can round to 360
  if ( r >= 360.0 ) r -= 360.0;
  return r;
}

double MiscMath::wrap180( double d )
{
  double r = fmod( d , 180.0 );
  if ( r < 0 ) r += 180.0;
  if ( r >= 180.0 ) r -= 180.0;
  return r;
}

double MiscMath::angle_difference( double a , double b )
{
  double d = wrap360( b - a );
  return d > 180.0 ? d - 360.0 : d;
}


//
// F-distribution
//

double MiscMath::pF(const double F, const int df1, const int df2)
{
  return betai(0.5*df2,0.5*df1,(double)df2/(double)(df2+df1*F));
}

double MiscMath::betai(const double a, const double b, const double x)
{
  double bt;
  
  if (x < 0.0 || x > 1.0) Helper::halt("Internal error: bad x in routine betai");
  if (x == 0.0 || x == 1.0) bt=0.0;
  else
    bt=exp(Statistics::gammln(a+b)-Statistics::gammln(a)-Statistics::gammln(b)+a*log(x)+b*log(1.0-x));
  if (x < (a+1.0)/(a+b+2.0))
    return bt*betacf(a,b,x)/a;
  else
    return 1.0-bt*betacf(b,a,1.0-x)/b;
}

double MiscMath::betacf(const double a, const double b, const double x)
{
  
  const int MAXIT = 100;
  const double EPS = 3e-7;
  const double FPMIN = 1.0e-30;

  int m,m2;
  double aa,c,d,del,h,qab,qam,qap;
  
  qab=a+b;
  qap=a+1.0;
  qam=a-1.0;
  c=1.0;
  d=1.0-qab*x/qap;
  if (fabs(d) < FPMIN) d=FPMIN;
  d=1.0/d;
  h=d;
  for (m=1;m<=MAXIT;m++) {
    m2=2*m;
    aa=m*(b-m)*x/((qam+m2)*(a+m2));
    d=1.0+aa*d;
    if (fabs(d) < FPMIN) d=FPMIN;
    c=1.0+aa/c;
    if (fabs(c) < FPMIN) c=FPMIN;
    d=1.0/d;
    h *= d*c;
    aa = -(a+m)*(qab+m)*x/((a+m2)*(qap+m2));
    d=1.0+aa*d;
    if (fabs(d) < FPMIN) d=FPMIN;
    c=1.0+aa/c;
    if (fabs(c) < FPMIN) c=FPMIN;
    d=1.0/d;
    del=d*c;
    h *= del;
    if (fabs(del-1.0) <= EPS) break;
  }
  if (m > MAXIT) Helper::halt("Internal error in betacf() function (please report)");
  return h;
}

