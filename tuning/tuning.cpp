
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


#include "tuning/tuning.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "param.h"

#include <Eigen/Dense>

#include <cmath>
#include <limits>

// number of model parameters: b, A1, A2, kappa, mu
static const int NP = 5;

// grid resolution (deg) for the bandwidth search
static const double BW_STEP = 0.1;

tuning_param_t::tuning_param_t()
{
  max_iter = 200;
  tol = 1e-10;
  kappa_min = 0.05;
  kappa_max = 60;
  fit_all = false;
}

tuning_param_t::tuning_param_t( const param_t & param )
{
  *this = tuning_param_t();
  if ( param.has( "max-iter" ) ) max_iter = param.requires_int( "max-iter" );
  if ( param.has( "tol" ) ) tol = param.requires_dbl( "tol" );
  fit_all = param.yesno( "fit-all" );
  if ( max_iter < 1 ) Helper::halt( "max-iter must be positive" );
  if ( tol <= 0 ) Helper::halt( "tol must be positive" );
}

tuning_t::tuning_t()
{
  pref_dir_fit = pref_ort_fit = 0;
  dti_fit = oti_fit = 0;
  fit_bandwidth = std::numeric_limits<double>::quiet_NaN();
  fit_r = 0;
  baseline = amp1 = amp2 = mu = 0;
  kappa = 0;
  n_angles = dof = iterations = 0;
  sse = 0;
  converged = false;
  low_confidence = false;
  degenerate = false;
}

double tuning_t::eval( const double theta ) const
{
  const double p[ NP ] = { baseline , amp1 , amp2 , kappa , MiscMath::deg2rad( mu ) };
  return tuning::model( theta , p );
}

std::vector<double> tuning::uniform_angles( const int n )
{
  std::vector<double> a( n < 0 ? 0 : n );
  for (int i=0; i<a.size(); i++)
    a[i] = i * 360.0 / (double)n;
  return a;
}

double tuning::model( const double theta , const double * p )
{
  const double c = cos( MiscMath::deg2rad( theta ) - p[4] );
  return p[0] + p[1] * exp( p[3] * ( c - 1 ) ) + p[2] * exp( p[3] * ( -c - 1 ) );
}

// weights are responses above the minimum, so that negative (dF/F)
// responses do not flip the mean vector

static void weighted_sums( const std::vector<double> & y , const std::vector<double> & angles ,
			   const double harmonic , double * s , double * c )
{
  const double mn = MiscMath::min( y );
  *s = *c = 0;
  for (int i=0; i<y.size(); i++)
    {
      const double w = y[i] - mn;
      const double a = harmonic * MiscMath::deg2rad( angles[i] );
      *s += w * sin( a );
      *c += w * cos( a );
    }
}

double tuning::vector_average_direction( const std::vector<double> & y , const std::vector<double> & angles )
{
  if ( y.size() == 0 ) return 0;
  double s , c;
  weighted_sums( y , angles , 1.0 , &s , &c );
  if ( fabs( s ) < 1e-15 && fabs( c ) < 1e-15 ) return 0;
  return MiscMath::wrap360( MiscMath::rad2deg( atan2( s , c ) ) );
}

double tuning::vector_average_orientation( const std::vector<double> & y , const std::vector<double> & angles )
{
  if ( y.size() == 0 ) return 0;
  double s , c;
  weighted_sums( y , angles , 2.0 , &s , &c );
  if ( fabs( s ) < 1e-15 && fabs( c ) < 1e-15 ) return 0;
  return MiscMath::wrap180( 0.5 * MiscMath::rad2deg( atan2( s , c ) ) );
}


//
// Levenberg-Marquardt on the two-lobed model
//

static void project( double * p , const tuning_param_t & param )
{
  if ( p[1] < 0 ) p[1] = 0;
  if ( p[2] < 0 ) p[2] = 0;
  if ( p[3] < param.kappa_min ) p[3] = param.kappa_min;
  if ( p[3] > param.kappa_max ) p[3] = param.kappa_max;
  p[4] = MiscMath::deg2rad( MiscMath::wrap360( MiscMath::rad2deg( p[4] ) ) );
}

static double model_sse( const std::vector<double> & y , const std::vector<double> & angles , const double * p )
{
  double s = 0;
  for (int i=0; i<y.size(); i++)
    {
      const double r = y[i] - tuning::model( angles[i] , p );
      s += r * r;
    }
  return s;
}

// fits p in place; returns SSE
static double levenberg_marquardt( const std::vector<double> & y ,
				   const std::vector<double> & angles ,
				   double * p ,
				   const tuning_param_t & param ,
				   int * iterations ,
				   bool * converged )
{
  
  const int n = y.size();

  project( p , param );
  
  double sse = model_sse( y , angles , p );

  double lambda = 1e-3;

  *iterations = 0;
  *converged = false;
  
  Eigen::MatrixXd J( n , NP );
  Eigen::VectorXd r( n );
  
  while ( *iterations < param.max_iter )
    {
      
      ++(*iterations);

      if ( sse == 0 ) { *converged = true; break; }

      // Jacobian of the model, residuals
      for (int i=0; i<n; i++)
	{
	  const double d = MiscMath::deg2rad( angles[i] ) - p[4];
	  const double c = cos( d );
	  const double s = sin( d );
	  const double e1 = exp( p[3] * (  c - 1 ) );
	  const double e2 = exp( p[3] * ( -c - 1 ) );
	  J(i,0) = 1;
	  J(i,1) = e1;
	  J(i,2) = e2;
	  J(i,3) = p[1] * e1 * ( c - 1 ) + p[2] * e2 * ( -c - 1 );
	  J(i,4) = p[3] * s * ( p[1] * e1 - p[2] * e2 );
	  r[i] = y[i] - ( p[0] + p[1] * e1 + p[2] * e2 );
	}

      const Eigen::MatrixXd JtJ = J.transpose() * J;
      const Eigen::VectorXd g = J.transpose() * r;

      bool accepted = false;
      
      while ( ! accepted )
	{
	  Eigen::MatrixXd A = JtJ;
	  for (int j=0; j<NP; j++)
	    A(j,j) += lambda * ( JtJ(j,j) + 1e-9 );
	  
	  const Eigen::VectorXd delta = A.ldlt().solve( g );
	  
	  double pn[ NP ];
	  for (int j=0; j<NP; j++) pn[j] = p[j] + delta[j];
	  project( pn , param );
	  
	  const double sse_new = model_sse( y , angles , pn );
	  
	  if ( Helper::realnum( sse_new ) && sse_new < sse )
	    {
	      const double rel = ( sse - sse_new ) / sse;
	      for (int j=0; j<NP; j++) p[j] = pn[j];
	      sse = sse_new;
	      lambda = lambda / 10.0 < 1e-12 ? 1e-12 : lambda / 10.0;
	      accepted = true;
	      if ( rel < param.tol ) *converged = true;
	    }
	  else
	    {
	      lambda *= 10.0;
	      // no descent direction left: at a (local) minimum
	      if ( lambda > 1e12 ) { *converged = true; break; }
	    }
	}

      if ( *converged ) break;
    }
  
  return sse;
}

// response at the input angle closest (circularly) to a
static double nearest_response( const std::vector<double> & y , const std::vector<double> & angles , const double a )
{
  int best = 0;
  double bd = 999;
  for (int i=0; i<angles.size(); i++)
    {
      const double d = fabs( MiscMath::angle_difference( a , angles[i] ) );
      if ( d < bd ) { bd = d; best = i; }
    }
  return y[ best ];
}

// selectivity index, clipped to [0,1]
static double selectivity( const double a , const double b )
{
  const double den = a + b;
  if ( ! ( den > 0 ) || ! Helper::realnum( den ) ) return 0;
  const double v = ( a - b ) / den;
  if ( v < 0 ) return 0;
  if ( v > 1 ) return 1;
  return v;
}

// half-width (deg) from pref to where the curve first falls to 'level', or NaN
static double half_width( const tuning_t & t , const double pref , const double level , const double sign )
{
  double prev = t.eval( pref );
  const int steps = 180.0 / BW_STEP;
  for (int s = 1 ; s <= steps ; s++ )
    {
      const double v = t.eval( pref + sign * s * BW_STEP );
      if ( v <= level )
	{
	  const double frac = prev - v > 0 ? ( prev - level ) / ( prev - v ) : 0 ;
	  return ( s - 1 + frac ) * BW_STEP;
	}
      prev = v;
    }
  return std::numeric_limits<double>::quiet_NaN();
}


// number of circularly distinct angles (0 and 360 are the same)
static int distinct_angles( const std::vector<double> & angles )
{
  int k = 0;
  for (int i=0; i<angles.size(); i++)
    {
      bool seen = false;
      for (int j=0; j<i; j++)
	if ( fabs( MiscMath::angle_difference( angles[i] , angles[j] ) ) < 1e-6 )
	  { seen = true; break; }
      if ( ! seen ) ++k;
    }
  return k;
}


tuning_t tuning::fit_tuning( const std::vector<double> & y ,
			     const std::vector<double> & angles ,
			     std::vector<double> * curve ,
			     const tuning_param_t & param )
{

  tuning_t t;

  const int n = y.size();

  if ( angles.size() != n )
    Helper::halt( "fit_tuning(): " + Helper::int2str( n ) + " responses but "
		  + Helper::int2str( (int)angles.size() ) + " stimulus angles" );

  for (int i=0; i<n; i++)
    {
      if ( ! Helper::realnum( y[i] ) )
	Helper::halt( "fit_tuning(): non-finite response at angle " + Helper::dbl2str( angles[i] ) );
      if ( ! Helper::realnum( angles[i] ) )
	Helper::halt( "fit_tuning(): non-finite stimulus angle" );
    }
  
  t.n_angles = n;
  t.dof = n - NP;
  t.kappa = param.kappa_min;
  
  if ( curve ) curve->clear();
  
  //
  // degenerate inputs: no fit
  //
  
  if ( n == 0 )
    {
      t.degenerate = t.low_confidence = true;
      t.note = "no responses";
      Helper::warn( "fit_tuning(): no responses to fit" );
      return t;
    }

  if ( MiscMath::flat( y ) )
    {
      t.degenerate = true;
      t.low_confidence = n < 4;
      t.baseline = MiscMath::mean( y );
      t.sse = 0;
      t.converged = true;
      t.note = "flat responses";
      if ( curve ) curve->assign( 360 , t.baseline );
      Helper::warn( "fit_tuning(): flat responses, tuning indices set to 0" );
      return t;
    }

  //
  // seeds
  //

  const double b0 = MiscMath::min( y );
  
  std::vector<double> seeds;
  const double vad = vector_average_direction( y , angles );
  const double vao = vector_average_orientation( y , angles );
  seeds.push_back( vad );
  seeds.push_back( vad + 180 );
  seeds.push_back( vao );
  seeds.push_back( vao + 180 );
  int imax = 0;
  for (int i=1; i<n; i++) if ( y[i] > y[imax] ) imax = i;
  seeds.push_back( angles[ imax ] );
  
  double best[ NP ];
  double best_sse = std::numeric_limits<double>::infinity();
  
  for (int s=0; s<seeds.size(); s++)
    {
      double p[ NP ];
      p[0] = b0;
      p[1] = nearest_response( y , angles , seeds[s] ) - b0;
      p[2] = nearest_response( y , angles , seeds[s] + 180 ) - b0;
      p[3] = 2.0;
      p[4] = MiscMath::deg2rad( seeds[s] );

      int iter = 0;
      bool conv = false;
      const double e = levenberg_marquardt( y , angles , p , param , &iter , &conv );

      t.iterations += iter;
      
      if ( e < best_sse )
	{
	  best_sse = e;
	  for (int j=0; j<NP; j++) best[j] = p[j];
	  t.converged = conv;
	}
    }
  
  t.baseline = best[0];
  t.amp1 = best[1];
  t.amp2 = best[2];
  t.kappa = best[3];
  t.mu = MiscMath::wrap360( MiscMath::rad2deg( best[4] ) );
  t.sse = best_sse;
  
  //
  // metrics: the curve is symmetric about mu and, as a convex function of
  // cos(theta-mu), peaks at mu or at mu+180
  //

  t.pref_dir_fit = MiscMath::wrap360( t.amp1 >= t.amp2 ? t.mu : t.mu + 180 );
  t.pref_ort_fit = MiscMath::wrap180( t.pref_dir_fit );
  
  const double r_pref = t.eval( t.pref_dir_fit );
  const double r_opp  = t.eval( t.pref_dir_fit + 180 );
  t.dti_fit = selectivity( r_pref , r_opp );

  const double o_pref = 0.5 * ( t.eval( t.pref_ort_fit ) + t.eval( t.pref_ort_fit + 180 ) );
  const double o_orth = 0.5 * ( t.eval( t.pref_ort_fit + 90 ) + t.eval( t.pref_ort_fit + 270 ) );
  t.oti_fit = selectivity( o_pref , o_orth );
  
  std::vector<double> fitted( n );
  for (int i=0; i<n; i++) fitted[i] = t.eval( angles[i] );
  t.fit_r = MiscMath::correlation( fitted , y );
  
  //
  // bandwidth: half-width at the level halfway between peak and trough
  //
  
  if ( distinct_angles( angles ) < 4 )
    {
      t.low_confidence = true;
      t.note = "fewer than 4 distinct stimulus angles";
    }
  else
    {
      double r_min = r_pref;
      const int steps = 360.0 / BW_STEP;
      for (int s=0; s<steps; s++)
	{
	  const double v = t.eval( s * BW_STEP );
	  if ( v < r_min ) r_min = v;
	}

      if ( r_pref - r_min > 1e-12 * ( fabs( r_pref ) + 1 ) )
	{
	  const double level = 0.5 * ( r_pref + r_min );
	  const double hw1 = half_width( t , t.pref_dir_fit , level , +1 );
	  const double hw2 = half_width( t , t.pref_dir_fit , level , -1 );
	  if ( Helper::realnum( hw1 ) && Helper::realnum( hw2 ) )
	    t.fit_bandwidth = 0.5 * ( hw1 + hw2 );
	}

      if ( ! Helper::realnum( t.fit_bandwidth ) )
	t.note = "bandwidth undefined";
      else if ( t.dof < 1 )
	t.note = "no residual degrees of freedom";

      if ( t.dof < 1 ) t.low_confidence = true;
    }

  if ( ! t.converged )
    {
      t.low_confidence = true;
      t.note = t.note == "" ? "fit did not converge" : t.note + "; fit did not converge";
    }
  
  if ( curve )
    {
      curve->resize( 360 );
      for (int a=0; a<360; a++) (*curve)[a] = t.eval( a );
    }
  
  return t;
}
