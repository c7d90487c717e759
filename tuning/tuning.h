
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


#ifndef __OPHYS_TUNING_H__
#define __OPHYS_TUNING_H__

#include <vector>
#include <string>

struct param_t;

//
// Circular tuning curves: a two-lobed von Mises model,
//
//   R(theta) = b + A1.exp(k(cos(theta-mu)-1)) + A2.exp(k(cos(theta-mu-pi)-1))
//
// with A1, A2 >= 0 and a shared concentration k, fitted by
// Levenberg-Marquardt to condition-mean responses
//

struct tuning_param_t {

  tuning_param_t();

  explicit tuning_param_t( const param_t & param );
  
  // LM iterations (per seed)
  int max_iter;

  // relative SSE change for convergence
  double tol;

  // bounds on the concentration
  double kappa_min;
  double kappa_max;

  // fit every cell, not only responsive ones
  bool fit_all;
  
};


struct tuning_t {

  tuning_t();
  
  //
  // metrics
  //
  
  double pref_dir_fit;   // [0,360)
  double pref_ort_fit;   // [0,180)
  double dti_fit;        // [0,1]
  double oti_fit;        // [0,1]
  double fit_bandwidth;  // HWHM (deg), NaN if undefined
  double fit_r;          

  //
  // model parameters (mu in degrees)
  //

  double baseline;
  double amp1;
  double amp2;
  double kappa;
  double mu;

  //
  // diagnostics
  //
  
  int n_angles;
  int dof;
  int iterations;
  double sse;
  bool converged;
  bool low_confidence;
  bool degenerate;
  std::string note;

  // evaluate the fitted curve at an angle (deg)
  double eval( const double theta ) const;
  
};


namespace tuning {

  // n angles k.360/n, in degrees
  std::vector<double> uniform_angles( const int n );

  // returns metrics and diagnostics; if curve is non-null, it receives the
  // fitted curve at 1-degree steps (0..359)
  tuning_t fit_tuning( const std::vector<double> & responses ,
		       const std::vector<double> & angles ,
		       std::vector<double> * curve = NULL ,
		       const tuning_param_t & param = tuning_param_t() );
  
  // the model, at theta (deg), given {b, A1, A2, kappa, mu (rad)}
  double model( const double theta , const double * p );

  // response-weighted circular means (deg): direction in [0,360), orientation in [0,180)
  double vector_average_direction( const std::vector<double> & responses , const std::vector<double> & angles );
  double vector_average_orientation( const std::vector<double> & responses , const std::vector<double> & angles );
  
}

#endif
