
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


#ifndef __OPHYS_ALIGN_H__
#define __OPHYS_ALIGN_H__

#include <Eigen/Dense>

#include <vector>
#include <map>
#include <string>

#include "defs/defs.h"

struct param_t;

//
// Epoching of a continuous per-cell trace around stimulus onsets
//
// each trial spans frames [ f - pre , f + post ) where f is the onset
// frame; the response of a trial is the mean over post-onset frames
// [ resp_start , resp_stop ), optionally minus the mean of the pre frames
//

struct align_param_t {

  align_param_t();
  
  explicit align_param_t( const param_t & param );
  
  int pre;
  int post;

  int resp_start;
  int resp_stop;
  
  bool subtract_baseline;

  onset_rule_t onset;

  // truncate each condition to the minimum (non-zero) repeat count
  bool truncate;
  
  int samples() const { return pre + post; }

  // halts on an inconsistent window
  void check() const;
  
  std::string describe() const;
  
};


struct align_result_t {

  // per condition (uniqStims order), repeats x samples
  std::vector<Eigen::MatrixXd> cyc;

  // per condition, the response of each kept repeat
  std::vector<std::vector<double> > trial_response;
  
  // condition index -> mean response; absent if no valid repeats
  std::map<int,double> condition_response;

  // per condition, trials excluded for falling outside the trace
  std::vector<int> n_dropped;

  // per condition, repeats removed by truncation
  std::vector<int> n_truncated;

  int total_dropped() const;
  
};


namespace trials {

  // halts, naming the offending field, on malformed acquisition streams
  void check_streams( const std::vector<double> & twophotontimes ,
		      const std::vector<double> & stimOn ,
		      const std::vector<int> & stimID );
  
  // sorted unique condition ids
  std::vector<int> unique_stims( const std::vector<int> & stimID );
  
  // onset frame per stimulus (-1 if the onset lies outside the acquisition)
  std::vector<int> onset_frames( const std::vector<double> & twophotontimes ,
				 const std::vector<double> & stimOn ,
				 const onset_rule_t rule );
  
  align_result_t align( const std::vector<double> & raw ,
			const std::vector<double> & twophotontimes ,
			const std::vector<double> & stimOn ,
			const std::vector<int> & stimID ,
			const std::vector<int> & uniqStims ,
			const align_param_t & param );

  // response of one trial (a row of cyc)
  double trial_response( const Eigen::MatrixXd & cyc , const int r , const align_param_t & param );
  
}

#endif
