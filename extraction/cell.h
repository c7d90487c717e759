
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


#ifndef __OPHYS_CELL_H__
#define __OPHYS_CELL_H__

#include <Eigen/Dense>

#include <vector>
#include <map>

#include "tuning/tuning.h"

// one segmented unit (ROI)

struct cell_t {

  cell_t();

  cell_t( const double x , const double y , const std::vector<double> & raw );
  
  double xPos;
  double yPos;

  // one sample per acquisition frame
  std::vector<double> raw;

  // per condition (uniqStims order): repeats x samples
  std::vector<Eigen::MatrixXd> cyc;

  std::vector<int> uniqStims;
  
  // condition index -> mean response (absent if no valid repeats)
  std::map<int,double> condition_response;

  // per condition, trials dropped at alignment
  std::vector<int> n_dropped;

  bool ROI_responsiveness;
  double responsive_p;
  
  // condition id of the blank, or globals::no_blank
  int blank_id;

  // optional tuning fit
  bool has_tuning;
  tuning_t tuning;
  std::vector<double> tuning_curve;

  // trial structure set?
  bool aligned() const { return cyc.size() != 0; }
  
  int n_conditions() const { return uniqStims.size(); }

  // samples per trial (0 if not aligned)
  int n_samples() const;
  
  int n_repeats( const int c ) const { return cyc[c].rows(); }

  bool has_blank() const;

  // responses and angles for the non-blank conditions with valid repeats;
  // returns the number of non-blank conditions
  int tuning_input( std::vector<double> * responses , std::vector<double> * angles ) const;
  
};

#endif
