
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


#ifndef __OPHYS_EXTRACTION_H__
#define __OPHYS_EXTRACTION_H__

#include <Eigen/Dense>

#include <vector>
#include <string>

#include "extraction/fov.h"
#include "extraction/cell.h"

struct param_t;
struct align_param_t;
struct responsive_param_t;
struct tuning_param_t;

//
// One imaging session: acquisition timing and stimulus streams plus
// the segmented cells, in segmentation order
//

struct cell_extraction_t {

  fov_t fov;

  // frame timestamps (s)
  std::vector<double> twophotontimes;

  // stimulus onsets (s) and condition ids
  std::vector<double> stimOn;
  std::vector<int> stimID;

  // sorted unique stimID
  std::vector<int> uniqStims;

  // frames x 2 (dx,dy); 0 x 0 if absent
  Eigen::MatrixXd regOffsets;

  std::vector<cell_t> cells;


  //
  // construction from segmentation + timing
  //
  
  void add_cell( const double x , const double y , const std::vector<double> & raw );

  // text inputs (see loader.cpp)
  void read_traces( const std::string & filename );
  void read_timing( const std::string & filename );

  // halts on malformed acquisition streams or cell traces
  void validate() const;

  // one-time: align every cell, test responsiveness and (optionally) fit tuning
  void populate( const param_t & param );

  void populate( const align_param_t & aparam ,
		 const responsive_param_t & rparam ,
		 const std::string & blank ,
		 const tuning_param_t * tparam );
  
  // fit (or re-fit) tuning; returns the number of fitted cells
  int fit_tuning( const tuning_param_t & param );
  

  //
  // queries
  //

  int n_frames() const { return twophotontimes.size(); }

  // seconds, first to last frame
  double duration() const;

  bool has_registration() const { return regOffsets.rows() != 0; }
  
  std::vector<int> responsive_cells() const;

  // one value per cell, for a scalar cell field (xPos, yPos, responsive_p,
  // or a tuning metric such as pref_dir_fit); NaN where a cell has no tuning
  std::vector<double> to_array( const std::string & field ) const;

  std::string summary() const;
  
};

#endif
