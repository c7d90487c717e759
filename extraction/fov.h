
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


#ifndef __OPHYS_FOV_H__
#define __OPHYS_FOV_H__

#include <string>
#include <vector>
#include <map>
#include <utility>

#include "hstore/hstore.h"

// recording configuration of one imaging session (field of view)

struct fov_t {

  fov_t() : factor(1) { } 
  
  std::string animal_name;
  std::string recording_date;
  std::string stim_type;
  std::string brain_region;
  std::string layer;

  // temporal downsampling factor
  int factor;

  std::vector<int> imaging_files;
  std::vector<int> spk2_files;

  // nothing beyond defaults set?
  bool empty() const;
  
  // flat, ordered scalar attributes; lists are comma-delimited text,
  // unset text fields are omitted
  std::vector<std::pair<std::string,hstore_attr_t> > export_attributes() const;

  // inverse of the above; unknown keys are ignored
  void import_attributes( const std::map<std::string,hstore_attr_t> & attr );

  std::string label() const;
  
};

#endif
