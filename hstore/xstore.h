
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


#ifndef __OPHYS_XSTORE_H__
#define __OPHYS_XSTORE_H__

#include <string>

struct cell_extraction_t;

//
// Extraction <-> container mapping, with a fixed field list:
//
//   /                   format, schema_version
//   /fov_metadata       FOV attributes
//   /acquisition        twophotontimes, stimOn, stimID, uniqStims, regOffsets
//   /cells/cell_<i>     per-cell arrays and scalar attributes
//

namespace xstore {

  // written to <filename>.part, then renamed over filename
  void save( const cell_extraction_t & ce , const std::string & filename );

  cell_extraction_t load( const std::string & filename );

  // positional index from a cell group name (cell_<i>), or -1
  int cell_index( const std::string & name );
  
}

#endif
