
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


#include "extraction/cell.h"
#include "tuning/tuning.h"
#include "defs/defs.h"

cell_t::cell_t()
{
  xPos = yPos = 0;
  ROI_responsiveness = false;
  responsive_p = 1;
  blank_id = globals::no_blank;
  has_tuning = false;
}

cell_t::cell_t( const double x , const double y , const std::vector<double> & r )
{
  *this = cell_t();
  xPos = x;
  yPos = y;
  raw = r;
}

int cell_t::n_samples() const
{
  for (int c=0; c<cyc.size(); c++)
    if ( cyc[c].cols() ) return cyc[c].cols();
  return 0;
}

bool cell_t::has_blank() const
{
  for (int c=0; c<uniqStims.size(); c++)
    if ( uniqStims[c] == blank_id ) return true;
  return false;
}

int cell_t::tuning_input( std::vector<double> * responses , std::vector<double> * angles ) const
{
  responses->clear();
  angles->clear();

  // angle grid spans the non-blank conditions, in uniqStims order
  std::vector<int> idx;
  for (int c=0; c<uniqStims.size(); c++)
    if ( uniqStims[c] != blank_id ) idx.push_back( c );
  
  const std::vector<double> grid = tuning::uniform_angles( idx.size() );

  for (int i=0; i<idx.size(); i++)
    {
      std::map<int,double>::const_iterator rr = condition_response.find( idx[i] );
      if ( rr == condition_response.end() ) continue;
      responses->push_back( rr->second );
      angles->push_back( grid[i] );
    }
  
  return idx.size();
}
