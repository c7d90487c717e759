
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


#ifndef __OPHYS_EIGEN_OPS_H__
#define __OPHYS_EIGEN_OPS_H__

#include <Eigen/Dense>
#include <vector>
#include <map>

namespace eigen_ops { 

  // row-major flattening (the on-disk order of all 2-D arrays)
  std::vector<double> flatten( const Eigen::MatrixXd & m );

  Eigen::MatrixXd unflatten( const std::vector<double> & x , const int rows , const int cols );

  // vertically stack blocks with a common column count; *rows gets each block's row count
  Eigen::MatrixXd stack_rows( const std::vector<Eigen::MatrixXd> & blocks , const int cols , std::vector<int> * rows = NULL );

  // inverse of the above
  std::vector<Eigen::MatrixXd> split_rows( const Eigen::MatrixXd & m , const std::vector<int> & rows );
  
  bool equal( const Eigen::MatrixXd & a , const Eigen::MatrixXd & b );
  
}

#endif 
