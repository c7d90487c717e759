
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


#include "stats/eigen_ops.h"
#include "helper/helper.h"

#include <cmath>
#include <limits>

std::vector<double> eigen_ops::flatten( const Eigen::MatrixXd & m )
{
  const int rows = m.rows();
  const int cols = m.cols();
  std::vector<double> x( rows * cols );
  int k = 0;
  for (int r = 0 ; r < rows ; r++ )
    for (int c = 0 ; c < cols ; c++)
      x[k++] = m(r,c);
  return x;
}

Eigen::MatrixXd eigen_ops::unflatten( const std::vector<double> & x , const int rows , const int cols )
{
  if ( rows < 0 || cols < 0 || rows * cols != x.size() )
    Helper::halt( "eigen_ops::unflatten(): " + Helper::int2str( (int)x.size() )
		  + " values do not fit " + Helper::int2str( rows ) + " x " + Helper::int2str( cols ) );
  Eigen::MatrixXd m( rows , cols );
  int k = 0;
  for (int r = 0 ; r < rows ; r++ )
    for (int c = 0 ; c < cols ; c++)
      m(r,c) = x[k++];
  return m;
}

Eigen::MatrixXd eigen_ops::stack_rows( const std::vector<Eigen::MatrixXd> & blocks , const int cols , std::vector<int> * rows )
{
  int total = 0;
  for (int i=0; i<blocks.size(); i++)
    {
      if ( blocks[i].rows() != 0 && blocks[i].cols() != cols )
	Helper::halt( "eigen_ops::stack_rows(): block " + Helper::int2str(i) + " has "
		      + Helper::int2str( (int)blocks[i].cols() ) + " columns, expecting " + Helper::int2str( cols ) );
      total += blocks[i].rows();
    }
  
  if ( rows ) rows->resize( blocks.size() );
  
  Eigen::MatrixXd m( total , cols );
  int r = 0;
  for (int i=0; i<blocks.size(); i++)
    {
      const int n = blocks[i].rows();
      if ( n ) m.block( r , 0 , n , cols ) = blocks[i];
      if ( rows ) (*rows)[i] = n;
      r += n;
    }
  return m;
}

std::vector<Eigen::MatrixXd> eigen_ops::split_rows( const Eigen::MatrixXd & m , const std::vector<int> & rows )
{
  int total = 0;
  for (int i=0; i<rows.size(); i++)
    {
      if ( rows[i] < 0 ) Helper::halt( "eigen_ops::split_rows(): negative row count" );
      total += rows[i];
    }
  
  if ( total != m.rows() )
    Helper::halt( "eigen_ops::split_rows(): row counts sum to " + Helper::int2str( total )
		  + ", matrix has " + Helper::int2str( (int)m.rows() ) );
  
  std::vector<Eigen::MatrixXd> blocks( rows.size() );
  int r = 0;
  for (int i=0; i<rows.size(); i++)
    {
      blocks[i] = m.block( r , 0 , rows[i] , m.cols() );
      r += rows[i];
    }
  return blocks;
}

bool eigen_ops::equal( const Eigen::MatrixXd & a , const Eigen::MatrixXd & b )
{
  if ( a.rows() != b.rows() || a.cols() != b.cols() ) return false;
  for (int r = 0 ; r < a.rows() ; r++ )
    for (int c = 0 ; c < a.cols() ; c++)
      {
	if ( std::isnan( a(r,c) ) && std::isnan( b(r,c) ) ) continue;
	if ( a(r,c) != b(r,c) ) return false;
      }
  return true;
}
