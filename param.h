
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


#ifndef __OPHYS_PARAM_H__
#define __OPHYS_PARAM_H__

#include <string>
#include <map>
#include <set>
#include <vector>
#include <sstream>

//
// key=value option sets, from the command line or @parameter files
//

struct param_t
{

 public:
  
  void add( const std::string & option , const std::string & value = "" ); 

  int size() const;
  
  // key=value, or a bare key (flag)
  void parse( const std::string & s );
  
  // each token from argv[start] onwards; @file tokens are expanded
  void parse( int argc , char ** argv , int start );

  // whitespace-delimited key=value tokens; blank and # lines skipped
  void include_file( const std::string & f );

  void clear();
  
  bool has(const std::string & s ) const;
  
  bool empty(const std::string & s ) const;
  
  // if ! has(X) return default1
  // else if X given without a value, return default2
  // else return yesno(value(X))
  bool yesno(const std::string & s , const bool default1 = false , const bool default2 = true ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;
  
  std::string requires( const std::string & s , const bool uppercase = false ) const;
  
  int requires_int( const std::string & s ) const;
  
  double requires_dbl( const std::string & s ) const;

  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;

  std::vector<std::string> strvector( const std::string & k , const std::string delim = "," , const bool uppercase = false ) const;
  
  std::vector<double> dblvector( const std::string & k , const std::string delim = "," ) const;

  std::vector<int> intvector( const std::string & k , const std::string delim = "," ) const;

  std::set<std::string> keys() const;

private:

  std::map<std::string,std::string> opt;

};


#endif
