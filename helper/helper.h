
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


#ifndef __OPHYS_HELPER_H__
#define __OPHYS_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm> 
#include <functional> 
#include <cctype>
#include <stdint.h>
#include <map>
#include <cmath>

namespace Helper 
{

  std::string toupper( const std::string & );  
  
  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](int c) {return !std::isspace(c);} ));
    return s;
  }
 
  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](int c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }
  
  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    return s.substr(a,s.size()-a-b);
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );
  
  bool yesno( const std::string & );

  // case insenstive string comparison
  bool iequals(const std::string& a, const std::string& b);
  
  bool fileExists(const std::string &);
  std::string expand( const std::string & f );
  bool deleteFile( const std::string & );
  
  // non-empty, non-comment (#) lines of a text file
  std::vector<std::string> file2lines( const std::string & filename );

  std::istream& safe_getline(std::istream& is, std::string& t);

  void halt( const std::string & msg );
  void warn( const std::string & msg );
  bool realnum(double d);
  
  std::string int2str(int n);  
  std::string int2str(long n);
  std::string dbl2str(double n);  
  std::string dbl2str(double n, int dp);  

  template<typename T> 
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;
      
      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }
  
  bool str2dbl(const std::string & , double * ); 
  bool str2int(const std::string & , int * ); 

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      return !(iss >> f >> t).fail() && ( iss >> std::ws ).eof();
    }

  // split on any of the characters in 'delims'
  std::vector<std::string> parse(const std::string & item, const std::string & delims = " \t\n" , bool empty = false );
  std::vector<std::string> parse(const std::string & item, const char s , bool empty = false );

  // as above, but delimiters within quotes are ignored
  std::vector<std::string> quoted_parse(const std::string & item , const std::string & delims , const char q = '"' , const char q2 = '\'' , bool empty = false );
  
  // parse a numeric row, halting with 'what' named on a bad token
  std::vector<double> dbl_tokens( const std::vector<std::string> & tok , const int start , const std::string & what );
  std::vector<int> int_tokens( const std::vector<std::string> & tok , const int start , const std::string & what );
  
}

#endif
