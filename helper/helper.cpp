
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


#include "helper/helper.h"
#include "helper/logger.h"

#include "defs/defs.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

#include <iostream>
#include <iomanip>
#include <fstream>
#include <streambuf>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::remove_all_quotes(const std::string &s , const char q2 )
{
  std::string r;
  r.reserve( s.size() );
  for (int i=0; i<s.size(); i++)
    if ( ! ( s[i] == '"' || s[i] == q2 ) ) r += s[i];
  return r;
}

std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv("HOME");
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}

void Helper::halt( const std::string & msg )
{
  
  // some other code handles the exit, e.g. in library mode
  if ( globals::bail_function != NULL ) 
    globals::bail_function( msg );

  // do not kill the process?
  if ( ! globals::bail_on_fail ) return;
  
  // switch logger off , i.e. as we don't want close-out msg
  logger.off();
  
  // generic bail function (not using logger)
  std::cerr << "error : " << msg << "\n";   

  std::exit(1);
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

bool Helper::realnum(double d)
{
  return std::isfinite( d );
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  if ( s == "nan" || s == "NaN" || s == "NA" )
    {
      *d = std::numeric_limits<double>::quiet_NaN();
      return true;
    }
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE 
  // versus all else  (including empty, i.e. 'var'  --> 'var=T' 
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if (tolower(a[i]) != tolower(b[i]))
      return false;
  return true;
}

bool Helper::fileExists( const std::string & f )
{
  FILE *file;
  if ( ( file = fopen( f.c_str() , "r" ) ) ) 
    {
      fclose(file);
      return true;
    } 
  return false;
}

bool Helper::deleteFile( const std::string & f )
{
  if ( ! fileExists( f ) ) return false; 
  if ( remove( f.c_str() )  != 0 ) Helper::halt( "problem removing file " + f );
  return true;
}


// https://stackoverflow.com/questions/6089231/getting-std-ifstream-to-handle-lf-cr-and-crlf

std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();
  
  for ( ; ; ) 
    {
      
      int c = sb->sbumpc();
      
      switch (c) 
	{
	case '\n':
	  return is;
	  
	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

 	case EOF :
 	  // Also handle the case when the last line has no line ending
 	  if(t.empty())
 	    is.setstate(std::ios::eofbit);
 	  return is;
	  
	default:
	  t += (char)c;
	}
    }
}


std::vector<std::string> Helper::file2lines( const std::string & f )
{
  const std::string filename = Helper::expand( f );
  if ( ! Helper::fileExists( filename ) ) Helper::halt( "could not find " + filename );
  std::ifstream IN1( filename.c_str() , std::ios::in );
  std::vector<std::string> d;
  std::string line;
  while ( Helper::safe_getline( IN1 , line ) )
    {
      if ( IN1.eof() && line == "" ) break;
      line = Helper::lrtrim( line );
      if ( line == "" || line[0] == '#' ) continue;
      d.push_back( line );
    }
  IN1.close();
  return d;
}


std::vector<std::string> Helper::parse(const std::string & item, const char s , bool empty )
{
  return Helper::parse( item , std::string( 1 , s ) , empty ); 
}

std::vector<std::string> Helper::parse(const std::string & s , const std::string & delims , bool empty )
{  
  return Helper::quoted_parse( s , delims , '\0' , '\0' , empty );
}  


std::vector<std::string> Helper::quoted_parse( const std::string & s , const std::string & delims , const char q , const char q2, bool empty )
{

  // q == '\0' means quotes are not special (plain parse)
  
  std::vector<std::string> strs;  
  if ( s.size() == 0 ) return strs;
  int p=0;
  
  bool in_quote = false;
  
  for (int j=0; j<s.size(); j++)
    {	        

      if ( q != '\0' && ( s[j] == '"' || s[j] == q || s[j] == q2 ) ) in_quote = ! in_quote;
      
      if ( (!in_quote) && delims.find( s[j] ) != std::string::npos ) 
	{ 	      
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p)); 
	      p=j+1; 
	    }
	}	  
    }
  
  if ( empty && p == s.size() ) 
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );
  
  return strs;
}


std::vector<double> Helper::dbl_tokens( const std::vector<std::string> & tok , const int start , const std::string & what )
{
  std::vector<double> r;
  r.reserve( tok.size() > start ? tok.size() - start : 0 );
  for (int i=start; i<tok.size(); i++)
    {
      double d = 0;
      if ( ! Helper::str2dbl( tok[i] , &d ) )
	Helper::halt( "bad numeric value [" + tok[i] + "] in " + what );
      r.push_back( d );
    }
  return r;
}

std::vector<int> Helper::int_tokens( const std::vector<std::string> & tok , const int start , const std::string & what )
{
  std::vector<int> r;
  r.reserve( tok.size() > start ? tok.size() - start : 0 );
  for (int i=start; i<tok.size(); i++)
    {
      int d = 0;
      if ( ! Helper::str2int( tok[i] , &d ) )
	Helper::halt( "bad integer value [" + tok[i] + "] in " + what );
      r.push_back( d );
    }
  return r;
}
