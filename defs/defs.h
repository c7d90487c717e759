
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


#ifndef __OPHYS_DEFS_H__
#define __OPHYS_DEFS_H__

#include <map>
#include <set>
#include <string>
#include <vector>
#include <stdint.h>

struct param_t;

// onset-to-frame rule for trial alignment
enum onset_rule_t
  {
    ONSET_FIRST_FRAME = 0 ,  // first frame at or after the onset
    ONSET_NEAREST_FRAME      // frame closest in time to the onset
  };

// scalar attribute types in the extraction container
enum attr_type_t
  {
    ATTR_TEXT = 0 ,
    ATTR_REAL ,
    ATTR_INT ,
    ATTR_BOOL
  };

// array element types in the extraction container
enum array_type_t
  {
    ARRAY_F64 = 0 ,
    ARRAY_I64
  };


struct globals
{
  
  static std::string version;
  static std::string date;

  // return code
  static int retcode;

  // container identity
  static std::string store_format;
  static int store_schema_version;

  // suffix for in-progress container writes
  static std::string partial_suffix;

  // condition id used when no blank is designated
  static int no_blank;
  
  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // no console output
  static bool silent;

  // if LOG verbose?
  static bool verbose;

  // library (non-CLI) mode
  static bool api_mode;

  // generic global parameters
  static param_t param;

  static bool bail_on_fail;

  // global functions: primary initiation of all globals
  void init_defs();
  
  // modes
  void api();
  
  static std::string attr_type_name( const attr_type_t );

  static bool attr_type( const std::string & , attr_type_t * );

  static std::string array_type_name( const array_type_t );

  static bool array_type( const std::string & , array_type_t * );
  
};

#endif
