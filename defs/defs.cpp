
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


#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include <iostream>
#include <stdexcept>

extern logger_t logger;

std::string globals::version;
std::string globals::date;

int globals::retcode;

std::string globals::store_format;
int globals::store_schema_version;
std::string globals::partial_suffix;
int globals::no_blank;

bool globals::bail_on_fail;

param_t globals::param;

void (*globals::bail_function) ( const std::string & );

bool globals::silent;
bool globals::verbose; 
bool globals::api_mode;



// in API mode, halt() throws rather than exits

static void api_bail_function( const std::string & msg )
{
  throw( std::runtime_error( msg ) );
}


void globals::api()
{
  silent = true;
  api_mode = true;
  bail_function = &api_bail_function;
  bail_on_fail = false;
}


void globals::init_defs()
{
  
  //
  // Version
  //
  
  version = "v0.4.1";
  
  date    = "19-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Container identity; bump the schema version whenever the
  // fixed field lists in hstore/xstore.cpp change
  //

  store_format = "ophys-extraction";

  store_schema_version = 1;

  partial_suffix = ".part";

  no_blank = -2147483647;
  
  //
  // Optional bail function after halt() is called
  //
  
  bail_function = NULL;

  //
  // Output
  //

  silent = false;

  verbose = false; 

  api_mode = false;
  
  bail_on_fail = true;

}


std::string globals::attr_type_name( const attr_type_t t )
{
  if ( t == ATTR_TEXT ) return "text";
  if ( t == ATTR_REAL ) return "real";
  if ( t == ATTR_INT )  return "int";
  return "bool";
}

bool globals::attr_type( const std::string & s , attr_type_t * t )
{
  if ( s == "text" ) { *t = ATTR_TEXT; return true; }
  if ( s == "real" ) { *t = ATTR_REAL; return true; }
  if ( s == "int" )  { *t = ATTR_INT;  return true; }
  if ( s == "bool" ) { *t = ATTR_BOOL; return true; }
  return false;
}

std::string globals::array_type_name( const array_type_t t )
{
  return t == ARRAY_F64 ? "f64" : "i64";
}

bool globals::array_type( const std::string & s , array_type_t * t )
{
  if ( s == "f64" ) { *t = ARRAY_F64; return true; }
  if ( s == "i64" ) { *t = ARRAY_I64; return true; }
  return false;
}
