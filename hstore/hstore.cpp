
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


#include "hstore/hstore.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cstring>
#include <cmath>
#include <limits>

extern logger_t logger;

hstore_t::hstore_t( const std::string & f1 , const bool ro )
{
  
  filename = Helper::expand( f1 );

  readonly = ro;

  if ( readonly && ! Helper::fileExists( filename ) )
    Helper::halt( "could not find container " + filename );
  
  sql.open( filename , readonly );

  if ( readonly )
    {
      if ( ! ( sql.table_exists( "nodes" ) && sql.table_exists( "attrs" ) && sql.table_exists( "arrays" ) ) )
	Helper::halt( filename + " is not an ophys container" );
    }
  else
    {
      sql.synchronous( false );
      
      sql.query( " CREATE TABLE IF NOT EXISTS nodes ("
		 "   id     INTEGER PRIMARY KEY , "
		 "   path   TEXT NOT NULL UNIQUE , "
		 "   parent INTEGER , "
		 "   pos    INTEGER NOT NULL );" );
      
      sql.query( " CREATE TABLE IF NOT EXISTS attrs ("
		 "   node   INTEGER NOT NULL , "
		 "   key    TEXT NOT NULL , "
		 "   type   VARCHAR(4) NOT NULL , "
		 "   val    , "
		 "   PRIMARY KEY ( node , key ) );" );
      
      sql.query( " CREATE TABLE IF NOT EXISTS arrays ("
		 "   node   INTEGER NOT NULL , "
		 "   key    TEXT NOT NULL , "
		 "   dtype  VARCHAR(3) NOT NULL , "
		 "   shape  TEXT NOT NULL , "
		 "   val    BLOB , "
		 "   PRIMARY KEY ( node , key ) );" );
    }
  
  init();

  if ( ! readonly )
    create_group( "/" );
  
}

hstore_t::~hstore_t()
{
  close();
}

void hstore_t::close()
{
  if ( ! attached() ) return;
  release();
  sql.close();
}

bool hstore_t::init()
{

  // nodes
  stmt_insert_node    = sql.prepare( " INSERT INTO nodes ( path , parent , pos ) values( :path , :parent , :pos ); " );
  stmt_fetch_node     = sql.prepare( " SELECT id FROM nodes WHERE path == :path ; " );
  stmt_fetch_children = sql.prepare( " SELECT path FROM nodes WHERE parent == :parent ORDER BY pos , id ; " );
  stmt_count_children = sql.prepare( " SELECT COUNT(1) FROM nodes WHERE parent == :parent ; " );
  
  // attributes
  stmt_insert_attr = sql.prepare( " INSERT OR REPLACE INTO attrs ( node , key , type , val ) values( :node , :key , :type , :val ); " );
  stmt_fetch_attr  = sql.prepare( " SELECT type , val FROM attrs WHERE node == :node AND key == :key ; " );
  stmt_fetch_attrs = sql.prepare( " SELECT key , type , val FROM attrs WHERE node == :node ORDER BY key ; " );
  
  // arrays
  stmt_insert_array     = sql.prepare( " INSERT OR REPLACE INTO arrays ( node , key , dtype , shape , val ) values( :node , :key , :dtype , :shape , :val ); " );
  stmt_fetch_array      = sql.prepare( " SELECT dtype , shape , val FROM arrays WHERE node == :node AND key == :key ; " );
  stmt_fetch_array_keys = sql.prepare( " SELECT key FROM arrays WHERE node == :node ORDER BY key ; " );
  
  return true;
}

bool hstore_t::release()
{
  sql.finalise( stmt_insert_node );
  sql.finalise( stmt_fetch_node );
  sql.finalise( stmt_fetch_children );
  sql.finalise( stmt_count_children );

  sql.finalise( stmt_insert_attr );
  sql.finalise( stmt_fetch_attr );
  sql.finalise( stmt_fetch_attrs );

  sql.finalise( stmt_insert_array );
  sql.finalise( stmt_fetch_array );
  sql.finalise( stmt_fetch_array_keys );
  return true;
}

void hstore_t::begin()    { sql.begin(); }
void hstore_t::commit()   { sql.commit(); }


std::string hstore_t::parent( const std::string & path )
{
  if ( path == "/" || path == "" ) return "";
  size_t p = path.rfind( '/' );
  if ( p == std::string::npos || p == 0 ) return "/";
  return path.substr( 0 , p );
}

std::string hstore_t::basename( const std::string & path )
{
  size_t p = path.rfind( '/' );
  if ( p == std::string::npos ) return path;
  return path.substr( p + 1 );
}


//
// Groups
//

int64_t hstore_t::node( const std::string & path )
{
  sql.bind_text( stmt_fetch_node , ":path" , path );
  int64_t id = -1;
  if ( sql.step( stmt_fetch_node ) )
    id = sql.get_int64( stmt_fetch_node , 0 );
  sql.reset( stmt_fetch_node );
  return id;
}

int64_t hstore_t::require_node( const std::string & path )
{
  int64_t id = node( path );
  if ( id == -1 ) Helper::halt( "no group " + path + " in " + filename );
  return id;
}

bool hstore_t::has_group( const std::string & path )
{
  return node( path ) != -1;
}

void hstore_t::create_group( const std::string & path )
{
  
  if ( path.size() == 0 || path[0] != '/' || ( path.size() > 1 && path[ path.size() - 1 ] == '/' ) )
    Helper::halt( "invalid group path [" + path + "]" );

  if ( readonly )
    Helper::halt( "cannot create group " + path + " in read-only container " + filename );
  
  if ( has_group( path ) ) return;

  const std::string par = parent( path );

  if ( par == "" )
    {
      sql.bind_text( stmt_insert_node , ":path" , path );
      sql.bind_null( stmt_insert_node , ":parent" );
      sql.bind_int( stmt_insert_node , ":pos" , 0 );
    }
  else
    {
      // ensure the full chain exists first
      create_group( par );
      const int64_t pid = require_node( par );

      sql.bind_int64( stmt_count_children , ":parent" , pid );
      int pos = 0;
      if ( sql.step( stmt_count_children ) )
	pos = sql.get_int( stmt_count_children , 0 );
      sql.reset( stmt_count_children );

      sql.bind_text( stmt_insert_node , ":path" , path );
      sql.bind_int64( stmt_insert_node , ":parent" , pid );
      sql.bind_int( stmt_insert_node , ":pos" , pos );
    }
  
  sql.step( stmt_insert_node );
  sql.reset( stmt_insert_node );
}

std::vector<std::string> hstore_t::children( const std::string & path )
{
  std::vector<std::string> r;
  const int64_t id = node( path );
  if ( id == -1 ) return r;
  sql.bind_int64( stmt_fetch_children , ":parent" , id );
  while ( sql.step( stmt_fetch_children ) )
    r.push_back( sql.get_text( stmt_fetch_children , 0 ) );
  sql.reset( stmt_fetch_children );
  return r;
}


//
// Attributes
//

void hstore_t::set_attr( const std::string & path , const std::string & key , const hstore_attr_t & value )
{

  create_group( path );
  
  const int64_t id = require_node( path );
  
  sql.bind_int64( stmt_insert_attr , ":node" , id );
  sql.bind_text( stmt_insert_attr , ":key" , key );
  sql.bind_text( stmt_insert_attr , ":type" , globals::attr_type_name( value.type ) );

  if ( value.type == ATTR_TEXT )
    sql.bind_text( stmt_insert_attr , ":val" , value.str_value );
  else if ( value.type == ATTR_REAL )
    {
      // SQLite stores NaN as NULL
      if ( std::isnan( value.dbl_value ) )
	sql.bind_null( stmt_insert_attr , ":val" );
      else
	sql.bind_double( stmt_insert_attr , ":val" , value.dbl_value );
    }
  else if ( value.type == ATTR_INT )
    sql.bind_int64( stmt_insert_attr , ":val" , value.int_value );
  else
    sql.bind_int( stmt_insert_attr , ":val" , value.bool_value ? 1 : 0 );
  
  sql.step( stmt_insert_attr );
  sql.reset( stmt_insert_attr );
}

void hstore_t::set_attr( const std::string & path , const std::string & key , const std::string & value )
{
  set_attr( path , key , hstore_attr_t( value ) );
}

void hstore_t::set_attr( const std::string & path , const std::string & key , const char * value )
{
  set_attr( path , key , hstore_attr_t( value ) );
}

void hstore_t::set_attr( const std::string & path , const std::string & key , const double value )
{
  set_attr( path , key , hstore_attr_t( value ) );
}

void hstore_t::set_attr( const std::string & path , const std::string & key , const int64_t value )
{
  set_attr( path , key , hstore_attr_t( value ) );
}

void hstore_t::set_attr( const std::string & path , const std::string & key , const int value )
{
  set_attr( path , key , hstore_attr_t( value ) );
}

void hstore_t::set_attr( const std::string & path , const std::string & key , const bool value )
{
  set_attr( path , key , hstore_attr_t( value ) );
}

// read one attribute from a statement positioned on a row, with the
// type in column t and the value in column t+1

static hstore_attr_t read_attr( SQL & sql , sqlite3_stmt * stmt , const int t , const std::string & key )
{
  hstore_attr_t a;
  if ( ! globals::attr_type( sql.get_text( stmt , t ) , &a.type ) )
    Helper::halt( "unknown attribute type for " + key + ": " + sql.get_text( stmt , t ) );
  
  if ( a.type == ATTR_TEXT )
    a.str_value = sql.get_text( stmt , t + 1 );
  else if ( a.type == ATTR_REAL )
    a.dbl_value = sql.is_null( stmt , t + 1 ) ? std::numeric_limits<double>::quiet_NaN() : sql.get_double( stmt , t + 1 );
  else if ( a.type == ATTR_INT )
    a.int_value = sql.get_int64( stmt , t + 1 );
  else
    a.bool_value = sql.get_int( stmt , t + 1 ) != 0;
  return a;
}

bool hstore_t::has_attr( const std::string & path , const std::string & key )
{
  const int64_t id = node( path );
  if ( id == -1 ) return false;
  sql.bind_int64( stmt_fetch_attr , ":node" , id );
  sql.bind_text( stmt_fetch_attr , ":key" , key );
  const bool found = sql.step( stmt_fetch_attr );
  sql.reset( stmt_fetch_attr );
  return found;
}

hstore_attr_t hstore_t::get_attr( const std::string & path , const std::string & key )
{
  const int64_t id = require_node( path );
  sql.bind_int64( stmt_fetch_attr , ":node" , id );
  sql.bind_text( stmt_fetch_attr , ":key" , key );
  if ( ! sql.step( stmt_fetch_attr ) )
    {
      sql.reset( stmt_fetch_attr );
      Helper::halt( "no attribute " + key + " in " + path );
      return hstore_attr_t();
    }
  hstore_attr_t a = read_attr( sql , stmt_fetch_attr , 0 , key );
  sql.reset( stmt_fetch_attr );
  return a;
}

std::map<std::string,hstore_attr_t> hstore_t::attrs( const std::string & path )
{
  std::map<std::string,hstore_attr_t> r;
  const int64_t id = node( path );
  if ( id == -1 ) return r;
  sql.bind_int64( stmt_fetch_attrs , ":node" , id );
  while ( sql.step( stmt_fetch_attrs ) )
    {
      const std::string key = sql.get_text( stmt_fetch_attrs , 0 );
      r[ key ] = read_attr( sql , stmt_fetch_attrs , 1 , key );
    }
  sql.reset( stmt_fetch_attrs );
  return r;
}


//
// Arrays
//

void hstore_t::check_shape( const std::string & key , const int n , std::vector<int> * shape )
{
  if ( shape->size() == 0 )
    {
      shape->push_back( n );
      return;
    }
  int64_t p = 1;
  for (int i=0; i<shape->size(); i++)
    {
      if ( (*shape)[i] < 0 ) Helper::halt( "negative extent in shape of " + key );
      p *= (*shape)[i];
    }
  if ( p != n )
    Helper::halt( "shape [" + Helper::stringize( *shape ) + "] does not match " + Helper::int2str( n ) + " elements for " + key );
}

void hstore_t::set_array( const std::string & path , const std::string & key ,
			  const std::vector<double> & value , const std::vector<int> & shape0 )
{

  std::vector<int> shape = shape0;
  check_shape( key , value.size() , &shape );
  
  create_group( path );
  const int64_t id = require_node( path );
  
  sql.bind_int64( stmt_insert_array , ":node" , id );
  sql.bind_text( stmt_insert_array , ":key" , key );
  sql.bind_text( stmt_insert_array , ":dtype" , globals::array_type_name( ARRAY_F64 ) );
  sql.bind_text( stmt_insert_array , ":shape" , Helper::stringize( shape ) );

  // whole array as a (native-endian) blob
  sql.bind_blob( stmt_insert_array , ":val" , value.data() , value.size() * sizeof(double) );

  sql.step( stmt_insert_array );
  sql.reset( stmt_insert_array );
}

void hstore_t::set_array( const std::string & path , const std::string & key ,
			  const std::vector<int64_t> & value , const std::vector<int> & shape0 )
{

  std::vector<int> shape = shape0;
  check_shape( key , value.size() , &shape );

  create_group( path );
  const int64_t id = require_node( path );
  
  sql.bind_int64( stmt_insert_array , ":node" , id );
  sql.bind_text( stmt_insert_array , ":key" , key );
  sql.bind_text( stmt_insert_array , ":dtype" , globals::array_type_name( ARRAY_I64 ) );
  sql.bind_text( stmt_insert_array , ":shape" , Helper::stringize( shape ) );
  sql.bind_blob( stmt_insert_array , ":val" , value.data() , value.size() * sizeof(int64_t) );

  sql.step( stmt_insert_array );
  sql.reset( stmt_insert_array );
}

bool hstore_t::has_array( const std::string & path , const std::string & key )
{
  const int64_t id = node( path );
  if ( id == -1 ) return false;
  sql.bind_int64( stmt_fetch_array , ":node" , id );
  sql.bind_text( stmt_fetch_array , ":key" , key );
  const bool found = sql.step( stmt_fetch_array );
  sql.reset( stmt_fetch_array );
  return found;
}

hstore_array_t hstore_t::get_array( const std::string & path , const std::string & key )
{

  hstore_array_t a;
  
  const int64_t id = require_node( path );
  sql.bind_int64( stmt_fetch_array , ":node" , id );
  sql.bind_text( stmt_fetch_array , ":key" , key );

  if ( ! sql.step( stmt_fetch_array ) )
    {
      sql.reset( stmt_fetch_array );
      Helper::halt( "no array " + key + " in " + path );
      return a;
    }

  // 0 dtype
  // 1 shape
  // 2 val
  
  const std::string dtype = sql.get_text( stmt_fetch_array , 0 );
  const std::string shape = sql.get_text( stmt_fetch_array , 1 );
  const std::string blob  = sql.get_blob( stmt_fetch_array , 2 );
  sql.reset( stmt_fetch_array );

  if ( ! globals::array_type( dtype , &a.type ) )
    Helper::halt( "unknown array type for " + path + "/" + key + ": " + dtype );

  int64_t n = 1;
  std::vector<std::string> tok = Helper::parse( shape , ',' );
  for (int i=0; i<tok.size(); i++)
    {
      int d = 0;
      if ( ! Helper::str2int( tok[i] , &d ) || d < 0 )
	Helper::halt( "bad shape for " + path + "/" + key + ": " + shape );
      a.shape.push_back( d );
      n *= d;
    }
  
  const size_t width = a.type == ARRAY_F64 ? sizeof(double) : sizeof(int64_t);
  if ( a.shape.size() == 0 || blob.size() != n * width )
    Helper::halt( "corrupt array " + path + "/" + key + ": expecting " + Helper::int2str( (long)n ) + " elements" );
  
  if ( a.type == ARRAY_F64 )
    {
      a.dbl_value.resize( n );
      if ( n ) std::memcpy( a.dbl_value.data() , blob.data() , blob.size() );
    }
  else
    {
      a.int_value.resize( n );
      if ( n ) std::memcpy( a.int_value.data() , blob.data() , blob.size() );
    }
  
  return a;
}

std::set<std::string> hstore_t::arrays( const std::string & path )
{
  std::set<std::string> r;
  const int64_t id = node( path );
  if ( id == -1 ) return r;
  sql.bind_int64( stmt_fetch_array_keys , ":node" , id );
  while ( sql.step( stmt_fetch_array_keys ) )
    r.insert( sql.get_text( stmt_fetch_array_keys , 0 ) );
  sql.reset( stmt_fetch_array_keys );
  return r;
}


//
// Value helpers
//

double hstore_attr_t::as_double() const
{
  if ( type == ATTR_REAL ) return dbl_value;
  if ( type == ATTR_INT ) return int_value;
  if ( type == ATTR_BOOL ) return bool_value ? 1 : 0;
  double d = 0;
  if ( ! Helper::str2dbl( str_value , &d ) )
    Helper::halt( "expecting a numeric attribute, found [" + str_value + "]" );
  return d;
}

std::string hstore_attr_t::as_string() const
{
  if ( type == ATTR_TEXT ) return str_value;
  if ( type == ATTR_REAL ) return Helper::dbl2str( dbl_value );
  if ( type == ATTR_INT ) return Helper::int2str( (long)int_value );
  return bool_value ? "true" : "false";
}

bool hstore_attr_t::operator==( const hstore_attr_t & rhs ) const
{
  if ( type != rhs.type ) return false;
  if ( type == ATTR_TEXT ) return str_value == rhs.str_value;
  if ( type == ATTR_REAL ) return dbl_value == rhs.dbl_value || ( std::isnan( dbl_value ) && std::isnan( rhs.dbl_value ) );
  if ( type == ATTR_INT ) return int_value == rhs.int_value;
  return bool_value == rhs.bool_value;
}

std::vector<double> hstore_array_t::as_doubles() const
{
  if ( type == ARRAY_F64 ) return dbl_value;
  std::vector<double> r( int_value.size() );
  for (int i=0; i<int_value.size(); i++) r[i] = int_value[i];
  return r;
}

std::vector<int> hstore_array_t::as_ints() const
{
  std::vector<int> r( size() );
  if ( type == ARRAY_I64 )
    {
      for (int i=0; i<int_value.size(); i++) r[i] = int_value[i];
      return r;
    }
  for (int i=0; i<dbl_value.size(); i++)
    {
      if ( dbl_value[i] != std::floor( dbl_value[i] ) )
	Helper::halt( "expecting integer values, found " + Helper::dbl2str( dbl_value[i] ) );
      r[i] = dbl_value[i];
    }
  return r;
}
