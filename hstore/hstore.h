
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


#ifndef __OPHYS_HSTORE_H__
#define __OPHYS_HSTORE_H__

#include "db/sqlwrap.h"
#include "defs/defs.h"

#include <string>
#include <vector>
#include <map>
#include <set>
#include <stdint.h>

//
// A hierarchical key-value container in a single SQLite file: a tree
// of named groups ("/", "/acquisition", "/cells/cell_0", ...), each
// holding typed scalar attributes and homogeneous numeric arrays
//

struct hstore_attr_t {

  hstore_attr_t() : type( ATTR_TEXT ) , dbl_value(0) , int_value(0) , bool_value(false) { } 

  explicit hstore_attr_t( const std::string & s ) : type( ATTR_TEXT ) , str_value(s) , dbl_value(0) , int_value(0) , bool_value(false) { }
  explicit hstore_attr_t( const char * s ) : type( ATTR_TEXT ) , str_value(s) , dbl_value(0) , int_value(0) , bool_value(false) { }
  explicit hstore_attr_t( const double d ) : type( ATTR_REAL ) , dbl_value(d) , int_value(0) , bool_value(false) { }
  explicit hstore_attr_t( const int64_t i ) : type( ATTR_INT ) , dbl_value(0) , int_value(i) , bool_value(false) { }
  explicit hstore_attr_t( const int i ) : type( ATTR_INT ) , dbl_value(0) , int_value(i) , bool_value(false) { }
  explicit hstore_attr_t( const bool b ) : type( ATTR_BOOL ) , dbl_value(0) , int_value(0) , bool_value(b) { }
  
  attr_type_t type;
  
  std::string str_value;
  double      dbl_value;
  int64_t     int_value;
  bool        bool_value;

  // numeric view of a real, int or bool attribute (halts on text)
  double as_double() const;

  // printable form of any attribute
  std::string as_string() const;
  
  bool operator==( const hstore_attr_t & rhs ) const;
  
};


struct hstore_array_t {

  hstore_array_t() : type( ARRAY_F64 ) { } 
  
  array_type_t type;

  // row-major; a 1-D array has a single extent
  std::vector<int> shape;
  
  std::vector<double>  dbl_value;
  std::vector<int64_t> int_value;

  int size() const { return type == ARRAY_F64 ? dbl_value.size() : int_value.size(); }

  int rows() const { return shape.size() == 0 ? 0 : shape[0]; }

  int cols() const { return shape.size() < 2 ? 1 : shape[1]; }

  // element-wise view as doubles, whichever the stored type
  std::vector<double> as_doubles() const;

  // element-wise view as ints (halts if a double is not integral)
  std::vector<int> as_ints() const;
  
};


struct hstore_t { 

  // opens (and, unless readonly, creates) the container
  hstore_t( const std::string & filename , const bool readonly = false );

  ~hstore_t();
  
  bool attached() const { return sql.is_open(); }
  
  void close();

  const std::string & file() const { return filename; }

  // transactions
  void begin();
  void commit();
  
  //
  // groups: absolute, '/'-delimited paths; parents are created as needed
  //

  void create_group( const std::string & path );

  bool has_group( const std::string & path );

  // immediate children (full paths), in creation order
  std::vector<std::string> children( const std::string & path );

  //
  // scalar attributes
  //

  void set_attr( const std::string & path , const std::string & key , const hstore_attr_t & value );
  void set_attr( const std::string & path , const std::string & key , const std::string & value );
  void set_attr( const std::string & path , const std::string & key , const char * value );
  void set_attr( const std::string & path , const std::string & key , const double value );
  void set_attr( const std::string & path , const std::string & key , const int64_t value );
  void set_attr( const std::string & path , const std::string & key , const int value );
  void set_attr( const std::string & path , const std::string & key , const bool value );

  bool has_attr( const std::string & path , const std::string & key );

  hstore_attr_t get_attr( const std::string & path , const std::string & key );

  std::map<std::string,hstore_attr_t> attrs( const std::string & path );
  
  //
  // arrays: an empty shape means 1-D
  //
  
  void set_array( const std::string & path , const std::string & key ,
		  const std::vector<double> & value , const std::vector<int> & shape = std::vector<int>() );

  void set_array( const std::string & path , const std::string & key ,
		  const std::vector<int64_t> & value , const std::vector<int> & shape = std::vector<int>() );
  
  bool has_array( const std::string & path , const std::string & key );

  hstore_array_t get_array( const std::string & path , const std::string & key );

  std::set<std::string> arrays( const std::string & path );

  static std::string parent( const std::string & path );

  static std::string basename( const std::string & path );
  
 private:

  bool init();

  bool release();
  
  // node id for a path, or -1
  int64_t node( const std::string & path );

  // as above, halting if absent
  int64_t require_node( const std::string & path );

  void check_shape( const std::string & key , const int n , std::vector<int> * shape );
  
  SQL sql;

  std::string filename;

  bool readonly;
  
  //
  // Prepared queries
  //

  sqlite3_stmt * stmt_insert_node;
  sqlite3_stmt * stmt_fetch_node;
  sqlite3_stmt * stmt_fetch_children;
  sqlite3_stmt * stmt_count_children;

  sqlite3_stmt * stmt_insert_attr;
  sqlite3_stmt * stmt_fetch_attr;
  sqlite3_stmt * stmt_fetch_attrs;

  sqlite3_stmt * stmt_insert_array;
  sqlite3_stmt * stmt_fetch_array;
  sqlite3_stmt * stmt_fetch_array_keys;
  
};

#endif
