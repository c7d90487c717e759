
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


#include "db/sqlwrap.h"
#include "helper/helper.h"

bool SQL::open( const std::string & n , const bool readonly )
{

  if ( db ) close();
  
  // expand ~ to home folder...
  name = Helper::expand( n ) ;

  const int flags = readonly ? SQLITE_OPEN_READONLY : ( SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE );
  
  rc = sqlite3_open_v2( name.c_str() , &db , flags , NULL );
  
  if ( rc )
    {
      // a handle is returned even on failure
      sqlite3_close( db );
      db = NULL;
      Helper::halt( "problem opening database: " + name );
      return false;
    }
  
  return rc == 0;
}

void SQL::synchronous(bool b)
{
  if ( !b ) 
    query( "PRAGMA synchronous=0;" ); // OFF
  else
    query( "PRAGMA synchronous=2;" ); // FULL
}

bool SQL::table_exists( const std::string & table_name )
{
  sqlite3_stmt * s = prepare( "SELECT name FROM sqlite_master WHERE type='table' AND name= :table_name ; " );
  if ( s == NULL ) return false;
  bind_text( s , ":table_name" , table_name );
  const bool found = step(s);
  finalise(s);
  return found;
}

void SQL::close()
{
  if ( db ) 
    {
      std::set<sqlite3_stmt*>::iterator ii = qset.begin();
      while ( ii != qset.end() )
	{
	  sqlite3_finalize( *ii );
	  ++ii;
	}
      qset.clear();
      sqlite3_close(db);	    
      db = NULL;
    }
}

bool SQL::query( const std::string & q )
{  
  char * db_err = NULL;
  rc = sqlite3_exec( db , q.c_str() , 0 , 0 , &db_err );
  if ( rc )
    {
      Helper::warn( std::string( db_err ? db_err : "unknown database error" ) );
      sqlite3_free( db_err );
    }
  return rc == 0;
}

sqlite3_stmt * SQL::prepare( const std::string & q )
{   
  sqlite3_stmt * p;
  int rc = sqlite3_prepare_v2( db , q.c_str() , q.size() , &p , NULL );   
  if ( rc )
    {
      Helper::halt( "database (" + name + ") preparing query: " + std::string( sqlite3_errmsg(db) ) );
      return NULL;
    }
  qset.insert(p);
  return p;
}

void SQL::begin()
{  
  if ( ! query( "BEGIN;" ) )
    Helper::halt( "database (" + name + ") could not begin a transaction" );
}

void SQL::commit()
{
  if ( ! query( "COMMIT;" ) )
    Helper::halt( "database (" + name + ") could not commit a transaction" );
}

void SQL::finalise(sqlite3_stmt * stmt)
{
  std::set<sqlite3_stmt*>::iterator i = qset.find( stmt );
  if ( stmt && i != qset.end() ) 
    {
      qset.erase( i ); 
      sqlite3_finalize( stmt );  
    }
}

bool SQL::step(sqlite3_stmt * stmt)
{
  
  rc = sqlite3_step( stmt );

  if ( rc != SQLITE_ROW && rc != SQLITE_DONE )
    {
      const std::string msg = "database (" + name +") error (" + Helper::int2str( sqlite3_errcode(db) ) +") " + sqlite3_errmsg(db);
      reset(stmt);
      Helper::halt( msg );
    }
  
  return rc == SQLITE_ROW;
}

void SQL::reset( sqlite3_stmt * stmt )
{
  sqlite3_reset( stmt );
  sqlite3_clear_bindings( stmt );
}

void SQL::bind_int( sqlite3_stmt * stmt , const std::string index , int value )
{
  sqlite3_bind_int( stmt , 
		    sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		    value );
}

void SQL::bind_null( sqlite3_stmt * stmt , const std::string index  )
{
  sqlite3_bind_null( stmt , 
		     sqlite3_bind_parameter_index( stmt , index.c_str() ) );
}

void SQL::bind_int64( sqlite3_stmt * stmt , const std::string index , int64_t value )
{
  sqlite3_bind_int64( stmt , 
		      sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		      value );
}

void SQL::bind_double( sqlite3_stmt * stmt , const std::string index , double value )
{
  sqlite3_bind_double( stmt , 
		       sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		       value );
}

void SQL::bind_text( sqlite3_stmt * stmt , const std::string index , const std::string & value )
{
  sqlite3_bind_text( stmt , 
		     sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		     value.c_str() , 
		     value.size() , 
		     SQLITE_TRANSIENT );
}
  
void SQL::bind_blob( sqlite3_stmt * stmt , const std::string index , const void * p , const int bytes )
{
  // zero-length blobs are stored as empty, not NULL
  rc = sqlite3_bind_blob( stmt , 
			  sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
			  bytes ? p : "" ,
			  bytes ,
			  SQLITE_TRANSIENT );
  if ( rc ) Helper::halt( "database (" + name + ") could not bind blob " + index );
}

int SQL::get_int( sqlite3_stmt * stmt , int idx )
{
  return sqlite3_column_int( stmt , idx );
}

int64_t SQL::get_int64( sqlite3_stmt * stmt , int idx )
{  
  return sqlite3_column_int64( stmt , idx );
}

double SQL::get_double( sqlite3_stmt * stmt , int idx )
{
  return sqlite3_column_double( stmt , idx );
}

bool SQL::is_null(  sqlite3_stmt * stmt , int idx )
{
  return sqlite3_column_type( stmt , idx ) == SQLITE_NULL;
}

std::string SQL::get_text(  sqlite3_stmt * stmt , int idx )
{
  const unsigned char * s = sqlite3_column_text( stmt , idx );
  if ( s == NULL )
    return "";
  return std::string( (const char*)s , sqlite3_column_bytes( stmt , idx ) );
}

std::string SQL::get_blob( sqlite3_stmt * stmt , int idx )
{
  const void * p = sqlite3_column_blob( stmt , idx );
  const int l = sqlite3_column_bytes( stmt , idx );
  if ( p == NULL || l == 0 ) return "";
  return std::string( (const char*)p , l );
}
