
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


#include "hstore/xstore.h"
#include "hstore/hstore.h"
#include "extraction/extraction.h"
#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cstdio>
#include <cmath>
#include <limits>
#include <set>
#include <map>

extern logger_t logger;

// removes an in-progress container unless the write was published
struct partial_file_t {

  partial_file_t( const std::string & f ) : filename(f) , published(false) { } 

  ~partial_file_t()
  {
    if ( ! published && Helper::fileExists( filename ) )
      std::remove( filename.c_str() );
  }

  std::string filename;
  bool published;
};

static std::vector<int64_t> i64( const std::vector<int> & x )
{
  return std::vector<int64_t>( x.begin() , x.end() );
}

static std::string cell_path( const int i )
{
  return "/cells/cell_" + Helper::int2str( i );
}

static void save_tuning( hstore_t & h , const std::string & path , const tuning_t & t )
{
  h.set_attr( path , "pref_dir_fit" , t.pref_dir_fit );
  h.set_attr( path , "pref_ort_fit" , t.pref_ort_fit );
  h.set_attr( path , "dti_fit" , t.dti_fit );
  h.set_attr( path , "oti_fit" , t.oti_fit );
  if ( Helper::realnum( t.fit_bandwidth ) )
    h.set_attr( path , "fit_bandwidth" , t.fit_bandwidth );
  h.set_attr( path , "fit_r" , t.fit_r );

  h.set_attr( path , "fit_baseline" , t.baseline );
  h.set_attr( path , "fit_amp1" , t.amp1 );
  h.set_attr( path , "fit_amp2" , t.amp2 );
  h.set_attr( path , "fit_kappa" , t.kappa );
  h.set_attr( path , "fit_mu" , t.mu );

  h.set_attr( path , "fit_n_angles" , t.n_angles );
  h.set_attr( path , "fit_dof" , t.dof );
  h.set_attr( path , "fit_iterations" , t.iterations );
  h.set_attr( path , "fit_sse" , t.sse );
  h.set_attr( path , "fit_converged" , t.converged );
  h.set_attr( path , "fit_low_confidence" , t.low_confidence );
  h.set_attr( path , "fit_degenerate" , t.degenerate );
  if ( t.note != "" )
    h.set_attr( path , "fit_note" , t.note );
}

static void save_cell( hstore_t & h , const std::string & path , const cell_t & cell )
{
  h.create_group( path );

  h.set_attr( path , "xPos" , cell.xPos );
  h.set_attr( path , "yPos" , cell.yPos );
  
  if ( cell.raw.size() )
    h.set_array( path , "raw" , cell.raw );

  if ( cell.uniqStims.size() )
    h.set_array( path , "uniqStims" , i64( cell.uniqStims ) );
  
  if ( cell.aligned() )
    {
      const int nc = cell.cyc.size();
      const int ns = cell.n_samples();
      
      // conditions stacked in uniqStims order
      std::vector<int> repeats;
      Eigen::MatrixXd cyc = eigen_ops::stack_rows( cell.cyc , ns , &repeats );

      std::vector<int> shape;
      shape.push_back( cyc.rows() );
      shape.push_back( ns );
      h.set_array( path , "cyc" , eigen_ops::flatten( cyc ) , shape );
      h.set_array( path , "cyc_repeats" , i64( repeats ) );

      std::vector<double> resp( nc , std::numeric_limits<double>::quiet_NaN() );
      std::map<int,double>::const_iterator rr = cell.condition_response.begin();
      while ( rr != cell.condition_response.end() )
	{
	  if ( rr->first < 0 || rr->first >= nc )
	    Helper::halt( "condition_response index out of range" );
	  resp[ rr->first ] = rr->second;
	  ++rr;
	}
      h.set_array( path , "condition_response" , resp );
      
      if ( cell.n_dropped.size() )
	h.set_array( path , "n_dropped" , i64( cell.n_dropped ) );

      h.set_attr( path , "ROI_responsiveness" , cell.ROI_responsiveness );
      h.set_attr( path , "responsive_p" , cell.responsive_p );
    }

  if ( cell.blank_id != globals::no_blank )
    h.set_attr( path , "blank_id" , cell.blank_id );
  
  if ( cell.has_tuning )
    {
      save_tuning( h , path , cell.tuning );
      if ( cell.tuning_curve.size() )
	h.set_array( path , "tuning_curve" , cell.tuning_curve );
    }
}


void xstore::save( const cell_extraction_t & ce , const std::string & f )
{

  const std::string filename = Helper::expand( f );
  const std::string partial = filename + globals::partial_suffix;

  // stale from an earlier, failed run?
  if ( Helper::fileExists( partial ) )
    Helper::deleteFile( partial );

  partial_file_t guard( partial );

  {
    hstore_t h( partial );
    
    h.begin();
    
    h.set_attr( "/" , "format" , globals::store_format );
    h.set_attr( "/" , "schema_version" , globals::store_schema_version );

    //
    // FOV
    //
    
    if ( ! ce.fov.empty() )
      {
	h.create_group( "/fov_metadata" );
	std::vector<std::pair<std::string,hstore_attr_t> > attr = ce.fov.export_attributes();
	for (int i=0; i<attr.size(); i++)
	  h.set_attr( "/fov_metadata" , attr[i].first , attr[i].second );
      }

    //
    // acquisition: absent streams are omitted
    //
    
    h.create_group( "/acquisition" );

    if ( ce.twophotontimes.size() )
      h.set_array( "/acquisition" , "twophotontimes" , ce.twophotontimes );
    if ( ce.stimOn.size() )
      h.set_array( "/acquisition" , "stimOn" , ce.stimOn );
    if ( ce.stimID.size() )
      h.set_array( "/acquisition" , "stimID" , i64( ce.stimID ) );
    if ( ce.uniqStims.size() )
      h.set_array( "/acquisition" , "uniqStims" , i64( ce.uniqStims ) );
    if ( ce.has_registration() )
      {
	std::vector<int> shape;
	shape.push_back( ce.regOffsets.rows() );
	shape.push_back( ce.regOffsets.cols() );
	h.set_array( "/acquisition" , "regOffsets" , eigen_ops::flatten( ce.regOffsets ) , shape );
      }

    //
    // cells
    //
    
    h.create_group( "/cells" );
    
    for (int i=0; i<ce.cells.size(); i++)
      save_cell( h , cell_path( i ) , ce.cells[i] );

    h.commit();
    h.close();
  }

  if ( std::rename( partial.c_str() , filename.c_str() ) != 0 )
    Helper::halt( "could not move " + partial + " to " + filename );

  guard.published = true;
  
  logger << "  saved " << ce.cells.size() << " cells to " << filename << "\n";
}


int xstore::cell_index( const std::string & name )
{
  if ( name.substr( 0 , 5 ) != "cell_" ) return -1;
  int i = -1;
  if ( ! Helper::str2int( name.substr( 5 ) , &i ) || i < 0 ) return -1;
  return i;
}

static double attr_dbl( const std::map<std::string,hstore_attr_t> & a , const std::string & k , const double d )
{
  std::map<std::string,hstore_attr_t>::const_iterator aa = a.find( k );
  return aa == a.end() ? d : aa->second.as_double();
}

static int attr_int( const std::map<std::string,hstore_attr_t> & a , const std::string & k , const int d )
{
  std::map<std::string,hstore_attr_t>::const_iterator aa = a.find( k );
  return aa == a.end() ? d : (int)aa->second.as_double();
}

static bool attr_bool( const std::map<std::string,hstore_attr_t> & a , const std::string & k , const bool d )
{
  std::map<std::string,hstore_attr_t>::const_iterator aa = a.find( k );
  return aa == a.end() ? d : aa->second.as_double() != 0;
}

static void load_cell( hstore_t & h , const std::string & path , const std::vector<int> & uniqStims , cell_t * cell )
{
  
  std::map<std::string,hstore_attr_t> a = h.attrs( path );
  
  cell->xPos = attr_dbl( a , "xPos" , 0 );
  cell->yPos = attr_dbl( a , "yPos" , 0 );
  cell->ROI_responsiveness = attr_bool( a , "ROI_responsiveness" , false );
  cell->responsive_p = attr_dbl( a , "responsive_p" , 1 );
  cell->blank_id = attr_int( a , "blank_id" , globals::no_blank );

  if ( h.has_array( path , "raw" ) )
    cell->raw = h.get_array( path , "raw" ).as_doubles();

  if ( h.has_array( path , "uniqStims" ) )
    cell->uniqStims = h.get_array( path , "uniqStims" ).as_ints();
  
  if ( h.has_array( path , "cyc" ) )
    {
      hstore_array_t cyc = h.get_array( path , "cyc" );
      if ( cyc.shape.size() != 2 )
	Helper::halt( path + "/cyc is not a 2-D array" );

      if ( ! h.has_array( path , "cyc_repeats" ) )
	Helper::halt( path + "/cyc has no cyc_repeats" );
      
      std::vector<int> repeats = h.get_array( path , "cyc_repeats" ).as_ints();
      cell->cyc = eigen_ops::split_rows( eigen_ops::unflatten( cyc.as_doubles() , cyc.rows() , cyc.cols() ) , repeats );

      // copy of the acquisition conditions, if not stored per cell
      if ( cell->uniqStims.size() == 0 ) cell->uniqStims = uniqStims;
      
      if ( cell->uniqStims.size() != cell->cyc.size() )
	Helper::halt( path + ": " + Helper::int2str( (int)cell->cyc.size() ) + " conditions in cyc, "
		      + Helper::int2str( (int)cell->uniqStims.size() ) + " in uniqStims" );
    }
  
  if ( h.has_array( path , "condition_response" ) )
    {
      std::vector<double> resp = h.get_array( path , "condition_response" ).as_doubles();
      for (int c=0; c<resp.size(); c++)
	if ( ! std::isnan( resp[c] ) ) cell->condition_response[c] = resp[c];
    }

  if ( h.has_array( path , "n_dropped" ) )
    cell->n_dropped = h.get_array( path , "n_dropped" ).as_ints();

  //
  // tuning
  //

  if ( a.find( "pref_dir_fit" ) != a.end() )
    {
      cell->has_tuning = true;
      tuning_t & t = cell->tuning;
      t.pref_dir_fit = attr_dbl( a , "pref_dir_fit" , 0 );
      t.pref_ort_fit = attr_dbl( a , "pref_ort_fit" , 0 );
      t.dti_fit = attr_dbl( a , "dti_fit" , 0 );
      t.oti_fit = attr_dbl( a , "oti_fit" , 0 );
      t.fit_bandwidth = attr_dbl( a , "fit_bandwidth" , std::numeric_limits<double>::quiet_NaN() );
      t.fit_r = attr_dbl( a , "fit_r" , 0 );

      t.baseline = attr_dbl( a , "fit_baseline" , 0 );
      t.amp1 = attr_dbl( a , "fit_amp1" , 0 );
      t.amp2 = attr_dbl( a , "fit_amp2" , 0 );
      t.kappa = attr_dbl( a , "fit_kappa" , 0 );
      t.mu = attr_dbl( a , "fit_mu" , 0 );

      t.n_angles = attr_int( a , "fit_n_angles" , 0 );
      t.dof = attr_int( a , "fit_dof" , 0 );
      t.iterations = attr_int( a , "fit_iterations" , 0 );
      t.sse = attr_dbl( a , "fit_sse" , 0 );
      t.converged = attr_bool( a , "fit_converged" , false );
      t.low_confidence = attr_bool( a , "fit_low_confidence" , false );
      t.degenerate = attr_bool( a , "fit_degenerate" , false );
      if ( a.find( "fit_note" ) != a.end() ) t.note = a[ "fit_note" ].as_string();
      
      if ( h.has_array( path , "tuning_curve" ) )
	cell->tuning_curve = h.get_array( path , "tuning_curve" ).as_doubles();
    }
}


cell_extraction_t xstore::load( const std::string & f )
{

  const std::string filename = Helper::expand( f );
  
  hstore_t h( filename , true );

  if ( h.has_attr( "/" , "format" ) && h.get_attr( "/" , "format" ).as_string() != globals::store_format )
    Helper::halt( filename + " is not an " + globals::store_format + " container" );

  if ( h.has_attr( "/" , "schema_version" ) && h.get_attr( "/" , "schema_version" ).as_double() > globals::store_schema_version )
    Helper::halt( filename + " has schema version " + h.get_attr( "/" , "schema_version" ).as_string()
		  + ", this build reads up to " + Helper::int2str( globals::store_schema_version ) );
  
  cell_extraction_t ce;

  if ( h.has_group( "/fov_metadata" ) )
    ce.fov.import_attributes( h.attrs( "/fov_metadata" ) );
  
  if ( h.has_array( "/acquisition" , "twophotontimes" ) )
    ce.twophotontimes = h.get_array( "/acquisition" , "twophotontimes" ).as_doubles();
  if ( h.has_array( "/acquisition" , "stimOn" ) )
    ce.stimOn = h.get_array( "/acquisition" , "stimOn" ).as_doubles();
  if ( h.has_array( "/acquisition" , "stimID" ) )
    ce.stimID = h.get_array( "/acquisition" , "stimID" ).as_ints();
  if ( h.has_array( "/acquisition" , "uniqStims" ) )
    ce.uniqStims = h.get_array( "/acquisition" , "uniqStims" ).as_ints();
  if ( h.has_array( "/acquisition" , "regOffsets" ) )
    {
      hstore_array_t reg = h.get_array( "/acquisition" , "regOffsets" );
      if ( reg.shape.size() != 2 )
	Helper::halt( "regOffsets in " + filename + " is not a 2-D array" );
      ce.regOffsets = eigen_ops::unflatten( reg.as_doubles() , reg.rows() , reg.cols() );
    }

  // derived: recompute if absent
  if ( ce.uniqStims.size() == 0 && ce.stimID.size() != 0 )
    {
      std::set<int> s( ce.stimID.begin() , ce.stimID.end() );
      ce.uniqStims.assign( s.begin() , s.end() );
    }

  if ( ! h.has_group( "/cells" ) )
    Helper::halt( "no cells group in " + filename );

  // order by positional index, not storage order
  std::map<int,std::string> order;
  std::vector<std::string> kids = h.children( "/cells" );
  for (int i=0; i<kids.size(); i++)
    {
      const int idx = cell_index( hstore_t::basename( kids[i] ) );
      if ( idx == -1 )
	{
	  Helper::warn( "ignoring unexpected group " + kids[i] );
	  continue;
	}
      order[ idx ] = kids[i];
    }
  
  std::map<int,std::string>::const_iterator oo = order.begin();
  while ( oo != order.end() )
    {
      cell_t cell;
      load_cell( h , oo->second , ce.uniqStims , &cell );
      ce.cells.push_back( cell );
      ++oo;
    }

  logger << "  loaded " << ce.cells.size() << " cells from " << filename << "\n";
  
  return ce;
}
