
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


#include "ophys.h"
#include "main.h"

#include <cstring>
#include <cstdlib>

//
// global resources
//

extern globals global;

extern logger_t logger;


int main(int argc , char ** argv )
{

  //
  // initiate global defintions
  //
  
  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //
  
  bool show_version = argc >= 2 
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );
  
  if ( show_version )  
    {
      global.api();
      std::cerr << ophys_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "sqlite v"
		<< SQL::library_version() << "\n";
      std::exit( globals::retcode );
    }
  
  
  //
  // primary usage
  //
  
  std::string usage_msg = ophys_version() +
    "usage: ophys --extract traces.txt timing.txt out.db [options]\n"
    "       ophys --summary in.db\n"
    "       ophys --tuning in.db [fit-all] [options]\n"
    "       ophys -v\n"
    "options: pre=N post=N resp-start=N resp-stop=N subtract-baseline onset=first|nearest\n"
    "         truncate blank=ID|none|last alpha=P tuning=T|F fit-all max-iter=N tol=X\n"
    "         log=file silent verbose @param-file\n";
  
  //
  // degenerate command line?
  //
  
  if ( argc < 2 )
    {      
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }
  
  const std::string cmd = argv[1];

  int nargs = 0;
  if ( cmd == "--extract" ) nargs = 3;
  else if ( cmd == "--summary" || cmd == "--tuning" ) nargs = 1;
  else
    {
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }
  
  if ( argc < 2 + nargs )
    Helper::halt( cmd + " expects " + Helper::int2str( nargs ) + " file argument(s)\n" + usage_msg );

  
  //
  // options, from the command line and any @files
  //

  build_param( &globals::param , argc , argv , 2 + nargs );

  param_t & param = globals::param;
  
  if ( param.has( "silent" ) ) globals::silent = param.yesno( "silent" );

  if ( param.has( "verbose" ) ) globals::verbose = param.yesno( "verbose" );
  
  if ( param.has( "log" ) ) logger.write_log( param.requires( "log" ) );
  
  logger.banner( globals::version , globals::date );

  if ( globals::verbose )
    logger << "  options:\n" << param.dump( "    " ) << "\n";
  
  
  //
  // dispatch
  //
  
  if ( cmd == "--extract" )
    proc_extract( argv[2] , argv[3] , argv[4] , param );
  else if ( cmd == "--summary" )
    proc_summary( argv[2] );
  else
    proc_tuning( argv[2] , param );
  
  std::exit( globals::retcode );
  
}


void proc_extract( const std::string & traces , const std::string & timing , const std::string & out , const param_t & param )
{
  
  cell_extraction_t ce;

  ce.read_timing( timing );

  ce.read_traces( traces );

  ce.populate( param );

  xstore::save( ce , out );

  logger << ce.summary();
}


void proc_summary( const std::string & db )
{
  cell_extraction_t ce = xstore::load( db );
  logger << ce.summary();
}


void proc_tuning( const std::string & db , const param_t & param )
{

  cell_extraction_t ce = xstore::load( db );

  tuning_param_t tparam( param );
  
  ce.fit_tuning( tparam );

  // one row per fitted cell
  std::cout << "CELL\tpref_dir_fit\tpref_ort_fit\tdti_fit\toti_fit\tfit_bandwidth\tfit_r\tlow_confidence\tdegenerate\n";

  for (int i=0; i<ce.cells.size(); i++)
    {
      const cell_t & cell = ce.cells[i];
      if ( ! cell.has_tuning ) continue;
      const tuning_t & t = cell.tuning;
      std::cout << i << "\t"
		<< t.pref_dir_fit << "\t"
		<< t.pref_ort_fit << "\t"
		<< t.dti_fit << "\t"
		<< t.oti_fit << "\t"
		<< ( Helper::realnum( t.fit_bandwidth ) ? Helper::dbl2str( t.fit_bandwidth ) : "NA" ) << "\t"
		<< t.fit_r << "\t"
		<< ( t.low_confidence ? 1 : 0 ) << "\t"
		<< ( t.degenerate ? 1 : 0 ) << "\n";
    }

  xstore::save( ce , db );
}


void build_param( param_t * param , int argc , char** argv , int start )
{
  // key=value, flags and @parameter-files
  param->parse( argc , argv , start );
}


std::string ophys_version() 
{
  std::stringstream ss;
  ss << "ophys version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "ophys build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* You need a smaller dataset or a bigger computer...*\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
