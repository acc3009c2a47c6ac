//    --------------------------------------------------------------------
//
//    This file is part of Sepia.
//
//    SEPIA is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    Sepia is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with Sepia. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "sepia.h"
#include "main.h"

#include <cstring>
#include <cstdlib>
#include <new>

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
      std::cerr << sepia_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = sepia_version() +
    "primary usage: sepia data.txt [header] [approach=symm|defl] [nc=N] [g=tanh|pow3|gauss]\n"
    "                     [alpha=1] [maxit=1000] [tol=1e-4] [seed=N] [verbose]\n"
    "                     [file=prefix] [A=file] [remove=1,2] [corr-sig=ref.txt] [corr-th=0.5]\n"
    "                     [out=cleaned.txt] [log=file] [silent]\n";

  if ( argc == 1 )
    {
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }


  //
  // parameters
  //

  param_t param;

  std::string datafile = build_param( &param , argc , argv );

  if ( datafile == "" )
    Helper::halt( "no data file specified" );

  if ( param.yesno( "silent" ) )
    globals::silent = true;

  if ( param.has( "log" ) )
    logger.write_log( param.value( "log" ) );

  logger.banner( globals::version , globals::date );

  logger << "input(s): " << param.dump( "" , " " ) << "\n";


  //
  // do the work; any ICA error is fatal here
  //

  try
    {
      ica::wrapper( param );
    }
  catch ( const ica_error_t & e )
    {
      Helper::halt( e.what() );
    }

  std::exit( globals::retcode );

}


//
// build parameters from the command line; the first argument is the data
// file, unless given explicitly as data=file
//

std::string build_param( param_t * param , int argc , char** argv )
{

  for (int i=1; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;

      if ( i == 1 && x.find( "=" ) == std::string::npos )
	param->add( "data" , x );
      else
	param->parse( x );
    }

  return param->value( "data" );

}


//
// report Sepia version
//

std::string sepia_version()
{
  std::stringstream ss;
  ss << "sepia version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "sepia build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

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
