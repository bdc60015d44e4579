
//    --------------------------------------------------------------------
//
//    This file is part of NNICA.
//
//    NNICA is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    NNICA is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with NNICA. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "main.h"
#include "nnica.h"

#include <cstring>
#include <cstdlib>

extern globals global;

extern logger_t logger;

//
// usage:
//
//   nnica [--options] dat=X.txt nc=2 ...
//
// without --options, key=value tokens are read from stdin:
//
//   echo "dat=X.txt nc=2" | nnica
//

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
      std::cerr << nnica_base_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::exit( globals::retcode );
    }

  //
  // options from the command line (after --options) or stdin
  //
  
  int param_from_command_line = 0;
  
  for (int i=1; i<argc; i++)
    {
      if ( strcmp( argv[i] , "--options" ) == 0 ||
	   strcmp( argv[i] , "--opt" ) == 0 )
	{
	  param_from_command_line = i+1;
	  break;
	}
    }

  param_t param;
  build_param( &param , argc , argv , param_from_command_line );

  //
  // logging options
  //
  
  if ( param.yesno( "silent" ) )
    globals::silent = true;

  if ( param.yesno( "verbose" ) )
    globals::verbose = true;

  if ( param.has( "log" ) && ! param.empty( "log" ) )
    logger.write_log( param.value( "log" ) );
  
  logger.banner( globals::version , globals::date );

  logger << "  options:\n" << param.dump( "    " ) << "\n";
  
  //
  // run 
  //
  
  nnica_cmd( param );

  std::exit( globals::retcode );
}


//
// construct parameters from the command line / stdin
//

void build_param_from_stdin( param_t * param )
{
  while ( ! std::cin.eof() )
    {
      std::string x;
      std::cin >> x;      
      if ( std::cin.eof() && x == "" ) break;
      if ( x == "" ) continue;
      param->parse( x ); 
    }
}

void build_param( param_t * param , int argc , char** argv , int start )
{

  // get arguments from stdin (rather than the command line options)?
  
  if ( start == 0 )
    {
      build_param_from_stdin( param );
      return;
    }

  for (int i=start; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;
      param->parse( x ); 
    }
}


//
// report version
//

std::string nnica_base_version() 
{
  std::stringstream ss;
  ss << "nnica version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "nnica build date/time " << __DATE__ << " " << __TIME__ << "\n";
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
