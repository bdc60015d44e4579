
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

#include "defs/defs.h"

#include <cstddef>

std::string globals::version;
std::string globals::date;

int globals::retcode;

void (*globals::bail_function) ( const std::string & ) = NULL;

void (*globals::logger_function) ( const std::string & ) = NULL;

bool globals::silent = false;
bool globals::verbose = false;
bool globals::api_mode = false;
bool globals::cache_log = false;
bool globals::bail_on_fail = true;


void globals::api()
{
  silent = true;
  api_mode = true;
  bail_on_fail = false;
}


void globals::init_defs()
{

  //
  // Version
  //
  
  version = "v0.3.1";
  
  date    = "02-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Optional bail function after halt() is called
  //
  
  bail_function = NULL;

  //
  // Optional redirect of logger?
  //
  
  logger_function = NULL; 
  
  //
  // Output
  //
  
  silent = false;
  verbose = false;
  api_mode = false;
  cache_log = false;

  bail_on_fail = true;

}
