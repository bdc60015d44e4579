
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

#ifndef __DEFS_H__
#define __DEFS_H__

#include <string>

struct globals
{
  
  static std::string version;
  static std::string date;

  // return code for the command-line driver
  static int retcode;
  
  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // optional redirect of all logger output
  static void (*logger_function) ( const std::string & msg );
  
  // no console output
  static bool silent;

  // per-iteration reporting
  static bool verbose;

  // library mode: never exit the process
  static bool api_mode;

  // keep a copy of the log in memory (logger_t::print_buffer())
  static bool cache_log;
  
  static bool bail_on_fail;

  // global functions: primary initiation of all globals
  void init_defs();
  
  // modes
  void api();

};

#endif
