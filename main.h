
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


#ifndef __NNICA_MAIN_H__
#define __NNICA_MAIN_H__

#include <string>
#include <new>

struct param_t;

// misc helper: manage memory resource issues
void NoMem();

// misc helper: build params from cmdline (tokens from 'start' onwards)
void build_param( param_t * , int argc , char** argv , int start );

// misc helper: build params from stdin
void build_param_from_stdin( param_t * );

// misc helper: return version
std::string nnica_base_version();

#endif
