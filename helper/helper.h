
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

#ifndef __NNICA_HELPER_H__
#define __NNICA_HELPER_H__

#include <string>
#include <vector>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace Helper 
{

  std::string toupper( const std::string & );  

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](int c) {return !std::isspace(c);} ));
    return s;
  }
 
  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](int c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }
  
  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );
  
  bool yesno( const std::string & );

  std::string int2str( int );
  std::string dbl2str( double );
  std::string dbl2str( double , int dp );

  bool str2dbl( const std::string & , double * );
  bool str2int( const std::string & , int * );

  // split on any of the characters in 'delim' (max. two); empty fields dropped
  std::vector<std::string> parse( const std::string & item , const std::string & delim = " \t" );

  bool fileExists( const std::string & );
  std::string expand( const std::string & f );

  std::istream& safe_getline( std::istream& is , std::string& t );

  void halt( const std::string & msg );

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      if ( (iss >> f >> t).fail() ) return false;
      // reject trailing junk, e.g. '1.5x'
      iss >> std::ws;
      return iss.eof();
    }
  
}

#endif
