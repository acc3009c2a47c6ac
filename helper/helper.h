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

#ifndef __SEPIA_HELPER_H__
#define __SEPIA_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Helper
{

  std::string toupper( const std::string & );

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    return s.substr(a,s.size()-a-b);
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );

  bool yesno( const std::string & );

  // case insenstive string comparison
  bool iequals(const std::string& a, const std::string& b);

  bool fileExists(const std::string &);
  std::string expand( const std::string & f );

  std::istream& safe_getline(std::istream& is, std::string& t);

  void halt( const std::string & msg );
  void warn( const std::string & msg );
  bool realnum(double d);

  std::string int2str(int n);
  std::string dbl2str(double n);

  // split on any of the characters in 's'
  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t" , bool empty = false );

  // as above, but do not split within quotes (either " or q)
  std::vector<std::string> quoted_parse(const std::string & item , const std::string & s = " \t" , const char q = '"' , bool empty = false );

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      return !(iss >> f >> t).fail();
    }

  bool str2dbl(const std::string & , double * );
  bool str2int(const std::string & , int * );

}

#endif
