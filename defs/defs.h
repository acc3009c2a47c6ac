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

#ifndef __SEPIA_DEFS_H__
#define __SEPIA_DEFS_H__

#include <string>

struct globals
{

  static std::string version;
  static std::string date;

  // return code for the command-line tool
  static int retcode;

  // label prefix for components, i.e. IC_1, IC_2, ...
  static std::string ic_tag;

  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // redirect all logger output to this function
  static void (*logger_function) ( const std::string & msg );

  // no console output
  static bool silent;

  // keep a copy of log output, see logger_t::print_buffer()
  static bool cache_log;

  // running as a library (no banners, no log files)
  static bool api_mode;

  // exit() after halt() [ if no bail_function, or it returns ]
  static bool bail_on_fail;

  // global functions: primary initiation of all globals
  void init_defs();

  // modes
  void api();

};

#endif
