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

#include "defs/defs.h"

#include <cstddef>

std::string globals::version = "v0.3.1";
std::string globals::date = "18-Oct-2026";

int globals::retcode = 0;

std::string globals::ic_tag = "IC_";

void (*globals::bail_function) ( const std::string & ) = NULL;
void (*globals::logger_function) ( const std::string & ) = NULL;

bool globals::silent = false;
bool globals::cache_log = false;
bool globals::api_mode = false;
bool globals::bail_on_fail = true;


void globals::api()
{
  silent = true;
  api_mode = true;
}


void globals::init_defs()
{

  //
  // Return code
  //

  retcode = 0;

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  bail_on_fail = true;

  //
  // Optional redirect of logger?
  //

  logger_function = NULL;

  cache_log = false;

  //
  // Output
  //

  silent = false;

  api_mode = false;

  ic_tag = "IC_";

}
