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

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "defs/defs.h"
#include "helper/logger.h"

#include <stdexcept>
#include <string>

extern globals global;

extern logger_t logger;

// halt() throws rather than exits, so that tests can check for it
static void test_bail_function( const std::string & msg )
{
  throw std::runtime_error( msg );
}

int main( int argc , char * argv[] )
{

  global.init_defs();

  globals::silent = true;

  globals::bail_function = &test_bail_function;

  globals::bail_on_fail = false;

  logger.off();

  return Catch::Session().run( argc , argv );

}
