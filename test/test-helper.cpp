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

#include <catch2/catch.hpp>

#include "param.h"
#include "helper/helper.h"
#include "miscmath/crandom.h"
#include "stats/statistics.h"
#include "stats/eigen_ops.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

extern logger_t logger;

TEST_CASE( "param_t parses key=value pairs" , "[param]" )
{
  param_t param;
  param.parse( "nc=3" );
  param.parse( "g=tanh" );
  param.parse( "verbose" );
  param.parse( "expr=a=b" );

  REQUIRE( param.size() == 4 );
  REQUIRE( param.has( "nc" ) );
  REQUIRE_FALSE( param.has( "maxit" ) );
  REQUIRE( param.requires_int( "nc" ) == 3 );
  REQUIRE( param.value( "g" ) == "tanh" );
  REQUIRE( param.value( "g" , true ) == "TANH" );
  REQUIRE( param.yesno( "verbose" ) );
  REQUIRE( param.empty( "verbose" ) );
  REQUIRE_FALSE( param.yesno( "silent" ) );
  REQUIRE( param.value( "expr" ) == "a=b" );
}

TEST_CASE( "param_t appends with key+=value" , "[param]" )
{
  param_t param;
  param.parse( "remove+=1" );
  param.parse( "remove+=3" );

  std::vector<int> r = param.intvector( "remove" );
  REQUIRE( r.size() == 2 );
  REQUIRE( r[0] == 1 );
  REQUIRE( r[1] == 3 );
}

TEST_CASE( "param_t halts on bad or repeated values" , "[param]" )
{
  param_t param;
  param.parse( "nc=three" );
  param.parse( "tol=x" );

  REQUIRE_THROWS_AS( param.requires_int( "nc" ) , std::runtime_error );
  REQUIRE_THROWS_AS( param.requires_dbl( "tol" ) , std::runtime_error );
  REQUIRE_THROWS_AS( param.requires( "maxit" ) , std::runtime_error );
  REQUIRE_THROWS_AS( param.parse( "nc=4" ) , std::runtime_error );
}

TEST_CASE( "string helpers" , "[helper]" )
{
  std::vector<std::string> tok = Helper::parse( "a,b,,c" , "," );
  REQUIRE( tok.size() == 3 );
  REQUIRE( tok[2] == "c" );

  tok = Helper::parse( "a,b,,c" , "," , true );
  REQUIRE( tok.size() == 4 );
  REQUIRE( tok[2] == "." );

  tok = Helper::quoted_parse( "x=\"1 2\" y" , " " );
  REQUIRE( tok.size() == 2 );
  REQUIRE( tok[0] == "x=\"1 2\"" );

  REQUIRE( Helper::iequals( "Gauss" , "GAUSS" ) );
  REQUIRE_FALSE( Helper::iequals( "gauss" , "gaussian" ) );

  double d = 0;
  REQUIRE( Helper::str2dbl( "1e-4" , &d ) );
  REQUIRE( d == Approx( 0.0001 ) );
  REQUIRE_FALSE( Helper::str2dbl( "abc" , &d ) );

  REQUIRE( Helper::yesno( "T" ) );
  REQUIRE_FALSE( Helper::yesno( "0" ) );
  REQUIRE_FALSE( Helper::realnum( std::numeric_limits<double>::quiet_NaN() ) );
}

TEST_CASE( "CRandom streams are reproducible from a seed" , "[random]" )
{
  CRandom r1( 42 ) , r2( 42 ) , r3( 43 );

  bool differ = false;
  for (int i=0; i<100; i++)
    {
      const double a = r1.rand();
      REQUIRE( a == r2.rand() );
      REQUIRE( a > 0 );
      REQUIRE( a < 1 );
      if ( a != r3.rand() ) differ = true;
    }
  REQUIRE( differ );

  // re-seeding restarts the stream
  r1.srand( 7 );
  const double first = r1.rnorm();
  r1.srand( 7 );
  REQUIRE( r1.rnorm() == first );
}

TEST_CASE( "CRandom normal deviates" , "[random]" )
{
  CRandom rng( 1 );
  Eigen::VectorXd x( 20000 );
  for (int i=0; i<x.size(); i++) x[i] = rng.rnorm();

  const double mu = x.mean();
  const double var = ( x.array() - mu ).square().sum() / (double)( x.size() - 1 );

  REQUIRE( mu == Approx( 0 ).margin( 0.05 ) );
  REQUIRE( var == Approx( 1 ).margin( 0.05 ) );
}

TEST_CASE( "normal quantiles" , "[stats]" )
{
  REQUIRE( Statistics::ltqnorm( 0.5 ) == Approx( 0 ).margin( 1e-9 ) );
  REQUIRE( Statistics::ltqnorm( 0.975 ) == Approx( 1.959964 ).epsilon( 1e-6 ) );
}

TEST_CASE( "eigen_ops column scaling" , "[eigen_ops]" )
{
  Eigen::MatrixXd M( 4 , 2 );
  M << 1 , 3 ,
       2 , 3 ,
       3 , 3 ,
       4 , 3 ;

  Eigen::MatrixXd M1 = M;
  REQUIRE_FALSE( eigen_ops::scale( M1 , true , true ) );

  std::vector<int> zeros;
  REQUIRE( eigen_ops::scale( M , true , true , true , &zeros ) );
  REQUIRE( zeros.size() == 1 );
  REQUIRE( zeros[0] == 1 );
  REQUIRE( M.col(0).mean() == Approx( 0 ).margin( 1e-12 ) );
  REQUIRE( std::sqrt( M.col(0).squaredNorm() / 3.0 ) == Approx( 1 ) );
  REQUIRE( M.col(1).cwiseAbs().maxCoeff() == 0 );
}

TEST_CASE( "eigen_ops matrix files" , "[eigen_ops]" )
{
  const std::string f = "sepia-test-matrix.txt";

  Eigen::MatrixXd M( 3 , 2 );
  M << 0.1 , -2.5 ,
       1.0 / 3.0 , 1e-8 ,
       12345.678 , 0 ;

  std::vector<std::string> h = { "CH1" , "CH2" };

  eigen_ops::write_mat( f , M , &h );

  std::vector<std::string> h2;
  Eigen::MatrixXd M2 = eigen_ops::load_mat( f , &h2 );

  std::remove( f.c_str() );

  REQUIRE( h2 == h );
  REQUIRE( M2.rows() == 3 );
  REQUIRE( M2.cols() == 2 );
  REQUIRE( M2 == M );

  REQUIRE_THROWS_AS( eigen_ops::load_mat( "no-such-file.txt" ) , std::runtime_error );
}

static std::string captured;

static void capture_log( const std::string & msg )
{
  captured += msg;
}

TEST_CASE( "logger caching and redirection" , "[logger]" )
{
  logger.on();

  globals::cache_log = true;
  logger << "  ICA of " << 3 << " signals\n";
  Helper::warn( "did not converge" );
  const std::string buf = logger.print_buffer();
  globals::cache_log = false;

  REQUIRE( buf.find( "ICA of 3 signals" ) != std::string::npos );
  REQUIRE( buf.find( " ** warning: did not converge **" ) != std::string::npos );
  REQUIRE( logger.print_buffer() == "" );

  captured = "";
  globals::logger_function = &capture_log;
  logger << "converged";
  Helper::warn( "rank deficient" );
  globals::logger_function = NULL;

  REQUIRE( captured.find( "converged" ) != std::string::npos );
  REQUIRE( captured.find( "rank deficient" ) != std::string::npos );

  logger.off();
}
