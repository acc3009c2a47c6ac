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

#include "ica/ica-wrapper.h"
#include "ica/ica.h"
#include "param.h"
#include "helper/helper.h"
#include "stats/eigen_ops.h"
#include "test/sim.h"

#include <cstdio>
#include <fstream>

TEST_CASE( "text-file driven decomposition" , "[wrapper]" )
{

  const std::string data = "sepia-test-data.txt";
  const std::string prefix = "sepia-test-";
  const std::string along = "sepia-test-long.txt";
  const std::string out = "sepia-test-clean.txt";

  // samples x channels, with a header
  Eigen::MatrixXd X = sim::mixing2() * sim::sine_square( 1000 );
  std::vector<std::string> labels = { "C3" , "C4" };
  eigen_ops::write_mat( data , X.transpose() , &labels );

  param_t param;
  param.add( "data" , data );
  param.parse( "header" );
  param.parse( "seed=5" );
  param.parse( "file=" + prefix );
  param.parse( "A=" + along );
  param.parse( "remove=1" );
  param.parse( "out=" + out );

  REQUIRE_NOTHROW( ica::wrapper( param ) );

  std::vector<std::string> h;

  Eigen::MatrixXd W = eigen_ops::load_mat( prefix + "W" , &h );
  REQUIRE( h == labels );
  REQUIRE( W.rows() == 2 );
  REQUIRE( W.cols() == 2 );

  Eigen::MatrixXd S = eigen_ops::load_mat( prefix + "S" , &h );
  REQUIRE( h.size() == 2 );
  REQUIRE( h[0] == "IC_1" );
  REQUIRE( S.rows() == 1000 );

  Eigen::MatrixXd A = eigen_ops::load_mat( prefix + "A" , &h );
  REQUIRE( sim::identity_error( W * A ) < 1e-8 );

  Eigen::MatrixXd K = eigen_ops::load_mat( prefix + "K" , &h );
  REQUIRE( K.rows() == 2 );

  // long format: header plus one row per component/channel pair
  std::ifstream IN1( along.c_str() , std::ios::in );
  int lines = 0;
  std::string line;
  while ( ! IN1.eof() )
    {
      Helper::safe_getline( IN1 , line );
      if ( line != "" ) ++lines;
    }
  IN1.close();
  REQUIRE( lines == 1 + 2 * 2 );

  Eigen::MatrixXd C = eigen_ops::load_mat( out , &h );
  REQUIRE( h == labels );
  REQUIRE( C.rows() == 1000 );
  REQUIRE( C.cols() == 2 );

  // one component removed: the cleaned channels are perfectly correlated
  Eigen::MatrixXd Ct = C.transpose();
  Eigen::MatrixXd r = ica::cross_correlation( Ct.topRows( 1 ) , Ct.bottomRows( 1 ) );
  REQUIRE( r(0,0) == Approx( 1 ).margin( 1e-6 ) );

  std::remove( data.c_str() );
  std::remove( along.c_str() );
  std::remove( out.c_str() );
  std::remove( ( prefix + "W" ).c_str() );
  std::remove( ( prefix + "A" ).c_str() );
  std::remove( ( prefix + "S" ).c_str() );
  std::remove( ( prefix + "K" ).c_str() );
}

TEST_CASE( "wrapper reports bad options as ICA errors" , "[wrapper]" )
{
  const std::string data = "sepia-test-data2.txt";

  Eigen::MatrixXd X = sim::mixing2() * sim::sine_square( 200 );
  eigen_ops::write_mat( data , X.transpose() );

  param_t param;
  param.add( "data" , data );
  param.parse( "nc=3" );

  REQUIRE_THROWS_AS( ica::wrapper( param ) , ica_ncomp_error_t );

  std::remove( data.c_str() );
}
