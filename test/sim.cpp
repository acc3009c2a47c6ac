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

#include "test/sim.h"

#include "ica/ica.h"
#include "miscmath/crandom.h"

#include <algorithm>
#include <cmath>

static const double SIM_SR = 500.0;

static const double SIM_PI = 3.14159265358979323846;

Eigen::MatrixXd sim::sine_square( const int m )
{
  Eigen::MatrixXd S( 2 , m );
  for (int i=0; i<m; i++)
    {
      const double t = i / SIM_SR;
      S(0,i) = sin( 2 * SIM_PI * 5 * t );
      S(1,i) = sin( 2 * SIM_PI * 3 * t ) >= 0 ? 1.0 : -1.0;
    }
  return S;
}

Eigen::MatrixXd sim::sine_square_noise( const int m , CRandom & rng )
{
  Eigen::MatrixXd S( 3 , m );
  S.topRows( 2 ) = sine_square( m );
  for (int i=0; i<m; i++) S(2,i) = rng.rnorm();
  return S;
}

Eigen::MatrixXd sim::mixing2()
{
  Eigen::MatrixXd A( 2 , 2 );
  A << 1.0 , 0.5 ,
       0.7 , 1.0 ;
  return A;
}

Eigen::MatrixXd sim::mixing3()
{
  // det = 1
  Eigen::MatrixXd A( 3 , 3 );
  A << 1.0 , 1.0 , 1.0 ,
       0.5 , 2.0 , 1.0 ,
       1.5 , 1.0 , 2.0 ;
  return A;
}

std::vector<double> sim::matched_correlations( const Eigen::MatrixXd & S , const Eigen::MatrixXd & truth )
{

  // k components x r sources
  Eigen::MatrixXd C = ica::cross_correlation( S , truth );

  const int k = C.rows();
  const int r = C.cols();

  // try every assignment of sources to distinct components
  std::vector<int> perm( k );
  for (int i=0; i<k; i++) perm[i] = i;

  std::vector<double> best( r , 0 );
  double best_sum = -1;

  do
    {
      const int nm = std::min( k , r );
      double sum = 0;
      std::vector<double> cur( r , 0 );
      for (int j=0; j<nm; j++)
	{
	  cur[j] = C( perm[j] , j );
	  sum += cur[j];
	}
      if ( sum > best_sum )
	{
	  best_sum = sum;
	  best = cur;
	}
    }
  while ( std::next_permutation( perm.begin() , perm.end() ) );

  return best;
}

double sim::min_matched_correlation( const Eigen::MatrixXd & S , const Eigen::MatrixXd & truth )
{
  std::vector<double> c = matched_correlations( S , truth );
  return *std::min_element( c.begin() , c.end() );
}

double sim::identity_error( const Eigen::MatrixXd & M )
{
  return ( M - Eigen::MatrixXd::Identity( M.rows() , M.cols() ) ).cwiseAbs().maxCoeff();
}
