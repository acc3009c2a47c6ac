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

#include "ica/ica.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <algorithm>
#include <vector>

extern logger_t logger;

// eigenvalue floor, relative to the largest eigenvalue (if > 1)
static const double ICA_EIGEN_FLOOR = 1e-12;

// eigenvalues below this fraction of the largest are flagged as degenerate
static const double ICA_DEGENERATE_TOL = 1e-10;


void ica::check_input( const Eigen::MatrixXd & X )
{

  const int n = X.rows();
  const int m = X.cols();

  if ( n == 0 || m == 0 )
    throw ica_input_error_t( "empty observation matrix" );

  if ( ! X.allFinite() )
    throw ica_input_error_t( "observation matrix contains non-finite values (NaN or Inf)" );

  if ( m < n )
    throw ica_samples_error_t( "fewer samples (" + Helper::int2str( m )
			       + ") than signals (" + Helper::int2str( n ) + ")" );

  if ( m < 2 )
    throw ica_samples_error_t( "requires at least two samples" );

}


ica_whitening_t ica::whiten( const Eigen::MatrixXd & X , ica_status_t * status )
{

  check_input( X );

  const int n = X.rows();
  const int m = X.cols();

  ica_whitening_t white;

  //
  // Centering (on a copy)
  //

  white.mean = X.rowwise().mean();

  Eigen::MatrixXd Xc = X.colwise() - white.mean;

  //
  // Covariance, Xc Xc' / (m-1)
  //

  Eigen::MatrixXd V = ( Xc * Xc.transpose() ) / (double)( m - 1 );

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es( V );

  if ( es.info() != Eigen::Success )
    throw ica_input_error_t( "eigenvalue decomposition failed in whitening step" );

  //
  // Eigen returns eigenvalues in ascending order, we want descending;
  // stable, so tied eigenvalues keep the solver's order
  //

  const Eigen::VectorXd & d0 = es.eigenvalues();

  std::vector<int> order( n );
  for (int i=0; i<n; i++) order[i] = i;

  std::stable_sort( order.begin() , order.end() ,
		    [&d0]( int a , int b ) { return d0[a] > d0[b]; } );

  white.eigenvalues.resize( n );
  white.E.resize( n , n );

  int n_clamped = 0;

  for (int i=0; i<n; i++)
    {
      double l = d0[ order[i] ];
      // not a true covariance if this happens, i.e. round-off
      if ( l < 0 )
	{
	  l = 0;
	  ++n_clamped;
	}
      white.eigenvalues[i] = l;
      white.E.col(i) = es.eigenvectors().col( order[i] );
    }

  const double lmax = white.eigenvalues[0];

  const double eps = ICA_EIGEN_FLOOR * ( lmax > 1 ? lmax : 1.0 );

  const double dtol = ICA_DEGENERATE_TOL * lmax;

  int n_degenerate = 0;
  for (int i=0; i<n; i++)
    if ( white.eigenvalues[i] <= dtol ) ++n_degenerate;

  //
  // K = diag( 1/sqrt(d+eps) ) E'
  //

  Eigen::VectorXd sd = ( white.eigenvalues.array() + eps ).sqrt().matrix();

  Eigen::VectorXd isd = sd.cwiseInverse();

  white.K = isd.asDiagonal() * white.E.transpose();

  white.Kinv = white.E * sd.asDiagonal();

  white.Z = white.K * Xc;

  //
  // Report
  //

  if ( n_clamped )
    Helper::warn( Helper::int2str( n_clamped ) + " negative covariance eigenvalue(s) set to zero" );

  if ( n_degenerate )
    Helper::warn( Helper::int2str( n_degenerate ) + " near-zero covariance eigenvalue(s), input is rank deficient" );

  if ( status != NULL )
    {
      status->degenerate = n_degenerate > 0;
      status->n_degenerate = n_degenerate;
      status->n_clamped = n_clamped;
      status->min_eigenvalue = white.eigenvalues[ n - 1 ];
      status->eps = eps;
    }

  return white;
}
