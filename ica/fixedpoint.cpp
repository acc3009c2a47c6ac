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

#include "stats/eigen_ops.h"
#include "miscmath/crandom.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>
#include <limits>

extern logger_t logger;


static void check_nc( const int nc , const int n )
{
  if ( nc < 1 || nc > n )
    throw ica_ncomp_error_t( "number of components (" + Helper::int2str( nc )
			     + ") must be between 1 and " + Helper::int2str( n ) );
}

static void progress( const int it )
{
  if ( it % 50 == 0 ) logger << "\n ";
  if ( it % 10 == 0 ) logger << " ";
  logger << ".";
}


Eigen::MatrixXd ica::decorrelate( const Eigen::MatrixXd & B )
{

  // B <- U diag(1/d) U' B,  from B = U D V'

  Eigen::BDCSVD<Eigen::MatrixXd> sB( B , Eigen::ComputeThinU | Eigen::ComputeThinV );

  Eigen::ArrayXd d = sB.singularValues().array();

  // guard against a (numerically) rank-deficient B
  const double dmax = d.size() ? d.maxCoeff() : 0;
  const double floor = std::numeric_limits<double>::epsilon() * ( dmax > 1 ? dmax : 1.0 );
  d = d.max( floor );

  Eigen::VectorXd dinv = d.inverse().matrix();

  return sB.matrixU() * dinv.asDiagonal() * sB.matrixU().transpose() * B;

}


//
// Symmetric (parallel) FastICA: all rows updated together, then
// decorrelated, so B B' = I after every iteration
//

Eigen::MatrixXd ica::symmetric( const Eigen::MatrixXd & Z ,
				const int nc ,
				const ica_nonlinearity_t & nl ,
				const int maxit ,
				const double tol ,
				CRandom & rng ,
				ica_status_t * status ,
				const bool verbose )
{

  const int n = Z.rows();
  const int m = Z.cols();

  check_nc( nc , n );

  //
  // initialize B with random normal values
  //

  Eigen::MatrixXd B( nc , n );

  eigen_ops::random_normal( B , rng );

  B = decorrelate( B );

  logger << "  starting iterations (symmetric FastICA, "
	 << ica::contrast_label( nl.type ) << " approx. to neg-entropy)";

  double lim = 1000;

  int it = 0;

  bool converged = false;

  while ( it < maxit )
    {

      // wx <- B %*% Z
      Eigen::ArrayXXd wx = ( B * Z ).array();

      // v1 <- g(wx) %*% t(Z) / m
      Eigen::MatrixXd v1 = ( nl.g( wx ).matrix() * Z.transpose() ) / (double)m;

      // v2 <- diag( rowmeans( g'(wx) ) ) %*% B
      Eigen::VectorXd dgm = nl.dg( wx ).rowwise().mean().matrix();

      Eigen::MatrixXd B1 = decorrelate( v1 - dgm.asDiagonal() * B );

      // max( | |diag( B1 B' )| - 1 | )
      lim = ( ( B1 * B.transpose() ).diagonal().array().abs() - 1 ).abs().maxCoeff();

      B = B1;

      ++it;

      if ( verbose ) progress( it );

      if ( lim < tol )
	{
	  converged = true;
	  break;
	}
    }

  logger << "\n";

  if ( converged )
    logger << "  converged after " << it << " iterations\n";
  else
    Helper::warn( "FastICA did not converge in " + Helper::int2str( maxit )
		  + " iterations (delta = " + Helper::dbl2str( lim ) + ")" );

  if ( status != NULL )
    {
      status->converged = converged;
      status->iterations = it;
      status->delta = lim;
      status->comp_converged.clear();
      status->comp_iterations.clear();
    }

  return B;

}


//
// Deflationary FastICA: one row at a time, each kept orthogonal
// to those already found (Gram-Schmidt)
//

Eigen::MatrixXd ica::deflation( const Eigen::MatrixXd & Z ,
				const int nc ,
				const ica_nonlinearity_t & nl ,
				const int maxit ,
				const double tol ,
				CRandom & rng ,
				ica_status_t * status ,
				const bool verbose )
{

  const int n = Z.rows();
  const int m = Z.cols();

  check_nc( nc , n );

  Eigen::MatrixXd B = Eigen::MatrixXd::Zero( nc , n );

  std::vector<bool> comp_converged( nc , false );
  std::vector<int>  comp_iterations( nc , 0 );

  double worst = 0;

  logger << "  starting iterations (deflationary FastICA, "
	 << ica::contrast_label( nl.type ) << " approx. to neg-entropy)\n";

  for (int i=0; i<nc; i++)
    {

      Eigen::VectorXd w( n );
      eigen_ops::random_normal( w , rng );
      w /= w.norm();

      double lim = 1000;

      int it = 0;

      while ( it < maxit )
	{

	  Eigen::VectorXd w_old = w;

	  // wx <- w' Z  (1 x m)
	  Eigen::ArrayXXd wx = ( w.transpose() * Z ).array();

	  // w <- mean( g(wx) Z ) - mean( g'(wx) ) w
	  Eigen::VectorXd w1 = ( Z * nl.g( wx ).matrix().transpose() ) / (double)m
	    - nl.dg( wx ).mean() * w;

	  // orthogonalize against previous rows
	  if ( i > 0 )
	    w1 -= B.topRows( i ).transpose() * ( B.topRows( i ) * w1 );

	  double norm = w1.norm();

	  // degenerate update (e.g. g'(0) = 0 on a null direction): restart from a new draw
	  if ( ! ( norm > std::numeric_limits<double>::epsilon() ) )
	    {
	      eigen_ops::random_normal( w1 , rng );
	      if ( i > 0 )
		w1 -= B.topRows( i ).transpose() * ( B.topRows( i ) * w1 );
	      norm = w1.norm();
	    }

	  w = w1 / norm;

	  lim = fabs( fabs( w.dot( w_old ) ) - 1 );

	  ++it;

	  if ( verbose ) progress( it );

	  if ( lim < tol )
	    {
	      comp_converged[i] = true;
	      break;
	    }
	}

      if ( verbose ) logger << "\n";

      comp_iterations[i] = it;

      if ( lim > worst ) worst = lim;

      if ( comp_converged[i] )
	{
	  if ( verbose )
	    logger << "  component " << i+1 << " converged after " << it << " iterations\n";
	}
      else
	Helper::warn( "FastICA component " + Helper::int2str( i+1 )
		      + " did not converge in " + Helper::int2str( maxit ) + " iterations" );

      B.row(i) = w.transpose();

    }

  int total = 0;
  bool converged = true;
  for (int i=0; i<nc; i++)
    {
      total += comp_iterations[i];
      if ( ! comp_converged[i] ) converged = false;
    }

  if ( converged )
    logger << "  all " << nc << " components converged (" << total << " iterations)\n";

  if ( status != NULL )
    {
      status->converged = converged;
      status->iterations = total;
      status->delta = worst;
      status->comp_converged = comp_converged;
      status->comp_iterations = comp_iterations;
    }

  return B;

}
