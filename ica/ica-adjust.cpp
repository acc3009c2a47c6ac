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

#include <set>

extern logger_t logger;


//
// Epoched data: concatenate along samples, decompose once
//

Eigen::MatrixXd ica::concatenate( const std::vector<Eigen::MatrixXd> & epochs , std::vector<int> * lengths )
{

  const int ne = epochs.size();

  if ( ne == 0 )
    throw ica_input_error_t( "no epochs" );

  const int n = epochs[0].rows();

  int total = 0;
  for (int e=0; e<ne; e++)
    {
      if ( epochs[e].rows() != n )
	throw ica_input_error_t( "epoch " + Helper::int2str( e+1 ) + " has "
				 + Helper::int2str( (int)epochs[e].rows() ) + " signals, expecting "
				 + Helper::int2str( n ) );
      if ( epochs[e].cols() == 0 )
	throw ica_input_error_t( "epoch " + Helper::int2str( e+1 ) + " is empty" );
      total += epochs[e].cols();
    }

  if ( lengths != NULL ) lengths->resize( ne );

  Eigen::MatrixXd X( n , total );

  int p = 0;
  for (int e=0; e<ne; e++)
    {
      const int m = epochs[e].cols();
      X.block( 0 , p , n , m ) = epochs[e];
      if ( lengths != NULL ) (*lengths)[e] = m;
      p += m;
    }

  return X;
}


std::vector<Eigen::MatrixXd> ica::split_epochs( const Eigen::MatrixXd & S , const std::vector<int> & lengths )
{

  int total = 0;
  for (int e=0; e<lengths.size(); e++)
    {
      if ( lengths[e] < 1 )
	throw ica_input_error_t( "bad epoch length in split_epochs()" );
      total += lengths[e];
    }

  if ( total != S.cols() )
    throw ica_input_error_t( "epoch lengths sum to " + Helper::int2str( total )
			     + " but have " + Helper::int2str( (int)S.cols() ) + " samples" );

  std::vector<Eigen::MatrixXd> r( lengths.size() );

  int p = 0;
  for (int e=0; e<lengths.size(); e++)
    {
      r[e] = S.block( 0 , p , S.rows() , lengths[e] );
      p += lengths[e];
    }

  return r;
}


ica_result_t ica::run_epochs( const std::vector<Eigen::MatrixXd> & epochs , const ica_options_t & opt )
{
  if ( opt.has_seed )
    {
      CRandom rng( opt.seed );
      return run_epochs( epochs , opt , rng );
    }

  CRandom rng;
  return run_epochs( epochs , opt , rng );
}


ica_result_t ica::run_epochs( const std::vector<Eigen::MatrixXd> & epochs , const ica_options_t & opt , CRandom & rng )
{
  Eigen::MatrixXd X = concatenate( epochs );
  logger << "  concatenated " << epochs.size() << " epochs for ICA\n";
  return run( X , opt , rng );
}


//
// Remove components:  X <- X - A[,drop] S[drop,]
//

Eigen::MatrixXd ica::remove( const ica_result_t & res , const Eigen::MatrixXd & X , const std::vector<int> & drop )
{

  const int n = res.A.rows();
  const int nc = res.A.cols();

  if ( X.rows() != n )
    throw ica_input_error_t( "data has " + Helper::int2str( (int)X.rows() )
			     + " signals, decomposition has " + Helper::int2str( n ) );

  if ( ! X.allFinite() )
    throw ica_input_error_t( "data contains non-finite values (NaN or Inf)" );

  std::set<int> uniq;
  for (int i=0; i<drop.size(); i++)
    {
      if ( drop[i] < 0 || drop[i] >= nc )
	throw ica_ncomp_error_t( "component " + Helper::int2str( drop[i]+1 )
				 + " out of range, only " + Helper::int2str( nc ) + " components" );
      uniq.insert( drop[i] );
    }

  Eigen::MatrixXd R = X;

  if ( uniq.size() == 0 ) return R;

  // component time courses for these data
  Eigen::MatrixXd S = res.W * ( X.colwise() - res.mean );

  std::set<int>::const_iterator ii = uniq.begin();
  while ( ii != uniq.end() )
    {
      R -= res.A.col( *ii ) * S.row( *ii );
      ++ii;
    }

  logger << "  removed " << uniq.size() << " of " << nc << " components\n";

  return R;
}


//
// Correlations between components and other signals
//

Eigen::MatrixXd ica::cross_correlation( const Eigen::MatrixXd & S , const Eigen::MatrixXd & T )
{

  const int m = S.cols();

  if ( T.cols() != m )
    throw ica_input_error_t( "cross_correlation() requires the same number of samples" );

  if ( m < 2 )
    throw ica_samples_error_t( "cross_correlation() requires at least two samples" );

  // samples x series, standardized; invariant series give zero correlations
  Eigen::MatrixXd Sc = S.transpose();
  Eigen::MatrixXd Tc = T.transpose();

  std::vector<int> zs, zt;
  eigen_ops::scale( Sc , true , true , true , &zs );
  eigen_ops::scale( Tc , true , true , true , &zt );

  for (int i=0; i<zs.size(); i++) Sc.col( zs[i] ).setZero();
  for (int i=0; i<zt.size(); i++) Tc.col( zt[i] ).setZero();

  Eigen::MatrixXd C = ( Sc.transpose() * Tc ) / (double)( m - 1 );

  return C.array().abs().matrix();
}


std::vector<int> ica::correlated( const Eigen::MatrixXd & S , const Eigen::MatrixXd & ref , const double th )
{

  Eigen::MatrixXd C = cross_correlation( S , ref );

  std::vector<int> r;

  for (int i=0; i<C.rows(); i++)
    for (int j=0; j<C.cols(); j++)
      if ( C(i,j) > th )
	{
	  logger << "   including component " << i+1 << " based on its absolute correlation with reference "
		 << j+1 << ", r = " << C(i,j) << "\n";
	  r.push_back( i );
	  break;
	}

  return r;
}
