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

#include "param.h"
#include "miscmath/crandom.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>
#include <sstream>

extern logger_t logger;


//
// ica_options_t
//

ica_options_t::ica_options_t()
  : approach( ICA_SYMMETRIC ) ,
    nc( 0 ) ,
    contrast( ICA_TANH ) ,
    alpha( 1.0 ) ,
    maxit( 1000 ) ,
    tol( 0.0001 ) ,
    has_seed( false ) ,
    seed( 0 ) ,
    verbose( false )
{
}


ica_options_t::ica_options_t( const param_t & param )
  : ica_options_t()
{

  if ( param.has( "approach" ) )
    {
      const std::string a = param.value( "approach" );
      if ( Helper::iequals( a , "symm" ) || Helper::iequals( a , "symmetric" ) || Helper::iequals( a , "parallel" ) )
	approach = ICA_SYMMETRIC;
      else if ( Helper::iequals( a , "defl" ) || Helper::iequals( a , "deflation" ) )
	approach = ICA_DEFLATION;
      else
	throw ica_option_error_t( "approach should be symm or defl, not " + a );
    }

  if ( param.has( "nc" ) )
    nc = param.requires_int( "nc" );

  if ( param.has( "g" ) )
    {
      const std::string g = param.value( "g" );
      contrast = ica::contrast_type( g );
      if ( ! Helper::iequals( g , ica::contrast_label( contrast ) ) )
	logger << "  using " << ica::contrast_label( contrast ) << " contrast for g=" << g << "\n";
    }

  if ( param.has( "alpha" ) )
    alpha = param.requires_dbl( "alpha" );

  if ( param.has( "maxit" ) )
    maxit = param.requires_int( "maxit" );

  if ( param.has( "tol" ) )
    tol = param.requires_dbl( "tol" );
  else if ( param.has( "epsilon" ) )
    tol = param.requires_dbl( "epsilon" );

  if ( param.has( "seed" ) )
    {
      // full unsigned long range, not just int
      const std::string v = param.value( "seed" );
      long unsigned s = 0;
      if ( v.empty() || v.find_first_not_of( "0123456789" ) != std::string::npos
	   || ! Helper::from_string<long unsigned>( s , v , std::dec ) )
	throw ica_option_error_t( "seed should be a non-negative integer: " + v );
      has_seed = true;
      seed = s;
    }

  verbose = param.yesno( "verbose" );

}


void ica_options_t::validate() const
{

  if ( nc < 0 )
    throw ica_ncomp_error_t( "number of components cannot be negative" );

  if ( maxit < 1 )
    throw ica_option_error_t( "maxit should be a positive integer" );

  if ( ! ( tol > 0 ) || ! Helper::realnum( tol ) )
    throw ica_option_error_t( "tol should be a positive number" );

  if ( ! ( alpha > 0 ) || ! Helper::realnum( alpha ) )
    throw ica_option_error_t( "alpha should be a positive number" );

}


std::string ica_options_t::describe() const
{
  std::stringstream ss;
  ss << "approach=" << ( approach == ICA_DEFLATION ? "defl" : "symm" )
     << " nc=" << ( nc == 0 ? std::string( "all" ) : Helper::int2str( nc ) )
     << " g=" << ica::contrast_label( contrast );
  if ( contrast == ICA_TANH ) ss << " alpha=" << alpha;
  ss << " maxit=" << maxit
     << " tol=" << tol;
  if ( has_seed ) ss << " seed=" << seed;
  return ss.str();
}


//
// ica_status_t
//

ica_status_t::ica_status_t()
  : converged( true ) ,
    iterations( 0 ) ,
    delta( 0 ) ,
    degenerate( false ) ,
    n_degenerate( 0 ) ,
    n_clamped( 0 ) ,
    min_eigenvalue( 0 ) ,
    eps( 0 )
{
}


std::string ica_status_t::describe() const
{
  std::stringstream ss;

  if ( converged )
    ss << "converged (" << iterations << " iterations)";
  else
    {
      ss << "did not converge (" << iterations << " iterations, delta = " << delta << ")";
      int nf = 0;
      for (int i=0; i<comp_converged.size(); i++)
	if ( ! comp_converged[i] ) ++nf;
      if ( nf ) ss << ", " << nf << " of " << comp_converged.size() << " components unconverged";
    }

  if ( degenerate )
    ss << "; degenerate covariance (" << n_degenerate << " near-zero eigenvalues)";

  return ss.str();
}


//
// Primary interface
//

ica_result_t ica::run( const Eigen::MatrixXd & X , const ica_options_t & opt )
{
  if ( opt.has_seed )
    {
      CRandom rng( opt.seed );
      return run( X , opt , rng );
    }

  CRandom rng;
  return run( X , opt , rng );
}


ica_result_t ica::run( const Eigen::MatrixXd & X , const ica_options_t & opt , CRandom & rng )
{

  //
  // fatal errors: before anything else
  //

  opt.validate();

  check_input( X );

  const int n = X.rows();
  const int m = X.cols();

  const int nc = opt.nc == 0 ? n : opt.nc;

  if ( nc < 1 || nc > n )
    throw ica_ncomp_error_t( "number of components (" + Helper::int2str( nc )
			     + ") must be between 1 and " + Helper::int2str( n ) );

  logger << "  ICA of " << n << " signals x " << m << " samples, extracting "
	 << nc << " component" << ( nc == 1 ? "" : "s" ) << "\n"
	 << "  options: " << opt.describe() << "\n";

  ica_result_t res;

  //
  // centering, whitening
  //

  ica_whitening_t white = whiten( X , &res.status );

  //
  // fixed-point iterations
  //

  ica_nonlinearity_t nl( opt.contrast , opt.alpha );

  Eigen::MatrixXd B = opt.approach == ICA_DEFLATION
    ? deflation( white.Z , nc , nl , opt.maxit , opt.tol , rng , &res.status , opt.verbose )
    : symmetric( white.Z , nc , nl , opt.maxit , opt.tol , rng , &res.status , opt.verbose );

  //
  // back to signal space
  //

  assemble( B , white , X , &res );

  return res;

}


void ica::assemble( const Eigen::MatrixXd & B ,
		    const ica_whitening_t & white ,
		    const Eigen::MatrixXd & X ,
		    ica_result_t * res )
{

  if ( B.cols() != white.K.rows() || X.rows() != white.K.cols() )
    throw ica_input_error_t( "internal error in ica::assemble(), dimension mismatch" );

  res->B = B;
  res->K = white.K;
  res->Kinv = white.Kinv;
  res->mean = white.mean;

  // W <- B %*% K
  res->W = B * white.K;

  // A <- pinv( W )
  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod( res->W );
  res->A = cod.pseudoInverse();

  // S <- W %*% ( X - mean )
  res->S = res->W * ( X.colwise() - white.mean );

}
