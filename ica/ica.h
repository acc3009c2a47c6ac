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

#ifndef __SEPIA_ICA_H__
#define __SEPIA_ICA_H__

#include <Eigen/Dense>

#include <stdexcept>
#include <string>
#include <vector>

// FastICA: fixed-point maximization of negentropy (Hyvarinen & Oja, 2000)
//
//  X   N x M   observations (signals x samples)
//  K   N x N   whitening matrix, Z = K ( X - mean )
//  B   k x N   unmixing in whitened space
//  W   k x N   unmixing, W = B K
//  A   N x k   mixing, A = pinv( W )
//  S   k x M   components, S = W ( X - mean )
//
// Components are only identified up to sign and order: callers should
// match them to anything else by (absolute) correlation, never by position.
//
// S is computed from the centered data, i.e.  X ~= A S + mean

struct param_t;
class CRandom;


//
// Errors: all fatal, thrown before any computation
//

struct ica_error_t : public std::runtime_error
{
  explicit ica_error_t( const std::string & msg ) : std::runtime_error( msg ) { }
};

// empty or non-finite input
struct ica_input_error_t : public ica_error_t
{
  explicit ica_input_error_t( const std::string & msg ) : ica_error_t( msg ) { }
};

// fewer samples than signals
struct ica_samples_error_t : public ica_input_error_t
{
  explicit ica_samples_error_t( const std::string & msg ) : ica_input_error_t( msg ) { }
};

// component count (or index) out of range
struct ica_ncomp_error_t : public ica_error_t
{
  explicit ica_ncomp_error_t( const std::string & msg ) : ica_error_t( msg ) { }
};

// bad maxit / tol etc
struct ica_option_error_t : public ica_error_t
{
  explicit ica_option_error_t( const std::string & msg ) : ica_error_t( msg ) { }
};


enum ica_approach_t
  {
    ICA_SYMMETRIC = 0 ,
    ICA_DEFLATION
  };

enum ica_contrast_t
  {
    ICA_CUBIC = 0 ,  // u^3, sub-Gaussian sources
    ICA_TANH ,       // log-cosh, general purpose
    ICA_GAUSS        // robust to outliers
  };


//
// Options
//

struct ica_options_t
{

  ica_options_t();

  // from key=value parameters: approach, nc, g, alpha, maxit, tol (or epsilon), seed, verbose
  explicit ica_options_t( const param_t & param );

  ica_approach_t approach;

  // number of components, 0 means all (N)
  int nc;

  ica_contrast_t contrast;

  // tanh scaling
  double alpha;

  int maxit;

  double tol;

  bool has_seed;

  long unsigned seed;

  // progress dots, per-component messages
  bool verbose;

  // throws ica_option_error_t
  void validate() const;

  std::string describe() const;

};


//
// Non-fatal conditions
//

struct ica_status_t
{

  ica_status_t();

  // NonConvergenceCondition
  bool converged;

  // symmetric: iterations used; deflation: total over components
  int iterations;

  // final convergence statistic (symmetric), or worst over components (deflation)
  double delta;

  // deflation only
  std::vector<bool> comp_converged;
  std::vector<int>  comp_iterations;

  // DegenerateCovarianceCondition
  bool degenerate;

  // number of near-zero eigenvalues
  int n_degenerate;

  // number of negative eigenvalues clamped to zero
  int n_clamped;

  double min_eigenvalue;

  // eigenvalue floor applied before the inverse square root
  double eps;

  bool ok() const { return converged && ! degenerate; }

  std::string describe() const;

};


//
// Preprocessor output
//

struct ica_whitening_t
{

  // whitened data, N x M
  Eigen::MatrixXd Z;

  // whitening (N x N)
  Eigen::MatrixXd K;

  // dewhitening (N x N), the inverse of K
  Eigen::MatrixXd Kinv;

  // per-signal means (N)
  Eigen::VectorXd mean;

  // covariance eigenvalues, descending (after any clamping)
  Eigen::VectorXd eigenvalues;

  // matching eigenvectors (columns)
  Eigen::MatrixXd E;

};


//
// Nonlinearity, g() and its derivative dg(), applied elementwise
//

struct ica_nonlinearity_t
{

  explicit ica_nonlinearity_t( ica_contrast_t type = ICA_TANH , double alpha = 1.0 );

  Eigen::ArrayXXd g( const Eigen::ArrayXXd & u ) const;

  Eigen::ArrayXXd dg( const Eigen::ArrayXXd & u ) const;

  double g( const double u ) const;

  double dg( const double u ) const;

  // the contrast actually in use (i.e. after any fallback)
  ica_contrast_t type;

  double alpha;

};


//
// Results
//

struct ica_result_t
{

  // k x N unmixing
  Eigen::MatrixXd W;

  // N x k mixing
  Eigen::MatrixXd A;

  // k x M components
  Eigen::MatrixXd S;

  // N x N whitening and dewhitening
  Eigen::MatrixXd K;
  Eigen::MatrixXd Kinv;

  // k x N unmixing in whitened space
  Eigen::MatrixXd B;

  // per-signal means, N
  Eigen::VectorXd mean;

  ica_status_t status;

  int nc() const { return W.rows(); }

};


namespace ica {

  //
  // Primary interface
  //

  // seeded from opt.seed (if given) or the clock
  ica_result_t run( const Eigen::MatrixXd & X , const ica_options_t & opt );

  // with an explicit random source
  ica_result_t run( const Eigen::MatrixXd & X , const ica_options_t & opt , CRandom & rng );

  // throws ica_input_error_t / ica_samples_error_t
  void check_input( const Eigen::MatrixXd & X );


  //
  // Stages
  //

  // centering and whitening
  ica_whitening_t whiten( const Eigen::MatrixXd & X , ica_status_t * status = NULL );

  // contrast by name: pow3/cubic, tanh, gauss/gaussian; anything else gives tanh
  ica_contrast_t contrast_type( const std::string & s );

  std::string contrast_label( ica_contrast_t t );

  // symmetric decorrelation, B <- ( B B' )^-1/2 B
  Eigen::MatrixXd decorrelate( const Eigen::MatrixXd & B );

  // fixed-point optimizers, returning k x N unmixing in whitened space
  //
  // with a degenerate covariance (status.degenerate) the near-null whitened
  // directions carry no signal, and symmetric mode with nc = N (notably pow3)
  // may never converge: ask for at most N - n_degenerate components, or deflate
  Eigen::MatrixXd symmetric( const Eigen::MatrixXd & Z ,
			     const int nc ,
			     const ica_nonlinearity_t & nl ,
			     const int maxit ,
			     const double tol ,
			     CRandom & rng ,
			     ica_status_t * status = NULL ,
			     const bool verbose = false );

  Eigen::MatrixXd deflation( const Eigen::MatrixXd & Z ,
			     const int nc ,
			     const ica_nonlinearity_t & nl ,
			     const int maxit ,
			     const double tol ,
			     CRandom & rng ,
			     ica_status_t * status = NULL ,
			     const bool verbose = false );

  // W, A and S from whitened-space B
  void assemble( const Eigen::MatrixXd & B ,
		 const ica_whitening_t & white ,
		 const Eigen::MatrixXd & X ,
		 ica_result_t * res );


  //
  // Epoched data (each epoch N x M_e)
  //

  ica_result_t run_epochs( const std::vector<Eigen::MatrixXd> & epochs , const ica_options_t & opt );

  ica_result_t run_epochs( const std::vector<Eigen::MatrixXd> & epochs , const ica_options_t & opt , CRandom & rng );

  Eigen::MatrixXd concatenate( const std::vector<Eigen::MatrixXd> & epochs , std::vector<int> * lengths = NULL );

  std::vector<Eigen::MatrixXd> split_epochs( const Eigen::MatrixXd & S , const std::vector<int> & lengths );


  //
  // Component removal, correlation criteria
  //

  // subtract the listed (0-based) components from X (N x M', same channels
  // as the decomposition):  X - A[,drop] S[drop,],  with S = W ( X - mean )
  Eigen::MatrixXd remove( const ica_result_t & res , const Eigen::MatrixXd & X , const std::vector<int> & drop );

  // | corr | between rows of S (k x M) and rows of T (r x M), k x r
  Eigen::MatrixXd cross_correlation( const Eigen::MatrixXd & S , const Eigen::MatrixXd & T );

  // components with | corr | > th against any row of ref
  std::vector<int> correlated( const Eigen::MatrixXd & S , const Eigen::MatrixXd & ref , const double th );

}

#endif
