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

#include "stats/eigen_ops.h"

#include "miscmath/crandom.h"
#include "helper/helper.h"

#include <fstream>
#include <iomanip>
#include <limits>

void eigen_ops::random_normal( Eigen::MatrixXd & M , CRandom & rng )
{
  const int rows = M.rows();
  const int cols = M.cols();
  for (int r = 0 ; r < rows ; r++ )
    for (int c = 0 ; c < cols ; c++)
      M(r,c) = rng.rnorm();
}

void eigen_ops::random_normal( Eigen::VectorXd & v , CRandom & rng )
{
  const int n = v.size();
  for (int i = 0 ; i < n ; i++ )
    v[i] = rng.rnorm();
}


bool eigen_ops::scale( Eigen::Ref<Eigen::MatrixXd> M , const bool center , const bool normalize ,
		       const bool ignore_invariants , std::vector<int> * zeros )
{

  if ( ! ( center || normalize ) ) return true;

  const int N = M.rows();

  Eigen::Array<double, 1, Eigen::Dynamic> means = M.colwise().mean();

  if ( normalize )
    {
      Eigen::Array<double, 1, Eigen::Dynamic> sds = ((M.array().rowwise() - means ).square().colwise().sum()/(N-1)).sqrt();

      for (int i=0;i<sds.size();i++)
       	if ( sds[i] == 0 )
	  {
	    if ( ! ignore_invariants )
	      return false;
	    if ( zeros != NULL )
	      zeros->push_back( i );
	    sds[i] = 1.0; // make harmless
	  }

      if ( center )
	M.array().rowwise() -= means;
      M.array().rowwise() /= sds;
    }
  else
    {
      M.array().rowwise() -= means;
    }

  return true;
}


Eigen::MatrixXd eigen_ops::load_mat( const std::string & f ,
				     std::vector<std::string> * header )
{

  std::string filename = Helper::expand( f );
  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not load " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  int ncols = 0;

  // header row?
  if ( header )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      std::vector<std::string> tok = Helper::parse( line , "\t " );
      ncols = tok.size();
      *header = tok;
    }

  //
  // data
  //

  std::vector<double> d;
  int nrows = 0;

  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.bad() ) break;
      if ( line == "" )
	{
	  if ( IN1.eof() ) break;
	  continue;
	}

      std::vector<std::string> tok = Helper::parse( line , "\t " );

      // skip whitespace-only lines
      if ( tok.size() == 0 ) continue;

      // check size
      if ( ncols != 0 )
	{
	  if ( tok.size() != ncols )
	    Helper::halt( "bad number of columns:\n" + line );
	}
      else
	{
	  ncols = tok.size();
	}

      for (int i=0;i<ncols;i++)
	{
	  double x;
	  if ( ! Helper::str2dbl( tok[i] , &x ) )
	    Helper::halt( "problem converting to a numeric: " + tok[i] );
	  d.push_back( x );
	}

      // next row
      ++nrows;
    }

  IN1.close();

  if ( d.size() != nrows * ncols )
    Helper::halt( "internal error in load_mat()" );

  // create and return Eigen matrix
  Eigen::MatrixXd X = Eigen::MatrixXd::Zero( nrows , ncols );
  int p = 0;
  for (int i=0; i<nrows; i++)
    for (int j=0; j<ncols; j++)
      X(i,j) = d[p++];

  return X;
}


void eigen_ops::write_mat( const std::string & f ,
			   const Eigen::MatrixXd & M ,
			   const std::vector<std::string> * header )
{

  std::ofstream O1( Helper::expand( f ).c_str() , std::ios::out );

  if ( ! O1.good() )
    Helper::halt( "could not open " + f + " for writing" );

  // full precision, so values read back are identical
  O1 << std::setprecision( std::numeric_limits<double>::max_digits10 );

  const int rows = M.rows();
  const int cols = M.cols();

  if ( header )
    {
      if ( header->size() != cols )
	Helper::halt( "internal error in write_mat(), header/column mismatch" );
      for (int j=0;j<cols;j++) O1 << ( j ? "\t" : "" ) << (*header)[j];
      O1 << "\n";
    }

  for (int i=0;i<rows;i++)
    {
      for (int j=0;j<cols;j++) O1 << ( j ? "\t" : "" ) << M(i,j);
      O1 << "\n";
    }

  O1.close();

}
