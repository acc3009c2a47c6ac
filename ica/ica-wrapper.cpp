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

#include "ica/ica-wrapper.h"

#include "ica/ica.h"
#include "param.h"
#include "stats/eigen_ops.h"
#include "miscmath/crandom.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <fstream>
#include <set>

extern logger_t logger;

void ica::wrapper( param_t & param )
{

  std::string datafile = param.requires( "data" );

  const bool has_header = param.yesno( "header" );

  std::string component_tag = param.has( "tag" ) ? param.value( "tag" ) : globals::ic_tag;

  bool write_matrix = param.has( "file" );

  std::string matrix_fileroot = write_matrix ? param.value( "file" ) : "xxx";

  bool write_long = param.has( "A" );

  //
  // Fetch sample matrix: rows are samples, columns are channels
  //

  std::vector<std::string> labels;

  Eigen::MatrixXd D = eigen_ops::load_mat( datafile , has_header ? &labels : NULL );

  const int ns = D.cols();

  if ( ! has_header )
    {
      labels.resize( ns );
      for (int i=0; i<ns; i++) labels[i] = "CH" + Helper::int2str( i+1 );
    }

  logger << "  read " << D.rows() << " samples for " << ns << " channels from " << datafile << "\n";

  // signals x samples
  Eigen::MatrixXd X = D.transpose();

  //
  // ICA
  //

  ica_options_t opt( param );

  ica_result_t res = ica::run( X , opt );

  const int nc = res.nc();

  logger << "  " << res.status.describe() << "\n";

  std::vector<std::string> ics( nc );
  for (int c=0; c<nc; c++) ics[c] = component_tag + Helper::int2str( c+1 );

  //
  // File-based output
  //

  if ( write_matrix )
    {

      // W : nc x ns
      eigen_ops::write_mat( matrix_fileroot + "W" , res.W , &labels );

      // A : ns x nc
      eigen_ops::write_mat( matrix_fileroot + "A" , res.A , &ics );

      // S : samples x nc
      eigen_ops::write_mat( matrix_fileroot + "S" , res.S.transpose() , &ics );

      // K : ns x ns
      eigen_ops::write_mat( matrix_fileroot + "K" , res.K , &labels );

      logger << "  wrote W, A, S and K matrices to " << matrix_fileroot << "{W,A,S,K}\n";
    }

  //
  // Mixing matrix, long format
  //

  if ( write_long )
    {
      const std::string Aout = param.value( "A" );

      std::ofstream O1( Helper::expand( Aout ).c_str() , std::ios::out );

      if ( ! O1.good() )
	Helper::halt( "could not open " + Aout + " for writing" );

      O1 << "IC\tCH\tA\n";

      for (int c=0; c<nc; c++)
	for (int j=0; j<ns; j++)
	  O1 << ics[c] << "\t" << labels[j] << "\t" << res.A(j,c) << "\n";

      O1.close();

      logger << "  wrote mixing matrix to " << Aout << "\n";
    }

  //
  // Components to remove: explicit, or by correlation with reference signals
  //

  std::set<int> drop;

  if ( param.has( "remove" ) )
    {
      std::vector<int> r = param.intvector( "remove" );
      for (int i=0; i<r.size(); i++) drop.insert( r[i] - 1 );
    }

  if ( param.has( "corr-sig" ) )
    {
      const double th = param.has( "corr-th" ) ? param.requires_dbl( "corr-th" ) : 0.5;

      std::vector<std::string> reflabels;

      Eigen::MatrixXd R = eigen_ops::load_mat( param.value( "corr-sig" ) , has_header ? &reflabels : NULL );

      if ( R.rows() != X.cols() )
	Helper::halt( "corr-sig has " + Helper::int2str( (int)R.rows() )
		      + " samples, expecting " + Helper::int2str( (int)X.cols() ) );

      std::vector<int> r = ica::correlated( res.S , R.transpose() , th );

      logger << "  " << r.size() << " component(s) with |r| > " << th << " against corr-sig\n";

      for (int i=0; i<r.size(); i++) drop.insert( r[i] );
    }

  if ( drop.size() != 0 || param.has( "out" ) )
    {

      std::string outfile = param.requires( "out" );

      std::vector<int> d( drop.begin() , drop.end() );

      Eigen::MatrixXd C = ica::remove( res , X , d );

      if ( d.size() )
	{
	  logger << "  removed component(s):";
	  for (int i=0; i<d.size(); i++) logger << " " << ics[ d[i] ];
	  logger << "\n";
	}

      eigen_ops::write_mat( outfile , C.transpose() , has_header ? &labels : NULL );

      logger << "  wrote cleaned signals to " << outfile << "\n";
    }

}
