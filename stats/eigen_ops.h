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

#ifndef __SEPIA_EIGEN_OPS_H__
#define __SEPIA_EIGEN_OPS_H__

#include <Eigen/Dense>
#include <vector>
#include <string>

class CRandom;

namespace eigen_ops {

  // fill with standard normal deviates drawn from 'rng'
  void random_normal( Eigen::MatrixXd & m , CRandom & rng );

  void random_normal( Eigen::VectorXd & v , CRandom & rng );

  // column-wise centering and/or unit-variance scaling; returns F if
  // a column is invariant (unless ignore_invariants, where it is left
  // unscaled and its index optionally recorded in 'zeros')
  bool scale( Eigen::Ref<Eigen::MatrixXd> m , const bool center , const bool normalize ,
	      const bool ignore_invariants = false , std::vector<int> * zeros = NULL );

  // whitespace-delimited text, one row per line; optional header row
  Eigen::MatrixXd load_mat( const std::string & file ,
			    std::vector<std::string> * header = NULL );

  // tab-delimited text
  void write_mat( const std::string & file ,
		  const Eigen::MatrixXd & M ,
		  const std::vector<std::string> * header = NULL );

}

#endif
