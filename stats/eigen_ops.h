
//    --------------------------------------------------------------------
//
//    This file is part of NNICA.
//
//    NNICA is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    NNICA is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with NNICA. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __NNICA_EIGEN_OPS_H__
#define __NNICA_EIGEN_OPS_H__

#include <Eigen/Dense>
#include <string>

namespace eigen_ops { 
  
  // column-wise centering / standardization
  bool scale( Eigen::Ref<Eigen::MatrixXd> m , const bool center , const bool normalize );  

  // M^p for a symmetric positive-definite M, via its eigendecomposition;
  // false if singular / ill-conditioned (smallest eigenvalue <= eps * largest)
  bool spd_power( const Eigen::MatrixXd & M , const double p , Eigen::MatrixXd * R , const double eps = 1e-12 );

  // largest absolute deviation of M from the identity
  double max_identity_dev( const Eigen::MatrixXd & M );
  
  // whitespace-delimited text matrix
  Eigen::MatrixXd load_mat( const std::string & file );

  void save_mat( const std::string & file , const Eigen::MatrixXd & M );
  
}

#endif 
