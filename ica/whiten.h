
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

#ifndef __NNICA_WHITEN_H__
#define __NNICA_WHITEN_H__

#include <Eigen/Dense>

// PCA whitening of a channels x samples data matrix:
//   Z = V X   (or V Xc if the channel means are removed)
//   V = D^-1/2 E'   for the top 'nc' eigenpairs (D,E) of the channel covariance

// The covariance is always computed about the channel means, but by
// default the means are not removed from the data that are projected:
// the non-negative ICA needs the sources' offsets intact

struct whiten_t {

  whiten_t( const Eigen::MatrixXd & X ,
	    const int nc ,
	    const bool remove_mean = false ,
	    const double eps = 1e-12 );
  
  // nc x samples
  Eigen::MatrixXd Z;

  // nc x channels
  Eigen::MatrixXd V;

  // channel means
  Eigen::VectorXd means;

  // retained covariance eigenvalues (decreasing)
  Eigen::VectorXd eigenvalues;

  // proportion of total variance retained
  double retained;
  
};

#endif
