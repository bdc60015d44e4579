
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

#include "ica/whiten.h"
#include "ica/nnica.h"

#include "stats/eigen_ops.h"
#include "helper/helper.h"

#include <cmath>

whiten_t::whiten_t( const Eigen::MatrixXd & X , const int nc , const bool remove_mean , const double eps )
{

  const int p = X.rows();
  const int n = X.cols();
  
  if ( nc < 1 || nc > p )
    throw nnica_invalid_argument( "whitening: cannot extract " + Helper::int2str( nc )
				  + " components from " + Helper::int2str( p ) + " channels" );

  if ( n < 2 )
    throw nnica_invalid_argument( "whitening: requires at least two samples" );

  if ( ! X.allFinite() )
    throw nnica_numerical_failure( "whitening: data contain non-finite values" );
  
  //
  // centre (samples x channels)
  //
  
  Eigen::MatrixXd Xc = X.transpose();
  
  means = Xc.colwise().mean().transpose();

  eigen_ops::scale( Xc , true , false );

  //
  // covariance, p x p
  //
  
  Eigen::MatrixXd C = ( Xc.transpose() * Xc ) / (double)( n - 1 );

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es( C );

  if ( es.info() != Eigen::Success )
    throw nnica_numerical_failure( "whitening: eigendecomposition of the covariance matrix failed" );
  
  // eigenvalues are increasing: take the last nc, in reverse order
  
  const Eigen::VectorXd & d = es.eigenvalues();

  const double dmax = d[ p - 1 ];
  
  if ( ! ( dmax > 0 ) )
    throw nnica_numerical_failure( "whitening: data have zero variance" );
  
  eigenvalues.resize( nc );
  V.resize( nc , p );
  
  for (int k=0; k<nc; k++)
    {
      const int j = p - 1 - k;
      
      if ( ! ( d[j] > eps * dmax ) )
	throw nnica_numerical_failure( "whitening: covariance matrix has rank < "
				       + Helper::int2str( nc ) + " (degenerate or collinear channels)" );

      Eigen::VectorXd e = es.eigenvectors().col( j );

      // fix the sign: largest-magnitude element positive
      int imax = 0;
      e.cwiseAbs().maxCoeff( &imax );
      if ( e[imax] < 0 ) e = -e;
      
      eigenvalues[k] = d[j];
      V.row(k) = e.transpose() / sqrt( d[j] );
    }

  retained = eigenvalues.sum() / d.cwiseMax( 0.0 ).sum();
  
  //
  // project
  //
  
  if ( remove_mean )
    Z = V * Xc.transpose();
  else
    Z = V * X;
  
}
