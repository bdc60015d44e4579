
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

#include "ica/nnica.h"
#include "ica/whiten.h"

#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

extern logger_t logger;


nnica_param_t::nnica_param_t()
{
  nc = 0;
  lr = 0.03;
  maxit = 5000;
  tol = 1e-8;
  remove_mean = false;
  rowvar = true;
  eps = 1e-12;
}


nnica_param_t::nnica_param_t( const param_t & param )
  : nnica_param_t()
{
  if ( param.has( "nc" ) ) nc = param.requires_int( "nc" );
  if ( param.has( "lr" ) ) lr = param.requires_dbl( "lr" );
  if ( param.has( "maxit" ) ) maxit = param.requires_int( "maxit" );
  if ( param.has( "tol" ) ) tol = param.requires_dbl( "tol" );
  if ( param.has( "eps" ) ) eps = param.requires_dbl( "eps" );
  
  remove_mean = param.yesno( "center" , false , true );
  rowvar = param.yesno( "rowvar" , true , true );
}


int nnica_param_t::validate( const int channels ) const
{
  
  if ( channels < 1 )
    throw nnica_invalid_argument( "no channels in input data" );

  if ( nc < 0 )
    throw nnica_invalid_argument( "number of requested components cannot be negative" );

  const int k = nc == 0 ? channels : nc;
  
  if ( k > channels )
    throw nnica_invalid_argument( "number of requested components (" + Helper::int2str( k )
				  + ") exceeds number of channels (" + Helper::int2str( channels ) + ")" );

  if ( ! ( lr > 0 ) )
    throw nnica_invalid_argument( "learning rate must be positive" );

  if ( maxit < 1 )
    throw nnica_invalid_argument( "maxit must be a positive integer" );

  if ( ! ( tol > 0 ) )
    throw nnica_invalid_argument( "tol must be positive" );

  if ( ! ( eps > 0 ) )
    throw nnica_invalid_argument( "eps must be positive" );

  return k;
}


nnica_t::nnica_t( const nnica_param_t & par )
  : par( par ) , nc( 0 ) , iterations( 0 ) , converged( false ) , delta( 0 ) , retained( 1 )
{
}


void nnica_t::proc( const Eigen::MatrixXd & X_ )
{

  // channels x samples 
  const Eigen::MatrixXd X = par.rowvar ? X_ : Eigen::MatrixXd( X_.transpose() );

  // checked before any whitening is attempted
  const int k = par.validate( X.rows() );

  logger << "  whitening the data ("
	 << ( par.remove_mean ? "removing" : "without removing" )
	 << " mean), " << k << " of " << X.rows() << " components\n";
  
  whiten_t white( X , k , par.remove_mean , par.eps );

  retained = white.retained;
  
  logger << "  retained " << Helper::dbl2str( 100.0 * retained , 2 ) << "% of total variance\n";

  init( white.Z , white.V );

  logger << "  running ICA iterations (lr = " << par.lr
	 << ", maxit = " << par.maxit
	 << ", tol = " << par.tol << ")\n";

  unmix();

  reconstruct();
  
}


void nnica_t::init( const Eigen::MatrixXd & Z_ , const Eigen::MatrixXd & V_ )
{

  if ( Z_.rows() != V_.rows() )
    throw nnica_invalid_argument( "whitened data and whitening matrix differ in number of components" );

  if ( Z_.rows() < 1 || Z_.cols() < 1 )
    throw nnica_invalid_argument( "empty whitened data" );

  if ( par.nc != 0 && par.nc != Z_.rows() )
    throw nnica_invalid_argument( "whitened data do not have " + Helper::int2str( par.nc ) + " components" );

  // W is nc x nc
  nc = Z_.rows();
  
  Z = Z_;
  V = V_;

  W = Eigen::MatrixXd::Identity( nc , nc );

  S.resize( 0 , 0 );
  A.resize( 0 , 0 );
  
  iterations = 0;
  converged = false;
  delta = 0;
}


double nnica_t::step()
{

  if ( W.rows() == 0 )
    throw nnica_invalid_argument( "nnica_t::step() called before init()" );
  
  const int n = Z.cols();
  
  const Eigen::MatrixXd W0 = W;
  
  // candidate sources
  Eigen::MatrixXd Y = W * Z;

  // f(y) = min(y,0)
  Eigen::MatrixXd f = Y.cwiseMin( 0.0 );

  // E = ( f(Y) Y' - Y f(Y)' ) / n  (skew-symmetric)
  Eigen::MatrixXd fY = f * Y.transpose();
  Eigen::MatrixXd E = ( fY - fY.transpose() ) / (double)n;

  // gradient descent
  W = W - par.lr * ( E * W );

  // symmetric orthonormalization: W <- (W W')^-1/2 W
  Eigen::MatrixXd M = W * W.transpose();
  Eigen::MatrixXd Msqrt;
  if ( ! eigen_ops::spd_power( M , -0.5 , &Msqrt , par.eps ) )
    throw nnica_numerical_failure( "W W' is singular or ill-conditioned at iteration "
				   + Helper::int2str( iterations + 1 ) );
  W = Msqrt * W;
  
  ++iterations;

  delta = ( W - W0 ).norm();

  return delta;
}


int nnica_t::unmix()
{

  converged = false;

  for (int i=0; i<par.maxit; i++)
    {
      
      const double d = step();

      report( iterations , d );
      
      if ( d < par.tol )
	{
	  converged = true;
	  break;
	}
    }

  if ( converged )
    logger << "  converged after " << iterations << " iterations\n";
  else
    logger.warning( "no convergence after " + Helper::int2str( iterations )
		    + " iterations (W-change " + Helper::dbl2str( delta ) + "), using last W" );
  
  return iterations;
}


void nnica_t::reconstruct()
{

  if ( W.rows() == 0 )
    throw nnica_invalid_argument( "nnica_t::reconstruct() called before init()" );

  // independent sources, up to an unknown permutation y = Q s
  S = W * Z;

  // mixing matrix A' = A Q' from y = Q s = W V A s, as the right
  // Moore-Penrose inverse of W V; not unique unless nc == channels
  const Eigen::MatrixXd WV = W * V;

  Eigen::MatrixXd Ginv;
  if ( ! eigen_ops::spd_power( WV * WV.transpose() , -1.0 , &Ginv , par.eps ) )
    throw nnica_numerical_failure( "(WV)(WV)' is singular, cannot form the mixing matrix" );

  A = WV.transpose() * Ginv;
  
}


double nnica_t::orthonormality_error() const
{
  return eigen_ops::max_identity_dev( W * W.transpose() );
}


void nnica_t::report( const int it , const double d )
{
  if ( ! progress ) return;

  // observer errors never stop the iterations
  try
    {
      progress( it , d );
    }
  catch ( const std::exception & e )
    {
      logger.warning( std::string( "progress reporting failed, detaching observer: " ) + e.what() );
      progress = nnica_progress_t();
    }
}
