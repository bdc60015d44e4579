
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

#include "stats/eigen_ops.h"
#include "helper/helper.h"

#include <vector>
#include <fstream>
#include <iomanip>
#include <limits>
#include <cmath>

// nb. using Eigen:::Ref<>
// for a writable reference:    Eigen::Ref<Eigen::MatrixXd> 
// for a const ref:             const Eigen::Ref<const Eigen::MatrixXd> & 

bool eigen_ops::scale( Eigen::Ref<Eigen::MatrixXd> M , const bool center , const bool normalize )
{

  if ( ! ( center || normalize ) ) return true;
  
  const int N = M.rows();
  
  Eigen::Array<double, 1, Eigen::Dynamic> means = M.colwise().mean();

  if ( normalize )
    {
      if ( N < 2 ) return false;
      
      Eigen::Array<double, 1, Eigen::Dynamic> sds = ((M.array().rowwise() - means ).square().colwise().sum()/(N-1)).sqrt();

      for (int i=0;i<sds.size();i++) 
       	if ( sds[i] == 0 ) return false;
      
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


bool eigen_ops::spd_power( const Eigen::MatrixXd & M , const double p , Eigen::MatrixXd * R , const double eps )
{
  
  if ( M.rows() != M.cols() || M.rows() == 0 ) return false;
  
  if ( ! M.allFinite() ) return false;
  
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es( M );

  if ( es.info() != Eigen::Success ) return false;

  // eigenvalues in increasing order
  const Eigen::VectorXd & d = es.eigenvalues();
  
  const double dmax = d[ d.size() - 1 ];
  const double dmin = d[0];
  
  if ( ! ( dmax > 0 ) || ! ( dmin > eps * dmax ) ) return false;
  
  // M^p = U diag(d^p) U'
  *R = es.eigenvectors() * d.array().pow( p ).matrix().asDiagonal() * es.eigenvectors().transpose();

  return R->allFinite();
}


double eigen_ops::max_identity_dev( const Eigen::MatrixXd & M )
{
  if ( M.size() == 0 ) return 0;
  return ( M - Eigen::MatrixXd::Identity( M.rows() , M.cols() ) ).cwiseAbs().maxCoeff();
}


Eigen::MatrixXd eigen_ops::load_mat( const std::string & f )
{

  std::string filename = Helper::expand( f );
  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not load " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  int ncols = 0;
  int nrows = 0;
  std::vector<double> d;
  
  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.bad() ) break;
      if ( line == "" ) continue;
      if ( line[0] == '#' ) continue;
      
      std::vector<std::string> tok = Helper::parse( line , "\t " );
      if ( tok.size() == 0 ) continue;
      
      // check size
      if ( ncols != 0 )
	{
	  if ( tok.size() != ncols )
	    Helper::halt( "bad number of columns:\n" + line );
	}
      else
	ncols = tok.size(); 

      for (int i=0;i<ncols;i++)
	{
	  double x;
	  if ( ! Helper::str2dbl( tok[i] , &x ) )
	    Helper::halt( "problem converting to a numeric: " + tok[i] );
	  d.push_back( x );
	}

      ++nrows;
    }

  if ( d.size() != nrows * ncols )
    Helper::halt( "internal error in load_mat()" );
  
  Eigen::MatrixXd X = Eigen::MatrixXd::Zero( nrows , ncols );
  int p = 0;
  for (int i=0; i<nrows; i++)
    for (int j=0; j<ncols; j++)
      X(i,j) = d[p++];
  
  return X;
}


void eigen_ops::save_mat( const std::string & f , const Eigen::MatrixXd & M )
{
  
  std::string filename = Helper::expand( f );
  
  std::ofstream O1( filename.c_str() , std::ios::out );
  
  if ( ! O1.good() )
    Helper::halt( "could not write to " + filename );

  O1 << std::setprecision( std::numeric_limits<double>::max_digits10 );
  
  for (int i=0; i<M.rows(); i++)
    {
      for (int j=0; j<M.cols(); j++)
	O1 << ( j ? "\t" : "" ) << M(i,j);
      O1 << "\n";
    }
  
  O1.close();
}
