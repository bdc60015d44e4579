
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

#ifndef __NNICA_TEST_DATA_H__
#define __NNICA_TEST_DATA_H__

#include <Eigen/Dense>

#include <cmath>
#include <random>

namespace nnica_test {

// two independent, non-negative, well-grounded sources (2 x n):
//   row 0: sparse spikes (mostly exactly zero)
//   row 1: slowly varying 1 + sin(), touching zero once per cycle
inline Eigen::MatrixXd synthetic_sources( const int n = 1000 , const unsigned seed = 42 )
{
  std::mt19937 gen( seed );
  std::uniform_real_distribution<double> unif( 0.0 , 1.0 );
  std::exponential_distribution<double> spike( 0.5 );
  
  const double pi = 3.14159265358979323846;
  
  Eigen::MatrixXd S( 2 , n );
  for (int i=0; i<n; i++)
    {
      S(0,i) = unif( gen ) < 0.15 ? spike( gen ) : 0.0;
      S(1,i) = 1.0 + sin( 2.0 * pi * i / 157.0 );
    }
  return S;
}

inline Eigen::MatrixXd mixing_2x2()
{
  Eigen::MatrixXd A( 2 , 2 );
  A << 0.8 , 0.5 ,
       0.3 , 0.9 ;
  return A;
}

inline Eigen::MatrixXd mixing_3x2()
{
  Eigen::MatrixXd A( 3 , 2 );
  A << 0.8 , 0.5 ,
       0.3 , 0.9 ,
       0.6 , 0.2 ;
  return A;
}

// Pearson correlation of two row vectors
inline double correlation( const Eigen::RowVectorXd & a , const Eigen::RowVectorXd & b )
{
  const Eigen::RowVectorXd ac = a.array() - a.mean();
  const Eigen::RowVectorXd bc = b.array() - b.mean();
  return ac.dot( bc ) / sqrt( ac.squaredNorm() * bc.squaredNorm() );
}

// for each true source, the largest |correlation| over recovered sources
// (permutation and scale are not identifiable); also returns which row matched
inline double best_match( const Eigen::RowVectorXd & s , const Eigen::MatrixXd & Y , int * row )
{
  double best = 0;
  *row = -1;
  for (int k=0; k<Y.rows(); k++)
    {
      const double r = fabs( correlation( s , Y.row(k) ) );
      if ( r > best ) { best = r; *row = k; }
    }
  return best;
}

}

#endif
