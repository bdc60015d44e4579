
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

#include <gtest/gtest.h>

#include "stats/eigen_ops.h"

#include <cstdio>
#include <fstream>
#include <limits>
#include <string>

namespace {

TEST(EigenOpsTest, InverseSquareRootOfSpdMatrix) {
  Eigen::MatrixXd M( 3 , 3 );
  M << 4.0 , 1.0 , 0.5 ,
       1.0 , 3.0 , 0.2 ,
       0.5 , 0.2 , 2.0 ;

  Eigen::MatrixXd R;
  ASSERT_TRUE( eigen_ops::spd_power( M , -0.5 , &R ) );

  // R symmetric, R M R = I
  EXPECT_TRUE( R.isApprox( R.transpose() , 1e-12 ) );
  EXPECT_LT( eigen_ops::max_identity_dev( R * M * R ) , 1e-10 );
}

TEST(EigenOpsTest, InverseOfSpdMatrix) {
  Eigen::MatrixXd M( 2 , 2 );
  M << 2.0 , 0.3 ,
       0.3 , 1.0 ;

  Eigen::MatrixXd R;
  ASSERT_TRUE( eigen_ops::spd_power( M , -1.0 , &R ) );
  EXPECT_TRUE( R.isApprox( M.inverse() , 1e-12 ) );
}

TEST(EigenOpsTest, SingularMatrixIsRejected) {
  Eigen::MatrixXd M( 2 , 2 );
  M << 1.0 , 1.0 ,
       1.0 , 1.0 ;

  Eigen::MatrixXd R;
  EXPECT_FALSE( eigen_ops::spd_power( M , -0.5 , &R ) );

  Eigen::MatrixXd Z = Eigen::MatrixXd::Zero( 2 , 2 );
  EXPECT_FALSE( eigen_ops::spd_power( Z , -1.0 , &R ) );

  Eigen::MatrixXd N = Eigen::MatrixXd::Identity( 2 , 2 );
  N(0,1) = N(1,0) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE( eigen_ops::spd_power( N , -0.5 , &R ) );

  Eigen::MatrixXd NS( 2 , 3 );
  NS.setOnes();
  EXPECT_FALSE( eigen_ops::spd_power( NS , -0.5 , &R ) );
}

TEST(EigenOpsTest, ScaleCentersColumns) {
  Eigen::MatrixXd M( 3 , 2 );
  M << 1.0 , 10.0 ,
       2.0 , 20.0 ,
       3.0 , 60.0 ;

  ASSERT_TRUE( eigen_ops::scale( M , true , false ) );
  EXPECT_NEAR( M.col(0).sum() , 0.0 , 1e-12 );
  EXPECT_NEAR( M.col(1).sum() , 0.0 , 1e-12 );
  EXPECT_DOUBLE_EQ( M(0,0) , -1.0 );
  EXPECT_DOUBLE_EQ( M(2,1) , 30.0 );

  Eigen::MatrixXd C( 3 , 1 );
  C << 5.0 , 5.0 , 5.0 ;
  EXPECT_FALSE( eigen_ops::scale( C , true , true ) );
}

TEST(EigenOpsTest, SaveAndLoadTextMatrix) {
  const std::string f = ::testing::TempDir() + "nnica_eigen_ops_test.txt";

  Eigen::MatrixXd M( 2 , 3 );
  M << 0.1 , -2.5 , 1e-9 ,
       3.0 , 1.0 / 3.0 , 42.0 ;

  eigen_ops::save_mat( f , M );
  Eigen::MatrixXd L = eigen_ops::load_mat( f );

  ASSERT_EQ( L.rows() , 2 );
  ASSERT_EQ( L.cols() , 3 );
  EXPECT_TRUE( L == M );

  std::remove( f.c_str() );
}

TEST(EigenOpsTest, LoadSkipsBlankAndCommentLines) {
  const std::string f = ::testing::TempDir() + "nnica_eigen_ops_comments.txt";
  {
    std::ofstream O( f.c_str() );
    O << "# channels x samples\n"
      << "1 2\t3\n"
      << "\n"
      << "4  5 6\r\n"
      << "7 8 9";
  }

  Eigen::MatrixXd L = eigen_ops::load_mat( f );
  ASSERT_EQ( L.rows() , 3 );
  ASSERT_EQ( L.cols() , 3 );
  EXPECT_DOUBLE_EQ( L(1,1) , 5.0 );
  EXPECT_DOUBLE_EQ( L(2,2) , 9.0 );

  std::remove( f.c_str() );
}

}  // namespace
