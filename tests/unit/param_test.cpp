
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

#include "param.h"
#include "defs/defs.h"
#include "ica/nnica.h"

#include <set>
#include <string>

namespace {

TEST(ParamTest, ParsesKeyValuePairsAndFlags) {
  param_t param;
  param.parse( "nc=3" );
  param.parse( "center" );
  param.parse( "expr=a=2" );

  EXPECT_EQ( param.size() , 3 );
  EXPECT_TRUE( param.has( "nc" ) );
  EXPECT_EQ( param.value( "nc" ) , "3" );
  EXPECT_EQ( param.requires_int( "nc" ) , 3 );

  EXPECT_TRUE( param.has( "center" ) );
  EXPECT_TRUE( param.empty( "center" ) );
  EXPECT_EQ( param.value( "center" ) , "" );

  // later '=' signs belong to the value
  EXPECT_EQ( param.value( "expr" ) , "a=2" );

  EXPECT_FALSE( param.has( "tol" ) );
}

TEST(ParamTest, YesNoDefaults) {
  param_t param;
  param.parse( "center" );
  param.parse( "rowvar=F" );
  param.parse( "silent=yes" );

  // absent key
  EXPECT_FALSE( param.yesno( "verbose" ) );
  EXPECT_TRUE( param.yesno( "verbose" , true ) );

  // bare key
  EXPECT_TRUE( param.yesno( "center" ) );
  EXPECT_FALSE( param.yesno( "center" , false , false ) );

  EXPECT_FALSE( param.yesno( "rowvar" , true , true ) );
  EXPECT_TRUE( param.yesno( "silent" ) );
}

TEST(ParamTest, AppendModeAndNumericValues) {
  param_t param;
  param.parse( "sig+=C3" );
  param.parse( "sig+=C4" );
  param.parse( "lr=0.05" );
  param.parse( "  tol=1e-6  " );

  EXPECT_EQ( param.value( "sig" ) , "C3,C4" );
  EXPECT_DOUBLE_EQ( param.requires_dbl( "lr" ) , 0.05 );
  EXPECT_DOUBLE_EQ( param.requires_dbl( "tol" ) , 1e-6 );
  EXPECT_EQ( param.dump( "" , " " ) , "lr=0.05 sig=C3,C4 tol=1e-6" );
}

TEST(ParamTest, KeysListsEveryOption) {
  param_t param;
  param.parse( "nc=2" );
  param.parse( "center" );
  param.parse( "sig+=C3" );

  std::set<std::string> expected;
  expected.insert( "center" );
  expected.insert( "nc" );
  expected.insert( "sig" );
  EXPECT_EQ( param.keys() , expected );
}

TEST(NnicaParamTest, FlagsUnrecognisedOptions) {
  param_t param;
  param.parse( "dat=X.txt" );
  param.parse( "nc=2" );
  param.parse( "center" );
  param.parse( "verbose" );
  param.parse( "maxiter=100" );
  param.parse( "centre" );

  std::set<std::string> expected;
  expected.insert( "centre" );
  expected.insert( "maxiter" );
  EXPECT_EQ( nnica_unknown_options( param ) , expected );
}

TEST(NnicaParamTest, Defaults) {
  nnica_param_t par;
  EXPECT_EQ( par.nc , 0 );
  EXPECT_DOUBLE_EQ( par.lr , 0.03 );
  EXPECT_EQ( par.maxit , 5000 );
  EXPECT_DOUBLE_EQ( par.tol , 1e-8 );
  EXPECT_FALSE( par.remove_mean );
  EXPECT_TRUE( par.rowvar );
}

TEST(NnicaParamTest, ReadsOptions) {
  param_t param;
  param.parse( "nc=2" );
  param.parse( "lr=0.1" );
  param.parse( "maxit=100" );
  param.parse( "tol=1e-5" );
  param.parse( "center" );
  param.parse( "rowvar=F" );

  nnica_param_t par( param );
  EXPECT_EQ( par.nc , 2 );
  EXPECT_DOUBLE_EQ( par.lr , 0.1 );
  EXPECT_EQ( par.maxit , 100 );
  EXPECT_DOUBLE_EQ( par.tol , 1e-5 );
  EXPECT_TRUE( par.remove_mean );
  EXPECT_FALSE( par.rowvar );
}

TEST(NnicaParamTest, ValidateResolvesSourceCount) {
  nnica_param_t par;
  EXPECT_EQ( par.validate( 5 ) , 5 );
  EXPECT_EQ( par.validate( 2 ) , 2 );
  EXPECT_EQ( par.nc , 0 );

  nnica_param_t par2;
  par2.nc = 3;
  EXPECT_EQ( par2.validate( 5 ) , 3 );
  EXPECT_EQ( par2.nc , 3 );
}

TEST(NnicaParamTest, ValidateRejectsBadValues) {
  nnica_param_t par;
  par.nc = 6;
  EXPECT_THROW( par.validate( 5 ) , nnica_invalid_argument );

  nnica_param_t neg;
  neg.nc = -1;
  EXPECT_THROW( neg.validate( 5 ) , nnica_invalid_argument );

  nnica_param_t lr;
  lr.lr = 0;
  EXPECT_THROW( lr.validate( 2 ) , nnica_invalid_argument );

  nnica_param_t maxit;
  maxit.maxit = 0;
  EXPECT_THROW( maxit.validate( 2 ) , nnica_invalid_argument );

  nnica_param_t tol;
  tol.tol = -1e-8;
  EXPECT_THROW( tol.validate( 2 ) , nnica_invalid_argument );

  nnica_param_t none;
  EXPECT_THROW( none.validate( 0 ) , nnica_invalid_argument );
}

}  // namespace
