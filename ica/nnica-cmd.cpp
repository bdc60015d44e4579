
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

#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"
#include "param.h"

#include <cstdio>

extern logger_t logger;

//
// nnica dat=X.txt [nc=2] [lr=0.03] [maxit=5000] [tol=1e-8] [center] [rowvar=F] [out=prefix]
//

std::set<std::string> nnica_unknown_options( const param_t & param )
{
  static const char * known[] = { "dat" , "out" , "report" ,
				  "nc" , "lr" , "maxit" , "tol" , "eps" , "center" , "rowvar" ,
				  "silent" , "verbose" , "log" };
  
  std::set<std::string> okay( known , known + sizeof( known ) / sizeof( known[0] ) );
  
  std::set<std::string> unknown;
  const std::set<std::string> keys = param.keys();
  std::set<std::string>::const_iterator kk = keys.begin();
  while ( kk != keys.end() )
    {
      if ( okay.find( *kk ) == okay.end() )
	unknown.insert( *kk );
      ++kk;
    }
  return unknown;
}


void nnica_cmd( param_t & param )
{

  const std::set<std::string> unknown = nnica_unknown_options( param );
  std::set<std::string>::const_iterator uu = unknown.begin();
  while ( uu != unknown.end() )
    {
      logger.warning( "ignoring unrecognised option " + *uu );
      ++uu;
    }

  const std::string dat = param.requires( "dat" );

  const std::string out = param.has( "out" ) && ! param.empty( "out" ) ? param.value( "out" ) : "nnica";

  const int report_every = param.has( "report" ) ? param.requires_int( "report" ) : 500;
  
  nnica_param_t par( param );
  
  Eigen::MatrixXd X = eigen_ops::load_mat( dat );

  logger << "  read " << X.rows() << " x " << X.cols() << " matrix from " << dat << "\n";
  
  nnica_t ica( par );

  if ( globals::verbose )
    {
      ica.set_progress( []( int it , double d ) {
	  char buf[64];
	  snprintf( buf , sizeof( buf ) , "it %d, W-change: %.8f\n" , it , d );
	  logger << buf;
	} );
    }
  else if ( report_every > 0 )
    {
      ica.set_progress( [report_every]( int it , double d ) {
	  if ( it % report_every == 0 )
	    logger << "  it " << it << ", W-change: " << d << "\n";
	} );
    }
  
  try
    {
      ica.proc( X );
    }
  catch ( const nnica_invalid_argument & e )
    {
      Helper::halt( std::string( "invalid argument: " ) + e.what() );
      return;
    }
  catch ( const nnica_numerical_failure & e )
    {
      Helper::halt( std::string( "numerical failure: " ) + e.what() );
      return;
    }

  //
  // summary
  //

  logger << "  channels          " << ica.V.cols() << "\n"
	 << "  samples           " << ica.Z.cols() << "\n"
	 << "  sources           " << ica.nc << "\n"
	 << "  variance retained " << Helper::dbl2str( ica.retained , 4 ) << "\n"
	 << "  iterations        " << ica.iterations << " (of " << ica.par.maxit << ")\n"
	 << "  converged         " << ( ica.converged ? "yes" : "no" ) << "\n"
	 << "  final W-change    " << ica.delta << "\n"
	 << "  max |WW'-I|       " << ica.orthonormality_error() << "\n";

  
  //
  // outputs: sources in the same orientation as the input
  //
  
  eigen_ops::save_mat( out + ".S.txt" , par.rowvar ? ica.S : Eigen::MatrixXd( ica.S.transpose() ) );
  eigen_ops::save_mat( out + ".A.txt" , ica.A );
  eigen_ops::save_mat( out + ".W.txt" , ica.W );
  eigen_ops::save_mat( out + ".V.txt" , ica.V );

  logger << "  wrote " << out << ".{S,A,W,V}.txt\n";
  
}
