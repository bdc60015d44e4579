
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

#ifndef __NNICA_ICA_H__
#define __NNICA_ICA_H__

#include <Eigen/Dense>

#include <functional>
#include <set>
#include <stdexcept>
#include <string>

// Non-negative ICA by gradient search on the orthogonal group, after
// Plumbley & Oja, "Blind separation of positive sources by globally
// convergent gradient search", Neural Computation 16 (2004)

// The recovered sources are defined only up to permutation (and the
// mixing matrix only up to the matching column permutation)

struct param_t; 

// e.g. more components requested than channels
struct nnica_invalid_argument : public std::invalid_argument {
  explicit nnica_invalid_argument( const std::string & msg ) : std::invalid_argument( msg ) { } 
};

// singular / ill-conditioned matrix in whitening, orthonormalization or reconstruction
struct nnica_numerical_failure : public std::runtime_error {
  explicit nnica_numerical_failure( const std::string & msg ) : std::runtime_error( msg ) { } 
};


struct nnica_param_t {

  nnica_param_t();

  // nc, lr, maxit, tol, center, rowvar, eps
  explicit nnica_param_t( const param_t & param );
  
  // number of sources (0 means all channels)
  int nc;

  // gradient step
  double lr;

  // iteration budget
  int maxit;

  // convergence criterion on ||W - W0||
  double tol;

  // remove channel means before projecting (F for the non-negative case)
  bool remove_mean;

  // input is channels x samples (otherwise samples x channels)
  bool rowvar;

  // relative eigenvalue floor, below which a matrix is treated as singular
  double eps;

  // check all values against the input: returns the number of sources
  // to extract (nc, or channels if nc is 0); throws nnica_invalid_argument
  int validate( const int channels ) const;
  
};


// observer: iteration (1-based), ||W - W0||
typedef std::function<void(int,double)> nnica_progress_t;


struct nnica_t {
  
  nnica_t( const nnica_param_t & par = nnica_param_t() );

  // whiten X, unmix, reconstruct: sets S and A
  void proc( const Eigen::MatrixXd & X );

  // start from already-whitened data Z (nc x samples) and transform V (nc x channels)
  void init( const Eigen::MatrixXd & Z , const Eigen::MatrixXd & V );

  // a single gradient + symmetric orthonormalization update of W; returns ||W - W0||
  double step();

  // iterate to convergence or until the budget is spent; returns iterations used
  int unmix();

  // S = W Z,  A = (WV)' ( (WV)(WV)' )^-1
  void reconstruct();

  // max | W W' - I |
  double orthonormality_error() const;

  void set_progress( nnica_progress_t f ) { progress = f; }
  
  // as requested (nc == 0 stays 0 across runs)
  nnica_param_t par;

  // sources extracted in the current run
  int nc;
  
  Eigen::MatrixXd Z;   // whitened data  nc x samples
  Eigen::MatrixXd V;   // whitening      nc x channels
  Eigen::MatrixXd W;   // unmixing       nc x nc
  Eigen::MatrixXd S;   // sources        nc x samples
  Eigen::MatrixXd A;   // mixing         channels x nc

  int    iterations;
  bool   converged;
  double delta;

  // from whitening (proc() only)
  double retained;
  
 private:

  nnica_progress_t progress;

  void report( const int it , const double d );
  
};

void nnica_cmd( param_t & param );

// option keys that nnica_cmd() does not recognise
std::set<std::string> nnica_unknown_options( const param_t & param );

#endif
