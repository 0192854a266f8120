// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef ode_containers_hpp
#define ode_containers_hpp

#include <cstddef>
#include <string>

// Declare a struct with the solver parameters
// (final time, reporting mesh, step ceiling and tolerances)
//
template<typename T = double>
struct Solver_Parameters {
  /*--- Physical parameters ---*/
  T Tf;

  /*--- Reporting mesh ---*/
  std::size_t n_samples = 1000;

  /*--- Numerical parameters ---*/
  std::size_t max_steps = 1000; /*--- Maximum number of internal steps per reporting interval ---*/
  T           atol      = static_cast<T>(1.49012e-8);
  T           rtol      = static_cast<T>(1.49012e-8);

  /*--- Output parameters ---*/
  bool verbose = false;
};

// Declare a struct with the rendering parameters
//
struct Plot_Parameters {
  std::string renderer = "gnuplot"; /*--- 'gnuplot', 'console' or 'none' ---*/
  std::string terminal = "qt";

  std::string gnuplot_command = "gnuplot -persist"; /*--- Process receiving the plot commands ---*/

  double      line_width   = 6.0;
  std::size_t font_size    = 35;
  std::size_t width        = 1000;
  std::size_t height       = 1000;
  std::size_t console_rows = 11;
};

// Declare a struct with the statistics of the integration
//
struct Integration_Diagnostics {
  std::size_t n_steps           = 0; /*--- Accepted internal steps ---*/
  std::size_t n_rhs_evaluations = 0;
  std::size_t n_samples         = 0;
};

#endif
