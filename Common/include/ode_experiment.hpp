// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef ode_experiment_hpp
#define ode_experiment_hpp

#include <algorithm>
#include <climits>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <boost/numeric/odeint.hpp>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xtensor.hpp>
#include <xtensor/xview.hpp>

#include <fmt/format.h>

/*--- Add header with auxiliary structs and the errors ---*/
#include "ode_containers.hpp"
#include "ode_errors.hpp"

// Declare a struct with the sampled solution of an experiment
//
template<typename T = double>
struct Trajectory {
  xt::xtensor<T, 1> time;   /*--- Reporting mesh ---*/
  xt::xtensor<T, 2> states; /*--- One row per sample, one column per state component ---*/

  Integration_Diagnostics diagnostics;

  std::size_t size() const { return time.size(); }

  xt::xtensor<T, 1> component(const std::size_t idx) const; /*--- Time series of a single state component ---*/
};

// Extract the time series of a state component
//
template<typename T>
xt::xtensor<T, 1> Trajectory<T>::component(const std::size_t idx) const {
  if(idx >= states.shape(1)) {
    throw std::out_of_range(fmt::format("Component {} requested, but the state has {} components",
                                        idx, states.shape(1)));
  }

  return xt::view(states, xt::all(), idx);
}

/** This is the class which performs a fixed-horizon integration of an ODE system.
    The System has to provide the arithmetic type 'Number', the number of equations 'NVARS'
    and the vector field through operator()(X, dXdt, t)
 */
template<class System>
class ODE_Experiment {
public:
  using Number = typename System::Number;
  using State  = std::vector<Number>;

  ODE_Experiment(const System& system_,
                 const State& X_ini_,
                 const Solver_Parameters<Number>& solver_param_); /*--- Class constructor. It checks the
                                                                      configuration before anything is integrated ---*/

  const Trajectory<Number>& run(); /*--- Function which actually performs the integration ---*/

  const Trajectory<Number>& get_trajectory() const;

  const Integration_Diagnostics& get_diagnostics() const;

  const System& get_system() const;

private:
  const System                    system;       /*--- The vector field (with its own frozen parameters) ---*/
  const State                     X_ini;        /*--- Initial condition ---*/
  const Solver_Parameters<Number> solver_param; /*--- Horizon, mesh and tolerances ---*/

  Trajectory<Number> trajectory; /*--- Output of the last run ---*/

  void check_configuration() const; /*--- Fail fast on inconsistent setups ---*/

  void check_derivative(const State& dXdt, const Number t) const; /*--- Detect non-finite evaluations of the vector field ---*/
};

//////////////////////////////////////////////////////////////
/*---- START WITH THE IMPLEMENTATION OF THE CONSTRUCTOR ---*/
//////////////////////////////////////////////////////////////

// Implement class constructor
//
template<class System>
ODE_Experiment<System>::ODE_Experiment(const System& system_,
                                       const State& X_ini_,
                                       const Solver_Parameters<Number>& solver_param_):
  system(system_), X_ini(X_ini_), solver_param(solver_param_)
  {
    check_configuration();
  }

// Check dimensions, horizon, mesh and tolerances
//
template<class System>
void ODE_Experiment<System>::check_configuration() const {
  if(X_ini.size() != System::NVARS) {
    throw Configuration_Error(fmt::format("The initial state has {} components, but the system has {} equations",
                                          X_ini.size(), System::NVARS));
  }
  for(std::size_t i = 0; i < X_ini.size(); ++i) {
    if(!std::isfinite(X_ini[i])) {
      throw Configuration_Error(fmt::format("Non-finite initial value for component {}", i));
    }
  }

  if(!std::isfinite(solver_param.Tf) || solver_param.Tf < static_cast<Number>(0.0)) {
    throw Configuration_Error(fmt::format("The final time must be finite and non-negative (got {})", solver_param.Tf));
  }
  if(solver_param.n_samples < 2) {
    throw Configuration_Error(fmt::format("At least two samples are needed for the reporting mesh (got {})",
                                          solver_param.n_samples));
  }
  if(solver_param.max_steps == 0 || solver_param.max_steps > static_cast<std::size_t>(INT_MAX)) {
    throw Configuration_Error(fmt::format("Invalid maximum number of steps per reporting interval ({})",
                                          solver_param.max_steps));
  }
  if(!(solver_param.atol > static_cast<Number>(0.0)) || !(solver_param.rtol > static_cast<Number>(0.0))) {
    throw Configuration_Error(fmt::format("Tolerances must be positive (atol = {}, rtol = {})",
                                          solver_param.atol, solver_param.rtol));
  }
}

//////////////////////////////////////////////////////////////
/*---- FOCUS NOW ON THE AUXILIARY FUNCTIONS ---*/
/////////////////////////////////////////////////////////////

// Check that the vector field is finite
//
template<class System>
void ODE_Experiment<System>::check_derivative(const State& dXdt, const Number t) const {
  for(std::size_t i = 0; i < dXdt.size(); ++i) {
    if(!std::isfinite(dXdt[i])) {
      throw Numerical_Fault(fmt::format("Non-finite derivative of component {} at t = {}", i, t),
                            static_cast<double>(t), i);
    }
  }
}

// Return the last computed trajectory
//
template<class System>
const Trajectory<typename ODE_Experiment<System>::Number>&
ODE_Experiment<System>::get_trajectory() const {
  return trajectory;
}

// Return the statistics of the last integration
//
template<class System>
const Integration_Diagnostics& ODE_Experiment<System>::get_diagnostics() const {
  return trajectory.diagnostics;
}

// Return the system
//
template<class System>
const System& ODE_Experiment<System>::get_system() const {
  return system;
}

//////////////////////////////////////////////////////////////
/*---- IMPLEMENT THE FUNCTION THAT EFFECTIVELY SOLVES THE PROBLEM ---*/
/////////////////////////////////////////////////////////////

// Integrate from t = 0 to Tf sampling the solution on the reporting mesh.
// The internal step is chosen by the error controller; the mesh is only used for output.
//
template<class System>
const Trajectory<typename ODE_Experiment<System>::Number>& ODE_Experiment<System>::run() {
  namespace odeint = boost::numeric::odeint;

  const auto n_samples = solver_param.n_samples;
  const auto Tf        = solver_param.Tf;

  /*--- Create the reporting mesh and the storage ---*/
  trajectory.time = xt::linspace<Number>(static_cast<Number>(0.0), Tf, n_samples);
  trajectory.time(n_samples - 1) = Tf;
  trajectory.states      = xt::xtensor<Number, 2>::from_shape({n_samples, System::NVARS});
  trajectory.diagnostics = Integration_Diagnostics();

  const std::vector<Number> times(trajectory.time.cbegin(), trajectory.time.cend());

  std::cout << fmt::format("Integrating {} equations up to t = {} ({} samples)", System::NVARS, Tf, n_samples)
            << std::endl;

  /*--- Wrap the vector field so as to count the evaluations and detect degeneracies ---*/
  std::size_t n_rhs = 0;
  auto rhs = [&](const State& X, State& dXdt, const Number t)
                {
                  ++n_rhs;
                  system(X, dXdt, t);
                  check_derivative(dXdt, t);
                };

  /*--- Store the solution at the mesh points ---*/
  std::size_t sample = 0;
  auto observer = [&](const State& X, const Number t)
                     {
                       for(std::size_t i = 0; i < System::NVARS; ++i) {
                         trajectory.states(sample, i) = X[i];
                       }
                       ++sample;

                       if(solver_param.verbose && sample % std::max<std::size_t>(n_samples/10, 1) == 0) {
                         std::cout << fmt::format("  Sample {} of {}: t = {}, rhs evaluations = {}",
                                                  sample, n_samples, t, n_rhs) << std::endl;
                       }
                     };

  /*--- Dormand-Prince 5(4) with error control ---*/
  auto stepper = odeint::make_controlled(solver_param.atol, solver_param.rtol,
                                         odeint::runge_kutta_dopri5<State, Number>());

  State X = X_ini;
  const auto dt_ini = Tf/static_cast<Number>(n_samples - 1);

  std::size_t n_steps = 0;
  try {
    n_steps = odeint::integrate_times(stepper, rhs, X,
                                      times.cbegin(), times.cend(), dt_ini,
                                      observer,
                                      odeint::max_step_checker(static_cast<int>(solver_param.max_steps)));
  }
  catch(const odeint::odeint_error& e) {
    const auto idx_end   = std::min(sample, n_samples - 1);
    const auto idx_begin = (idx_end > 0) ? idx_end - 1 : 0;
    throw Integration_Failure(fmt::format("Integration failed in the reporting interval [{}, {}]: {}",
                                          times[idx_begin], times[idx_end], e.what()),
                              static_cast<double>(times[idx_begin]), static_cast<double>(times[idx_end]));
  }

  trajectory.diagnostics.n_steps           = n_steps;
  trajectory.diagnostics.n_rhs_evaluations = n_rhs;
  trajectory.diagnostics.n_samples         = sample;

  std::cout << fmt::format("Integration completed: {} steps, {} right-hand side evaluations, {} samples",
                           n_steps, n_rhs, sample) << std::endl;

  return trajectory;
}

#endif
