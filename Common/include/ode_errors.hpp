// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef ode_errors_hpp
#define ode_errors_hpp

#include <cstddef>
#include <stdexcept>
#include <string>

/**
  * Inconsistent setup of an experiment (state size, horizon, mesh, tolerances
    or model parameters). Raised before any integration takes place.
  */
class Configuration_Error: public std::invalid_argument {
public:
  explicit Configuration_Error(const std::string& what_):
    std::invalid_argument(what_) {}
};

/**
  * The adaptive integrator could not reach the end of a reporting interval
    (step ceiling exceeded or no acceptable step size found)
  */
class Integration_Failure: public std::runtime_error {
public:
  Integration_Failure(const std::string& what_,
                      const double t_begin_,
                      const double t_end_):
    std::runtime_error(what_), t_begin(t_begin_), t_end(t_end_) {}

  double get_t_begin() const { return t_begin; } /*--- Left end of the failed reporting interval ---*/

  double get_t_end() const { return t_end; } /*--- Right end of the failed reporting interval ---*/

private:
  double t_begin;
  double t_end;
};

/**
  * The derivative function returned a non-finite value
  */
class Numerical_Fault: public std::runtime_error {
public:
  Numerical_Fault(const std::string& what_,
                  const double t_,
                  const std::size_t component_):
    std::runtime_error(what_), t(t_), component(component_) {}

  double get_time() const { return t; }

  std::size_t get_component() const { return component; }

private:
  double      t;
  std::size_t component;
};

#endif
