// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef microalgae_droop_hpp
#define microalgae_droop_hpp

#include <vector>

#include <xtensor/xmath.hpp>

/*--- Add header with the generic runner and the figures ---*/
#include "ode_experiment.hpp"
#include "renderer.hpp"

/*--- Add header with auxiliary structs ---*/
#include "containers.hpp"

// Indices of the state of the Droop model
//
namespace DroopData {
  static constexpr std::size_t X_ALG_INDEX = 0;
  static constexpr std::size_t Q_INDEX     = 1;
  static constexpr std::size_t S_INDEX     = 2;

  static constexpr std::size_t NVARS = S_INDEX + 1;
}

/** Microalgae growth in a chemostat described by the Droop model:
    light- and quota-limited growth, Michaelis-Menten nutrient uptake
 */
template<typename T = double>
class MicroalgaeDroop {
public:
  using Number = T;
  using State  = std::vector<T>;

  static constexpr std::size_t NVARS = DroopData::NVARS;

  MicroalgaeDroop(const Droop_Parameters<T>& param_); /*--- Class constructor (parameters are frozen here) ---*/

  void operator()(const State& X, State& dXdt, const T t) const; /*--- Vector field ---*/

  inline T growth_rate(const T Q) const; /*--- mu ---*/

  inline T uptake_rate(const T S) const; /*--- rho ---*/

  State initial_state(const Droop_Initial_Conditions<T>& init) const;

  /*--- Derived quantities (post-processing only) ---*/
  xt::xtensor<T, 1> uptake_rate(const Trajectory<T>& trajectory) const;

  xt::xtensor<T, 1> CO2_flow(const Trajectory<T>& trajectory) const; /*--- m_dot23 = K_CO2*rho ---*/

  xt::xtensor<T, 1> mass_balance(const Trajectory<T>& trajectory) const; /*--- S + X_ALG*Q ---*/

  xt::xtensor<T, 1> mass_balance_reference(const Trajectory<T>& trajectory) const; /*--- First-order relaxation towards S_in ---*/

  T mass_balance_deviation(const Trajectory<T>& trajectory) const; /*--- Maximum distance between the two above ---*/

  std::vector<Figure<T>> make_figures(const Trajectory<T>& trajectory) const;

  const Droop_Parameters<T>& get_parameters() const;

private:
  const Droop_Parameters<T> param;
};

// Implement class constructor
//
template<typename T>
MicroalgaeDroop<T>::MicroalgaeDroop(const Droop_Parameters<T>& param_):
  param(param_) {
    if(!(param.T_h > static_cast<T>(0.0))) {
      throw Configuration_Error(fmt::format("The retention time T_h must be positive (got {})", param.T_h));
    }
    if(param.K_iI == static_cast<T>(0.0)) {
      throw Configuration_Error("The light inhibition constant K_iI cannot be zero");
    }
  }

// Return the parameters
//
template<typename T>
const Droop_Parameters<T>& MicroalgaeDroop<T>::get_parameters() const {
  return param;
}

// Growth rate
//
template<typename T>
inline T MicroalgaeDroop<T>::growth_rate(const T Q) const {
  return param.mu_tilde*
         (param.I/(param.I + param.K_sI + param.I*param.I/param.K_iI))*
         (static_cast<T>(1.0) - param.k_q/Q);
}

// Nutrient uptake rate
//
template<typename T>
inline T MicroalgaeDroop<T>::uptake_rate(const T S) const {
  return param.rho_max*(S/(S + param.K_S));
}

// Evaluate the right-hand side. The system is autonomous, so t is unused
//
template<typename T>
void MicroalgaeDroop<T>::operator()(const State& X, State& dXdt, const T t) const {
  (void) t;

  using namespace DroopData;

  const auto mu  = growth_rate(X[Q_INDEX]);
  const auto rho = uptake_rate(X[S_INDEX]);

  dXdt[X_ALG_INDEX] = mu*X[X_ALG_INDEX] - X[X_ALG_INDEX]/param.T_h;
  dXdt[Q_INDEX]     = rho - mu*X[Q_INDEX];
  dXdt[S_INDEX]     = (param.S_in - X[S_INDEX])/param.T_h - rho*X[X_ALG_INDEX];
}

// Pack the initial conditions in a state vector
//
template<typename T>
typename MicroalgaeDroop<T>::State MicroalgaeDroop<T>::initial_state(const Droop_Initial_Conditions<T>& init) const {
  State X_ini(NVARS);

  X_ini[DroopData::X_ALG_INDEX] = init.X_ALG;
  X_ini[DroopData::Q_INDEX]     = init.Q;
  X_ini[DroopData::S_INDEX]     = init.S;

  return X_ini;
}

// Uptake rate along the trajectory
//
template<typename T>
xt::xtensor<T, 1> MicroalgaeDroop<T>::uptake_rate(const Trajectory<T>& trajectory) const {
  const xt::xtensor<T, 1> S = trajectory.component(DroopData::S_INDEX);

  return param.rho_max*(S/(S + param.K_S));
}

// Absorption of CO2
//
template<typename T>
xt::xtensor<T, 1> MicroalgaeDroop<T>::CO2_flow(const Trajectory<T>& trajectory) const {
  return param.K_CO2*uptake_rate(trajectory);
}

// Total nutrient (free plus internal). It has to behave as a first order system
//
template<typename T>
xt::xtensor<T, 1> MicroalgaeDroop<T>::mass_balance(const Trajectory<T>& trajectory) const {
  using namespace DroopData;

  return trajectory.component(S_INDEX) + trajectory.component(X_ALG_INDEX)*trajectory.component(Q_INDEX);
}

// Exact solution of d(S + X_ALG*Q)/dt = (S_in - (S + X_ALG*Q))/T_h
//
template<typename T>
xt::xtensor<T, 1> MicroalgaeDroop<T>::mass_balance_reference(const Trajectory<T>& trajectory) const {
  using namespace DroopData;

  const auto Z0 = trajectory.states(0, S_INDEX) + trajectory.states(0, X_ALG_INDEX)*trajectory.states(0, Q_INDEX);

  return param.S_in + (Z0 - param.S_in)*xt::exp(-trajectory.time/param.T_h);
}

// Maximum deviation of the mass balance from its reference
//
template<typename T>
T MicroalgaeDroop<T>::mass_balance_deviation(const Trajectory<T>& trajectory) const {
  return xt::amax(xt::abs(mass_balance(trajectory) - mass_balance_reference(trajectory)))();
}

// Build the figures
//
template<typename T>
std::vector<Figure<T>> MicroalgaeDroop<T>::make_figures(const Trajectory<T>& trajectory) const {
  using namespace DroopData;

  const std::string xlabel = "Time, t (d)";

  return {{xlabel, "Algal biomass, X_{ALG} ({/Symbol m}m^3/L)", "red", trajectory.time, trajectory.component(X_ALG_INDEX)},
          {xlabel, "Internal cell quota, Q ({/Symbol m}mol/{/Symbol m}m^3)", "blue", trajectory.time, trajectory.component(Q_INDEX)},
          {xlabel, "Remaining nutrients, S ({/Symbol m}mol/L)", "black", trajectory.time, trajectory.component(S_INDEX)},
          {xlabel, "CO_2 flow, m_{2,3} ({/Symbol m}mol/({/Symbol m}m^3 d))", "blue", trajectory.time, CO2_flow(trajectory)},
          {xlabel, "Debugging variable, S + X_{ALG} Q", "red", trajectory.time, mass_balance(trajectory)}};
}

#endif
