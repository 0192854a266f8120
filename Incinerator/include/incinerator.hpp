// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef incinerator_hpp
#define incinerator_hpp

#include <vector>

/*--- Add header with the generic runner and the figures ---*/
#include "ode_experiment.hpp"
#include "renderer.hpp"

/*--- Add header with auxiliary structs ---*/
#include "containers.hpp"

// Indices of the state of the incinerator
//
namespace IncineratorData {
  static constexpr std::size_t M_INDEX      = 0; /*--- Waste mass ---*/
  static constexpr std::size_t M_CHAR_INDEX = 1; /*--- Char mass ---*/
  static constexpr std::size_t T_W_INDEX    = 2; /*--- Wastebed temperature ---*/
  static constexpr std::size_t M_G_W_INDEX  = 3; /*--- Gas mass in the wastebed ---*/
  static constexpr std::size_t M_G_F_INDEX  = 4; /*--- Gas mass in the freeboard ---*/
  static constexpr std::size_t T_G_INDEX    = 5; /*--- Gas temperature in the freeboard ---*/

  static constexpr std::size_t NVARS = T_G_INDEX + 1;
}

/** Incinerator compartment: mass balances of waste, char and gases
    and energy balances of the wastebed and of the freeboard
 */
template<typename T = double>
class Incinerator {
public:
  using Number = T;
  using State  = std::vector<T>;

  static constexpr std::size_t NVARS = IncineratorData::NVARS;

  Incinerator(const Incinerator_Parameters<T>& param_); /*--- Class constructor (parameters are frozen here) ---*/

  void operator()(const State& X, State& dXdt, const T t) const; /*--- Vector field ---*/

  State initial_state(const Incinerator_Initial_Conditions<T>& init) const; /*--- Pack the initial conditions ---*/

  std::vector<Figure<T>> make_figures(const Trajectory<T>& trajectory) const; /*--- One figure per state ---*/

  const Incinerator_Parameters<T>& get_parameters() const;

private:
  const Incinerator_Parameters<T> param;
};

// Implement class constructor
//
template<typename T>
Incinerator<T>::Incinerator(const Incinerator_Parameters<T>& param_):
  param(param_) {}

// Return the parameters
//
template<typename T>
const Incinerator_Parameters<T>& Incinerator<T>::get_parameters() const {
  return param;
}

// Evaluate the right-hand side. The system is autonomous, so t is unused
//
template<typename T>
void Incinerator<T>::operator()(const State& X, State& dXdt, const T t) const {
  (void) t;

  using namespace IncineratorData;

  /*--- Waste and char ---*/
  dXdt[M_INDEX]      = param.F_in - param.F_out - param.R_w;
  dXdt[M_CHAR_INDEX] = -param.F_char_out + param.P_char - param.R_char;

  /*--- Wastebed temperature ---*/
  dXdt[T_W_INDEX] = (param.F_in*param.c_p_w*X[T_W_INDEX] +
                     param.F_aI*param.c_p_g*(param.T_aI - X[T_W_INDEX]) +
                     param.Q)/
                    (param.c_p_w*X[M_INDEX] + param.c_p_char*X[M_CHAR_INDEX] + param.c_p_m*param.M_grate);

  /*--- Gases ---*/
  dXdt[M_G_W_INDEX] = param.F_aI - param.F_g_w_out + param.R_g;
  dXdt[M_G_F_INDEX] = param.F_g_w_out - param.F_g_out + param.F_aII;

  /*--- Gas temperature in the freeboard ---*/
  dXdt[T_G_INDEX] = (param.F_g_w_out*param.c_p_g*(X[T_W_INDEX] - X[T_G_INDEX]) +
                     param.F_aII*param.c_p_g*(param.T_aII - X[T_G_INDEX]) +
                     param.Q_g - param.Q_ext)/
                    (param.c_p_g*X[M_G_F_INDEX] + param.c_p_m*param.M_f_b);
}

// Pack the initial conditions in a state vector
//
template<typename T>
typename Incinerator<T>::State Incinerator<T>::initial_state(const Incinerator_Initial_Conditions<T>& init) const {
  State X_ini(NVARS);

  X_ini[IncineratorData::M_INDEX]      = init.M;
  X_ini[IncineratorData::M_CHAR_INDEX] = init.M_char;
  X_ini[IncineratorData::T_W_INDEX]    = init.T_w;
  X_ini[IncineratorData::M_G_W_INDEX]  = init.M_g_w;
  X_ini[IncineratorData::M_G_F_INDEX]  = init.M_g_f;
  X_ini[IncineratorData::T_G_INDEX]    = init.T_g;

  return X_ini;
}

// Build the figures
//
template<typename T>
std::vector<Figure<T>> Incinerator<T>::make_figures(const Trajectory<T>& trajectory) const {
  using namespace IncineratorData;

  const std::string xlabel = "Time, t (min)";

  return {{xlabel, "Waste mass, M", "red", trajectory.time, trajectory.component(M_INDEX)},
          {xlabel, "Char mass, M_{char}", "blue", trajectory.time, trajectory.component(M_CHAR_INDEX)},
          {xlabel, "Wastebed temperature, T_w", "green", trajectory.time, trajectory.component(T_W_INDEX)},
          {xlabel, "Gas mass in wastebed, M_{g,w}", "black", trajectory.time, trajectory.component(M_G_W_INDEX)},
          {xlabel, "Gas mass in freeboard, M_{g,f}", "black", trajectory.time, trajectory.component(M_G_F_INDEX)},
          {xlabel, "Gas temperature in freeboard, T_g", "black", trajectory.time, trajectory.component(T_G_INDEX)}};
}

#endif
