// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef transport_truck_hpp
#define transport_truck_hpp

#include <vector>

#include <xtensor/xmath.hpp>

/*--- Add header with the generic runner and the figures ---*/
#include "ode_experiment.hpp"
#include "renderer.hpp"

/*--- Add header with auxiliary structs ---*/
#include "containers.hpp"

// Indices of the state of the truck
//
namespace TruckData {
  static constexpr std::size_t POSITION_INDEX = 0;
  static constexpr std::size_t SPEED_INDEX    = 1;

  static constexpr std::size_t NVARS = SPEED_INDEX + 1;
}

/** Truck moving the unsorted material from the sorter to the incinerator
    under a constant net force
 */
template<typename T = double>
class TransportTruck {
public:
  using Number = T;
  using State  = std::vector<T>;

  static constexpr std::size_t NVARS = TruckData::NVARS;

  TransportTruck(const Truck_Parameters<T>& param_);

  void operator()(const State& X, State& dXdt, const T t) const;

  inline T total_mass() const; /*--- Truck plus cargo ---*/

  inline T acceleration() const;

  State initial_state(const Truck_Initial_Conditions<T>& init) const;

  xt::xtensor<T, 1> reference_position(const Trajectory<T>& trajectory) const; /*--- Uniformly accelerated motion ---*/

  xt::xtensor<T, 1> reference_speed(const Trajectory<T>& trajectory) const;

  T reference_deviation(const Trajectory<T>& trajectory) const;

  std::vector<Figure<T>> make_figures(const Trajectory<T>& trajectory) const;

  const Truck_Parameters<T>& get_parameters() const;

private:
  const Truck_Parameters<T> param;
};

// Implement class constructor
//
template<typename T>
TransportTruck<T>::TransportTruck(const Truck_Parameters<T>& param_):
  param(param_) {
    if(!(total_mass() > static_cast<T>(0.0))) {
      throw Configuration_Error(fmt::format("The total mass must be positive (got {})", total_mass()));
    }
  }

// Return the parameters
//
template<typename T>
const Truck_Parameters<T>& TransportTruck<T>::get_parameters() const {
  return param;
}

// Total mass
//
template<typename T>
inline T TransportTruck<T>::total_mass() const {
  return param.m_truck + param.m_u;
}

// Acceleration
//
template<typename T>
inline T TransportTruck<T>::acceleration() const {
  return param.F/total_mass();
}

// Evaluate the right-hand side
//
template<typename T>
void TransportTruck<T>::operator()(const State& X, State& dXdt, const T t) const {
  (void) t;

  dXdt[TruckData::POSITION_INDEX] = X[TruckData::SPEED_INDEX];
  dXdt[TruckData::SPEED_INDEX]    = acceleration();
}

// Pack the initial conditions in a state vector
//
template<typename T>
typename TransportTruck<T>::State TransportTruck<T>::initial_state(const Truck_Initial_Conditions<T>& init) const {
  State X_ini(NVARS);

  X_ini[TruckData::POSITION_INDEX] = init.position;
  X_ini[TruckData::SPEED_INDEX]    = init.speed;

  return X_ini;
}

// Exact position starting from the first sample
//
template<typename T>
xt::xtensor<T, 1> TransportTruck<T>::reference_position(const Trajectory<T>& trajectory) const {
  const auto x0 = trajectory.states(0, TruckData::POSITION_INDEX);
  const auto v0 = trajectory.states(0, TruckData::SPEED_INDEX);

  return x0 + v0*trajectory.time + static_cast<T>(0.5)*acceleration()*trajectory.time*trajectory.time;
}

// Exact speed starting from the first sample
//
template<typename T>
xt::xtensor<T, 1> TransportTruck<T>::reference_speed(const Trajectory<T>& trajectory) const {
  const auto v0 = trajectory.states(0, TruckData::SPEED_INDEX);

  return v0 + acceleration()*trajectory.time;
}

// Maximum distance (both position and speed) from the exact solution
//
template<typename T>
T TransportTruck<T>::reference_deviation(const Trajectory<T>& trajectory) const {
  const T err_position = xt::amax(xt::abs(trajectory.component(TruckData::POSITION_INDEX) -
                                          reference_position(trajectory)))();
  const T err_speed    = xt::amax(xt::abs(trajectory.component(TruckData::SPEED_INDEX) -
                                          reference_speed(trajectory)))();

  return std::max(err_position, err_speed);
}

// Build the figures
//
template<typename T>
std::vector<Figure<T>> TransportTruck<T>::make_figures(const Trajectory<T>& trajectory) const {
  const std::string xlabel = "Time, t (s)";

  return {{xlabel, "Position, x", "red", trajectory.time, trajectory.component(TruckData::POSITION_INDEX)},
          {xlabel, "Speed, dx/dt", "blue", trajectory.time, trajectory.component(TruckData::SPEED_INDEX)}};
}

#endif
