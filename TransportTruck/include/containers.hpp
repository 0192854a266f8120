// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef truck_containers_hpp
#define truck_containers_hpp

// Declare a struct with the parameters of the truck
//
template<typename T = double>
struct Truck_Parameters {
  T m_truck; /*--- kg ---*/
  T m_u;     /*--- Unsorted material carried to the incinerator (kg) ---*/

  T F; /*--- Net traction force (N) ---*/
};

// Declare a struct with the initial conditions
//
template<typename T = double>
struct Truck_Initial_Conditions {
  T position;
  T speed;
};

#endif
