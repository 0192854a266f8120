// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef droop_containers_hpp
#define droop_containers_hpp

// Declare a struct with the parameters of the Droop model
//
template<typename T = double>
struct Droop_Parameters {
  /*--- Growth rate ---*/
  T K_sI;     /*--- Light half-saturation constant (placeholder, value not available) ---*/
  T K_iI;     /*--- Light inhibition constant ---*/
  T mu_tilde; /*--- Maximum growth rate ---*/
  T k_q;      /*--- Minimum cell quota ---*/

  /*--- Uptake rate ---*/
  T K_S;
  T rho_max;

  /*--- Reactor ---*/
  T T_h;  /*--- Hydraulic retention time (inverse of the dilution rate) ---*/
  T S_in; /*--- Inlet nutrient concentration ---*/

  /*--- CO2 absorption ---*/
  T K_CO2; /*--- 0 < K_CO2 < 1 ---*/

  /*--- Input ---*/
  T I; /*--- Light intensity ---*/
};

// Declare a struct with the initial conditions
//
template<typename T = double>
struct Droop_Initial_Conditions {
  T X_ALG; /*--- Algal biomass ---*/
  T Q;     /*--- Internal cell quota ---*/
  T S;     /*--- Remaining nutrients ---*/
};

#endif
