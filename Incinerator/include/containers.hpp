// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef incinerator_containers_hpp
#define incinerator_containers_hpp

// Declare a struct with the parameters of the incinerator
// (flows, rates, heat capacities and heat sources)
//
template<typename T = double>
struct Incinerator_Parameters {
  /*--- Waste mass balance ---*/
  T F_in;  /*--- Inlet waste ---*/
  T F_out; /*--- Outlet ashes ---*/
  T R_w;   /*--- Consumption rate ---*/

  /*--- Char mass balance ---*/
  T F_char_out; /*--- Output flow of char ---*/
  T P_char;     /*--- Production rate due to pyrolysis ---*/
  T R_char;     /*--- Consumption rate due to combustion ---*/

  /*--- Wastebed energy balance ---*/
  T c_p_w;
  T F_aI;
  T c_p_g;
  T T_aI; /*--- Ambient temperature ---*/
  T Q;    /*--- Exothermic reaction ---*/
  T c_p_char;
  T c_p_m; /*--- Shared by both energy balances ---*/
  T M_grate;

  /*--- Gas mass balances ---*/
  T F_g_w_out;
  T R_g; /*--- Production rate of gases due to combustion/pyrolysis ---*/
  T F_g_out;
  T F_aII;

  /*--- Freeboard energy balance ---*/
  T M_f_b;
  T T_aII;
  T Q_g;

  /*--- Input ---*/
  T Q_ext; /*--- Heat affecting the temperature of the gases in the freeboard ---*/
};

// Declare a struct with the initial conditions
//
template<typename T = double>
struct Incinerator_Initial_Conditions {
  T M;
  T M_char;
  T T_w;
  T M_g_w;
  T M_g_f;
  T T_g;
};

#endif
