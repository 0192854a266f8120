// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#include <iostream>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include "input_options.hpp"

#include "include/incinerator.hpp"

// Main function to run the program
//
int main(int argc, char* argv[]) {
  CLI::App app{"Incinerator compartment: mass and energy balances of wastebed and freeboard"};

  try {
    const auto input = read_input_file("input.json");

    /*--- Set and declare simulation parameters related to final time and output ---*/
    Solver_Parameters<double> sim_param;
    read_solver_parameters(input, sim_param, 3.0*60.0); // minutes
    add_solver_options(app, sim_param);

    Plot_Parameters plot_param;
    read_plot_parameters(input, plot_param);
    add_plot_options(app, plot_param);

    /*--- Set and declare the parameters of the model ---*/
    Incinerator_Parameters<double> model_param;

    model_param.F_in  = input.value("F_in", 100.0);
    model_param.F_out = input.value("F_out", 10.0);
    model_param.R_w   = input.value("R_w", 70.0);

    model_param.F_char_out = input.value("F_char_out", 2.0);
    model_param.P_char     = input.value("P_char", 6.0);
    model_param.R_char     = input.value("R_char", 3.0);

    model_param.c_p_w    = input.value("c_p_w", 1.0);
    model_param.F_aI     = input.value("F_aI", 5.0);
    model_param.c_p_g    = input.value("c_p_g", 5.0);
    model_param.T_aI     = input.value("T_aI", 20.0);
    model_param.Q        = input.value("Q", 100.0);
    model_param.c_p_char = input.value("c_p_char", 1.0);
    model_param.c_p_m    = input.value("c_p_m", 5.0);
    model_param.M_grate  = input.value("M_grate", 500.0);

    model_param.F_g_w_out = input.value("F_g_w_out", 2.0);
    model_param.R_g       = input.value("R_g", 1.0);
    model_param.F_g_out   = input.value("F_g_out", 2.0);
    model_param.F_aII     = input.value("F_aII", 3.0);

    model_param.M_f_b = input.value("M_f_b", 120.0);
    model_param.T_aII = input.value("T_aII", 20.0);
    model_param.Q_g   = input.value("Q_g", 450.0);

    model_param.Q_ext = input.value("Q_ext", 40.0);

    /*--- Allow for parsing from command line ---*/
    app.add_option("--F_in", model_param.F_in, "Inlet waste")->capture_default_str()->group("Waste mass balance");
    app.add_option("--F_out", model_param.F_out, "Outlet ashes")->capture_default_str()->group("Waste mass balance");
    app.add_option("--R_w", model_param.R_w, "Waste consumption rate")->capture_default_str()->group("Waste mass balance");

    app.add_option("--F_char_out", model_param.F_char_out, "Output flow of char")->capture_default_str()->group("Char mass balance");
    app.add_option("--P_char", model_param.P_char, "Char production rate (pyrolysis)")->capture_default_str()->group("Char mass balance");
    app.add_option("--R_char", model_param.R_char, "Char consumption rate (combustion)")->capture_default_str()->group("Char mass balance");

    app.add_option("--c_p_w", model_param.c_p_w, "Specific heat of the waste")->capture_default_str()->group("Wastebed energy balance");
    app.add_option("--F_aI", model_param.F_aI, "Primary air flow")->capture_default_str()->group("Wastebed energy balance");
    app.add_option("--c_p_g", model_param.c_p_g, "Specific heat of the gases")->capture_default_str()->group("Wastebed energy balance");
    app.add_option("--T_aI", model_param.T_aI, "Primary air temperature")->capture_default_str()->group("Wastebed energy balance");
    app.add_option("--Q", model_param.Q, "Exothermic reaction heat")->capture_default_str()->group("Wastebed energy balance");
    app.add_option("--c_p_char", model_param.c_p_char, "Specific heat of char")->capture_default_str()->group("Wastebed energy balance");
    app.add_option("--c_p_m", model_param.c_p_m, "Specific heat of the metal")->capture_default_str()->group("Wastebed energy balance");
    app.add_option("--M_grate", model_param.M_grate, "Mass of the grate")->capture_default_str()->group("Wastebed energy balance");

    app.add_option("--F_g_w_out", model_param.F_g_w_out, "Gas flow out of the wastebed")->capture_default_str()->group("Gas mass balances");
    app.add_option("--R_g", model_param.R_g, "Gas production rate")->capture_default_str()->group("Gas mass balances");
    app.add_option("--F_g_out", model_param.F_g_out, "Gas flow out of the freeboard")->capture_default_str()->group("Gas mass balances");
    app.add_option("--F_aII", model_param.F_aII, "Secondary air flow")->capture_default_str()->group("Gas mass balances");

    app.add_option("--M_f_b", model_param.M_f_b, "Metal mass of the freeboard")->capture_default_str()->group("Freeboard energy balance");
    app.add_option("--T_aII", model_param.T_aII, "Secondary air temperature")->capture_default_str()->group("Freeboard energy balance");
    app.add_option("--Q_g", model_param.Q_g, "Heat released in the freeboard")->capture_default_str()->group("Freeboard energy balance");

    app.add_option("--Q_ext", model_param.Q_ext, "External heat on the freeboard gases")->capture_default_str()->group("Inputs");

    /*--- Set and declare the initial conditions ---*/
    Incinerator_Initial_Conditions<double> init;

    init.M      = input.value("M_ini", 0.0);
    init.M_char = input.value("M_char_ini", 0.0);
    init.T_w    = input.value("T_w_ini", 20.0);
    init.M_g_w  = input.value("M_g_w_ini", 0.0);
    init.M_g_f  = input.value("M_g_f_ini", 0.0);
    init.T_g    = input.value("T_g_ini", 20.0);

    app.add_option("--M_ini", init.M, "Initial waste mass")->capture_default_str()->group("Initial conditions");
    app.add_option("--M_char_ini", init.M_char, "Initial char mass")->capture_default_str()->group("Initial conditions");
    app.add_option("--T_w_ini", init.T_w, "Initial wastebed temperature")->capture_default_str()->group("Initial conditions");
    app.add_option("--M_g_w_ini", init.M_g_w, "Initial gas mass in the wastebed")->capture_default_str()->group("Initial conditions");
    app.add_option("--M_g_f_ini", init.M_g_f, "Initial gas mass in the freeboard")->capture_default_str()->group("Initial conditions");
    app.add_option("--T_g_ini", init.T_g, "Initial gas temperature in the freeboard")->capture_default_str()->group("Initial conditions");

    /*--- Create the instance of the class to perform the simulation ---*/
    CLI11_PARSE(app, argc, argv);

    std::cout << "Initializing variables " << std::endl;
    std::cout << std::endl;

    const Incinerator<double> incinerator(model_param);
    ODE_Experiment<Incinerator<double>> experiment(incinerator, incinerator.initial_state(init), sim_param);

    const auto& trajectory = experiment.run();

    /*--- Render the results ---*/
    auto renderer = make_renderer<double>(plot_param);
    if(renderer) {
      renderer->render_all(incinerator.make_figures(trajectory));
    }
  }
  catch(std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
