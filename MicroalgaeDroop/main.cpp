// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#include <iostream>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include "input_options.hpp"

#include "include/microalgae_droop.hpp"

// Main function to run the program
//
int main(int argc, char* argv[]) {
  CLI::App app{"Microalgae growth with the Droop model"};

  try {
    const auto input = read_input_file("input.json");

    /*--- Set and declare simulation parameters related to final time and output ---*/
    Solver_Parameters<double> sim_param;
    read_solver_parameters(input, sim_param, 15.0); // days
    add_solver_options(app, sim_param);

    Plot_Parameters plot_param;
    read_plot_parameters(input, plot_param);
    add_plot_options(app, plot_param);

    /*--- Set and declare the parameters of the model ---*/
    Droop_Parameters<double> model_param;

    model_param.K_sI     = input.value("K_sI", 0.0);
    model_param.K_iI     = input.value("K_iI", 295.0);
    model_param.mu_tilde = input.value("mu_tilde", 1.7);
    model_param.k_q      = input.value("k_q", 1.7);

    model_param.K_S     = input.value("K_S", 0.1);
    model_param.rho_max = input.value("rho_max", 9.40);

    model_param.T_h  = input.value("T_h", 1.0/0.45);
    model_param.S_in = input.value("S_in", 100.0);

    model_param.K_CO2 = input.value("K_CO2", 0.3);

    model_param.I = input.value("I", 50.0);

    /*--- Allow for parsing from command line ---*/
    app.add_option("--K_sI", model_param.K_sI, "Light half-saturation constant")->capture_default_str()->group("Growth rate");
    app.add_option("--K_iI", model_param.K_iI, "Light inhibition constant")->capture_default_str()->group("Growth rate");
    app.add_option("--mu_tilde", model_param.mu_tilde, "Maximum growth rate")->capture_default_str()->group("Growth rate");
    app.add_option("--k_q", model_param.k_q, "Minimum cell quota")->capture_default_str()->group("Growth rate");

    app.add_option("--K_S", model_param.K_S, "Uptake half-saturation constant")->capture_default_str()->group("Uptake rate");
    app.add_option("--rho_max", model_param.rho_max, "Maximum uptake rate")->capture_default_str()->group("Uptake rate");

    app.add_option("--T_h", model_param.T_h, "Hydraulic retention time")->capture_default_str()->group("Reactor");
    app.add_option("--S_in", model_param.S_in, "Inlet nutrient concentration")->capture_default_str()->group("Reactor");

    app.add_option("--K_CO2", model_param.K_CO2, "CO2 absorption coefficient")->capture_default_str()->group("CO2 absorption");

    app.add_option("--I", model_param.I, "Light intensity")->capture_default_str()->group("Inputs");

    /*--- Set and declare the initial conditions ---*/
    Droop_Initial_Conditions<double> init;

    init.X_ALG = input.value("X_ALG_ini", 26.0);
    init.Q     = input.value("Q_ini", 2.82);
    init.S     = input.value("S_ini", 0.0);

    app.add_option("--X_ALG_ini", init.X_ALG, "Initial algal biomass")->capture_default_str()->group("Initial conditions");
    app.add_option("--Q_ini", init.Q, "Initial internal cell quota")->capture_default_str()->group("Initial conditions");
    app.add_option("--S_ini", init.S, "Initial nutrient concentration")->capture_default_str()->group("Initial conditions");

    /*--- Create the instance of the class to perform the simulation ---*/
    CLI11_PARSE(app, argc, argv);

    std::cout << "Initializing variables " << std::endl;
    std::cout << std::endl;

    const MicroalgaeDroop<double> droop(model_param);
    ODE_Experiment<MicroalgaeDroop<double>> experiment(droop, droop.initial_state(init), sim_param);

    const auto& trajectory = experiment.run();

    if(sim_param.verbose) {
      std::cout << fmt::format("Maximum deviation of S + X_ALG*Q from the first-order relaxation: {:.3e}",
                               droop.mass_balance_deviation(trajectory)) << std::endl;
    }

    /*--- Render the results ---*/
    auto renderer = make_renderer<double>(plot_param);
    if(renderer) {
      renderer->render_all(droop.make_figures(trajectory));
    }
  }
  catch(std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
