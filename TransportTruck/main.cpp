// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#include <iostream>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include "input_options.hpp"

#include "include/transport_truck.hpp"

// Main function to run the program
//
int main(int argc, char* argv[]) {
  CLI::App app{"Transport truck between the sorter and the incinerator"};

  try {
    const auto input = read_input_file("input.json");

    /*--- Set and declare simulation parameters related to final time and output ---*/
    Solver_Parameters<double> sim_param;
    read_solver_parameters(input, sim_param, 15.0); // seconds
    add_solver_options(app, sim_param);

    Plot_Parameters plot_param;
    read_plot_parameters(input, plot_param);
    add_plot_options(app, plot_param);

    /*--- Set and declare the parameters of the model ---*/
    Truck_Parameters<double> model_param;

    model_param.m_truck = input.value("m_truck", 3000.0);
    model_param.m_u     = input.value("m_u", 210.0);
    model_param.F       = input.value("F", 4000.0);

    app.add_option("--m_truck", model_param.m_truck, "Mass of the empty truck")->capture_default_str()->group("Physical parameters");
    app.add_option("--m_u", model_param.m_u, "Mass of the unsorted material")->capture_default_str()->group("Physical parameters");
    app.add_option("--F", model_param.F, "Net traction force")->capture_default_str()->group("Physical parameters");

    /*--- Set and declare the initial conditions ---*/
    Truck_Initial_Conditions<double> init;

    init.position = input.value("position_ini", 0.0);
    init.speed    = input.value("speed_ini", 4.0);

    app.add_option("--position_ini", init.position, "Initial position")->capture_default_str()->group("Initial conditions");
    app.add_option("--speed_ini", init.speed, "Initial speed")->capture_default_str()->group("Initial conditions");

    /*--- Create the instance of the class to perform the simulation ---*/
    CLI11_PARSE(app, argc, argv);

    std::cout << "Initializing variables " << std::endl;
    std::cout << std::endl;

    const TransportTruck<double> truck(model_param);
    ODE_Experiment<TransportTruck<double>> experiment(truck, truck.initial_state(init), sim_param);

    const auto& trajectory = experiment.run();

    if(sim_param.verbose) {
      std::cout << fmt::format("Acceleration: {} m/s^2", truck.acceleration()) << std::endl;
      std::cout << fmt::format("Maximum deviation from the uniformly accelerated motion: {:.3e}",
                               truck.reference_deviation(trajectory)) << std::endl;
    }

    /*--- Render the results ---*/
    auto renderer = make_renderer<double>(plot_param);
    if(renderer) {
      renderer->render_all(truck.make_figures(trajectory));
    }
  }
  catch(std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
