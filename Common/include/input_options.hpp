// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef input_options_hpp
#define input_options_hpp

#include <fstream>
#include <string>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include "ode_containers.hpp"

// Read the JSON input file. A missing file gives an empty object (all defaults),
// a malformed one throws
//
inline nlohmann::json read_input_file(const std::string& filename) {
  std::ifstream ifs(filename);
  if(!ifs.is_open()) {
    return nlohmann::json::object();
  }

  return nlohmann::json::parse(ifs);
}

// Set the solver parameters from the input file
//
template<typename T>
void read_solver_parameters(const nlohmann::json& input,
                            Solver_Parameters<T>& solver_param,
                            const T Tf_default) {
  solver_param.Tf = input.value("Tf", Tf_default);

  solver_param.n_samples = input.value("n_samples", solver_param.n_samples);

  solver_param.max_steps = input.value("max_steps", solver_param.max_steps);
  solver_param.atol      = input.value("atol", solver_param.atol);
  solver_param.rtol      = input.value("rtol", solver_param.rtol);

  solver_param.verbose = input.value("verbose", solver_param.verbose);
}

// Allow for parsing the solver parameters from command line
//
template<typename T>
void add_solver_options(CLI::App& app, Solver_Parameters<T>& solver_param) {
  app.add_option("--Tf", solver_param.Tf, "Final time")->capture_default_str()->group("Simulation parameters");
  app.add_option("--n_samples", solver_param.n_samples,
                 "Number of evenly spaced output samples")->capture_default_str()->group("Simulation parameters");
  app.add_option("--max_steps", solver_param.max_steps,
                 "Maximum number of internal steps per output interval")->capture_default_str()->group("Numerical parameters");
  app.add_option("--atol", solver_param.atol, "Absolute tolerance")->capture_default_str()->group("Numerical parameters");
  app.add_option("--rtol", solver_param.rtol, "Relative tolerance")->capture_default_str()->group("Numerical parameters");
  app.add_option("--verbose", solver_param.verbose, "Print integration statistics")->capture_default_str()->group("Output");
}

// Set the plot parameters from the input file
//
inline void read_plot_parameters(const nlohmann::json& input, Plot_Parameters& plot_param) {
  plot_param.renderer = input.value("renderer", plot_param.renderer);
  plot_param.terminal = input.value("terminal", plot_param.terminal);

  plot_param.gnuplot_command = input.value("gnuplot_command", plot_param.gnuplot_command);

  plot_param.line_width   = input.value("line_width", plot_param.line_width);
  plot_param.font_size    = input.value("font_size", plot_param.font_size);
  plot_param.width        = input.value("width", plot_param.width);
  plot_param.height       = input.value("height", plot_param.height);
  plot_param.console_rows = input.value("console_rows", plot_param.console_rows);
}

// Allow for parsing the plot parameters from command line
//
inline void add_plot_options(CLI::App& app, Plot_Parameters& plot_param) {
  app.add_option("--renderer", plot_param.renderer, "Renderer for the figures")
     ->capture_default_str()->check(CLI::IsMember({"gnuplot", "console", "none"}))->group("Output");
  app.add_option("--terminal", plot_param.terminal, "gnuplot terminal")->capture_default_str()->group("Output");
  app.add_option("--gnuplot_command", plot_param.gnuplot_command,
                 "Command started to draw the figures")->capture_default_str()->group("Output");
  app.add_option("--line_width", plot_param.line_width, "Line width")->capture_default_str()->group("Output");
  app.add_option("--font_size", plot_param.font_size, "Font size of labels and ticks")->capture_default_str()->group("Output");
  app.add_option("--width", plot_param.width, "Window width (pixels)")->capture_default_str()->group("Output");
  app.add_option("--height", plot_param.height, "Window height (pixels)")->capture_default_str()->group("Output");
  app.add_option("--console_rows", plot_param.console_rows,
                 "Rows printed per figure by the console renderer")->capture_default_str()->group("Output");
}

#endif
