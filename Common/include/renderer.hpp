// Copyright 2021 SAMURAI TEAM. All rights reserved.
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//
#ifndef renderer_hpp
#define renderer_hpp

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <xtensor/xmath.hpp>
#include <xtensor/xtensor.hpp>

#include <fmt/format.h>

#include "ode_containers.hpp"
#include "ode_errors.hpp"

// Declare a struct with a single line plot
//
template<typename T = double>
struct Figure {
  std::string xlabel;
  std::string ylabel;
  std::string color;

  xt::xtensor<T, 1> x;
  xt::xtensor<T, 1> y;
};

/**
  * Implementation of a generic class to render figures. It only reads the
    trajectory-derived data and has no effect on the simulation
  */
template<typename T = double>
class Renderer {
public:
  Renderer(const Plot_Parameters& plot_param_); /*--- Constructor which accepts the plot settings ---*/

  virtual ~Renderer() {} /*--- Virtual destructor (it can be useful since we work through the base class) ---*/

  virtual void render(const Figure<T>& figure) = 0; /*--- Render a single figure ---*/

  virtual void finalize() {} /*--- Flush everything that is still pending ---*/

  void render_all(const std::vector<Figure<T>>& figures); /*--- Render a set of figures and finalize ---*/

protected:
  const Plot_Parameters plot_param;

  void check_figure(const Figure<T>& figure) const; /*--- Sanity check on the series lengths ---*/
};

// Implement the constructor
//
template<typename T>
Renderer<T>::Renderer(const Plot_Parameters& plot_param_):
  plot_param(plot_param_) {}

// Check that abscissa and ordinate match
//
template<typename T>
void Renderer<T>::check_figure(const Figure<T>& figure) const {
  if(figure.x.size() != figure.y.size()) {
    throw std::invalid_argument(fmt::format("Figure '{}': {} abscissae for {} ordinates",
                                            figure.ylabel, figure.x.size(), figure.y.size()));
  }
}

// Render all the figures
//
template<typename T>
void Renderer<T>::render_all(const std::vector<Figure<T>>& figures) {
  for(const auto& figure : figures) {
    std::cout << fmt::format("Rendering '{}'", figure.ylabel) << std::endl;
    render(figure);
  }
  finalize();
}


/**
 * Implementation of a renderer which pipes the figures to gnuplot (one window per figure).
   SIGPIPE is ignored while the pipe is open, so that a missing or crashed gnuplot
   shows up as a write error instead of terminating the program
 */
template<typename T = double>
class Gnuplot_Renderer: public Renderer<T> {
public:
  Gnuplot_Renderer(const Plot_Parameters& plot_param_); /*--- Constructor. It opens the pipe to gnuplot ---*/

  virtual ~Gnuplot_Renderer(); /*--- Destructor. It closes the pipe if finalize was not called ---*/

  Gnuplot_Renderer(const Gnuplot_Renderer&) = delete;

  Gnuplot_Renderer& operator=(const Gnuplot_Renderer&) = delete;

  virtual void render(const Figure<T>& figure) override;

  virtual void finalize() override; /*--- Close the pipe and check the exit status of gnuplot ---*/

private:
  FILE*       pipe;      /*--- Stream to the gnuplot process ---*/
  std::size_t n_windows; /*--- Number of windows opened so far ---*/

  void (*previous_sigpipe)(int); /*--- Handler to restore once the pipe is closed ---*/

  void send(const std::string& command); /*--- Write a command to gnuplot ---*/

  void flush(); /*--- Push the buffered commands to gnuplot ---*/

  int close_pipe(); /*--- Close the pipe, restore SIGPIPE and return the exit status ---*/

  static std::string quote(const std::string& text); /*--- Single-quoted gnuplot string ---*/
};

// Implement the constructor
//
template<typename T>
Gnuplot_Renderer<T>::Gnuplot_Renderer(const Plot_Parameters& plot_param_):
  Renderer<T>(plot_param_), pipe(nullptr), n_windows(0), previous_sigpipe(SIG_DFL) {
    previous_sigpipe = std::signal(SIGPIPE, SIG_IGN);
    pipe = popen(this->plot_param.gnuplot_command.c_str(), "w");
    if(pipe == nullptr) {
      std::signal(SIGPIPE, previous_sigpipe);
      throw std::runtime_error(fmt::format("Unable to start '{}'", this->plot_param.gnuplot_command));
    }
  }

// Implement the destructor
//
template<typename T>
Gnuplot_Renderer<T>::~Gnuplot_Renderer() {
  if(pipe != nullptr) {
    close_pipe();
  }
}

// Close the pipe
//
template<typename T>
int Gnuplot_Renderer<T>::close_pipe() {
  const int status = pclose(pipe);
  pipe = nullptr;
  std::signal(SIGPIPE, previous_sigpipe);

  return status;
}

// Write a command
//
template<typename T>
void Gnuplot_Renderer<T>::send(const std::string& command) {
  if(std::fputs(command.c_str(), pipe) == EOF || std::ferror(pipe)) {
    throw std::runtime_error(fmt::format("Error while writing to '{}'", this->plot_param.gnuplot_command));
  }
}

// Flush the stream
//
template<typename T>
void Gnuplot_Renderer<T>::flush() {
  if(std::fflush(pipe) == EOF) {
    throw std::runtime_error(fmt::format("Error while writing to '{}'", this->plot_param.gnuplot_command));
  }
}

// Quote a string for gnuplot (a single quote is escaped by doubling it)
//
template<typename T>
std::string Gnuplot_Renderer<T>::quote(const std::string& text) {
  std::string res = "'";
  for(const auto c : text) {
    if(c == '\'') {
      res += "''";
    }
    else {
      res += c;
    }
  }
  res += "'";

  return res;
}

// Render a figure in a new window
//
template<typename T>
void Gnuplot_Renderer<T>::render(const Figure<T>& figure) {
  if(pipe == nullptr) {
    throw std::logic_error("The pipe to gnuplot has already been closed");
  }
  this->check_figure(figure);

  const auto& plot_param = this->plot_param;

  send(fmt::format("set terminal {} {} size {},{} enhanced font ',{}'\n",
                   plot_param.terminal, n_windows++, plot_param.width, plot_param.height, plot_param.font_size));
  send("set grid\n");
  send("unset key\n");
  send(fmt::format("set xlabel {}\n", quote(figure.xlabel)));
  send(fmt::format("set ylabel {}\n", quote(figure.ylabel)));
  send(fmt::format("plot '-' using 1:2 with lines linewidth {} linecolor rgb {}\n",
                   plot_param.line_width, quote(figure.color)));
  for(std::size_t i = 0; i < figure.x.size(); ++i) {
    send(fmt::format("{} {}\n", figure.x(i), figure.y(i)));
  }
  send("e\n");
  flush();
}

// Close the pipe
//
template<typename T>
void Gnuplot_Renderer<T>::finalize() {
  if(pipe == nullptr) {
    return;
  }

  const int status = close_pipe();
  if(status != 0) {
    throw std::runtime_error(fmt::format("'{}' terminated with status {}", this->plot_param.gnuplot_command, status));
  }
}


/**
 * Implementation of a headless renderer which prints a table of sampled values
 */
template<typename T = double>
class Console_Renderer: public Renderer<T> {
public:
  Console_Renderer(const Plot_Parameters& plot_param_, std::ostream& os_ = std::cout);

  virtual void render(const Figure<T>& figure) override;

private:
  std::ostream& os;
};

// Implement the constructor
//
template<typename T>
Console_Renderer<T>::Console_Renderer(const Plot_Parameters& plot_param_, std::ostream& os_):
  Renderer<T>(plot_param_), os(os_) {}

// Print the figure as a table with 'console_rows' evenly spaced rows
//
template<typename T>
void Console_Renderer<T>::render(const Figure<T>& figure) {
  this->check_figure(figure);

  const auto n = figure.x.size();
  os << fmt::format("{:>16} | {}", figure.xlabel, figure.ylabel) << std::endl;
  if(n == 0) {
    return;
  }

  const auto n_rows = std::min(std::max<std::size_t>(this->plot_param.console_rows, 2), n);
  for(std::size_t r = 0; r < n_rows; ++r) {
    const auto i = (n_rows > 1) ? (r*(n - 1))/(n_rows - 1) : 0;
    os << fmt::format("{:>16.6g} | {:.6g}", figure.x(i), figure.y(i)) << std::endl;
  }
  os << fmt::format("{:>16} | min = {:.6g}, max = {:.6g}", "",
                    xt::amin(figure.y)(), xt::amax(figure.y)()) << std::endl;
}


// Create the renderer from its name. 'none' gives back a null pointer
//
template<typename T = double>
std::unique_ptr<Renderer<T>> make_renderer(const Plot_Parameters& plot_param) {
  if(plot_param.renderer == "gnuplot") {
    return std::make_unique<Gnuplot_Renderer<T>>(plot_param);
  }
  else if(plot_param.renderer == "console") {
    return std::make_unique<Console_Renderer<T>>(plot_param);
  }
  else if(plot_param.renderer == "none") {
    return nullptr;
  }

  throw Configuration_Error(fmt::format("Unknown renderer '{}' (expected 'gnuplot', 'console' or 'none')",
                                        plot_param.renderer));
}

#endif
