#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ode_experiment.hpp"
#include "renderer.hpp"

namespace {

#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

// Expect a given exception type from an expression
#define REQUIRE_THROWS_AS(expr, Exception, msg)                                 \
    do {                                                                        \
        bool thrown_ = false;                                                   \
        try {                                                                   \
            expr;                                                               \
        } catch (const Exception&) {                                            \
            thrown_ = true;                                                     \
        }                                                                       \
        REQUIRE(thrown_, msg);                                                  \
    } while (0)

// dx/dt = -k x
struct Decay {
    using Number = double;
    using State  = std::vector<double>;

    static constexpr std::size_t NVARS = 1;

    double k = 0.5;

    void operator()(const State& X, State& dXdt, const double /*t*/) const {
        dXdt[0] = -k * X[0];
    }
};

// dx/dt = 1/x, singular at x = 0
struct Singular {
    using Number = double;
    using State  = std::vector<double>;

    static constexpr std::size_t NVARS = 1;

    void operator()(const State& X, State& dXdt, const double /*t*/) const {
        dXdt[0] = 1.0 / X[0];
    }
};

// Stiff linear pair, forces many small explicit steps
struct Stiff {
    using Number = double;
    using State  = std::vector<double>;

    static constexpr std::size_t NVARS = 2;

    void operator()(const State& X, State& dXdt, const double /*t*/) const {
        dXdt[0] = -1000.0 * (X[0] - std::cos(X[1]));
        dXdt[1] = 1.0;
    }
};

Solver_Parameters<double> make_solver_parameters(const double Tf, const std::size_t n_samples) {
    Solver_Parameters<double> sp;
    sp.Tf        = Tf;
    sp.n_samples = n_samples;
    return sp;
}

static void testMeshAndInitialSample() {
    ODE_Experiment<Decay> experiment(Decay{}, {2.0}, make_solver_parameters(4.0, 101));
    const auto& tr = experiment.run();

    REQUIRE(tr.size() == 101, "trajectory must have n_samples rows");
    REQUIRE(tr.states.shape(0) == 101 && tr.states.shape(1) == 1, "unexpected storage shape");
    REQUIRE(tr.time(0) == 0.0, "mesh must start at 0");
    REQUIRE(tr.time(100) == 4.0, "mesh must end exactly at Tf");
    REQUIRE(std::abs(tr.time(50) - 2.0) < 1e-12, "mesh must be evenly spaced");
    REQUIRE(tr.states(0, 0) == 2.0, "first sample must equal the initial state");
    REQUIRE(tr.diagnostics.n_samples == 101, "diagnostics must count every sample");
    REQUIRE(tr.diagnostics.n_rhs_evaluations > 0, "the vector field was never evaluated");
    std::cout << "[PASS] mesh and initial sample\n";
}

static void testAccuracyAgainstExponential() {
    ODE_Experiment<Decay> experiment(Decay{}, {2.0}, make_solver_parameters(4.0, 41));
    const auto& tr = experiment.run();

    double err = 0.0;
    for (std::size_t i = 0; i < tr.size(); ++i) {
        const double exact = 2.0 * std::exp(-0.5 * tr.time(i));
        err = std::max(err, std::abs(tr.states(i, 0) - exact));
    }
    REQUIRE(err < 1e-6, "decay deviates from the exponential: " << err);
    std::cout << "[PASS] accuracy against exponential decay (err=" << err << ")\n";
}

static void testDeterminism() {
    ODE_Experiment<Decay> first(Decay{}, {1.0}, make_solver_parameters(3.0, 31));
    ODE_Experiment<Decay> second(Decay{}, {1.0}, make_solver_parameters(3.0, 31));

    const auto& a = first.run();
    const auto& b = second.run();
    for (std::size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a.states(i, 0) == b.states(i, 0), "two runs with the same inputs differ at row " << i);
    }
    REQUIRE(a.diagnostics.n_steps == b.diagnostics.n_steps, "step counts differ between runs");

    // A second run of the same experiment gives back the same data
    const std::vector<double> before(a.states.cbegin(), a.states.cend());
    first.run();
    const auto& again = first.get_trajectory();
    for (std::size_t i = 0; i < before.size(); ++i) {
        REQUIRE(again.states(i, 0) == before[i], "rerun differs at row " << i);
    }
    std::cout << "[PASS] determinism\n";
}

static void testZeroHorizon() {
    ODE_Experiment<Decay> experiment(Decay{}, {3.0}, make_solver_parameters(0.0, 5));
    const auto& tr = experiment.run();

    REQUIRE(tr.size() == 5, "zero horizon must still give n_samples rows");
    for (std::size_t i = 0; i < tr.size(); ++i) {
        REQUIRE(tr.time(i) == 0.0, "zero horizon mesh must be all zeros");
        REQUIRE(tr.states(i, 0) == 3.0, "zero horizon must repeat the initial state");
    }
    REQUIRE(tr.diagnostics.n_steps == 0, "no step should be taken on a zero horizon");
    std::cout << "[PASS] zero horizon\n";
}

static void testConfigurationErrors() {
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0, 2.0}, make_solver_parameters(1.0, 10)),
                      Configuration_Error, "state size mismatch accepted");
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {}, make_solver_parameters(1.0, 10)),
                      Configuration_Error, "empty state accepted");
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {std::numeric_limits<double>::quiet_NaN()},
                                            make_solver_parameters(1.0, 10)),
                      Configuration_Error, "NaN initial value accepted");
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0}, make_solver_parameters(-1.0, 10)),
                      Configuration_Error, "negative horizon accepted");
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0}, make_solver_parameters(1.0, 1)),
                      Configuration_Error, "single sample accepted");
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0}, make_solver_parameters(1.0, 0)),
                      Configuration_Error, "zero samples accepted");

    auto sp = make_solver_parameters(1.0, 10);
    sp.atol = 0.0;
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0}, sp), Configuration_Error, "zero atol accepted");

    sp = make_solver_parameters(1.0, 10);
    sp.rtol = -1e-6;
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0}, sp), Configuration_Error, "negative rtol accepted");

    sp = make_solver_parameters(1.0, 10);
    sp.max_steps = 0;
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0}, sp), Configuration_Error, "zero max_steps accepted");

    // Configuration errors are invalid arguments
    REQUIRE_THROWS_AS(ODE_Experiment<Decay>(Decay{}, {1.0}, make_solver_parameters(1.0, 1)),
                      std::invalid_argument, "Configuration_Error must derive from std::invalid_argument");
    std::cout << "[PASS] configuration errors\n";
}

static void testIntegrationFailure() {
    auto sp = make_solver_parameters(1.0, 3);
    sp.max_steps = 5;

    ODE_Experiment<Stiff> experiment(Stiff{}, {0.0, 0.0}, sp);
    bool thrown = false;
    try {
        experiment.run();
    } catch (const Integration_Failure& e) {
        thrown = true;
        REQUIRE(e.get_t_begin() == 0.0, "failure must be located in the first interval, got " << e.get_t_begin());
        REQUIRE(e.get_t_end() == 0.5, "failure interval must end at the next sample, got " << e.get_t_end());
        REQUIRE(std::string(e.what()).find("[0, 0.5]") != std::string::npos,
                "message must name the interval: " << e.what());
    }
    REQUIRE(thrown, "step budget exhaustion must raise Integration_Failure");
    std::cout << "[PASS] integration failure\n";
}

static void testNumericalFault() {
    ODE_Experiment<Singular> experiment(Singular{}, {0.0}, make_solver_parameters(1.0, 10));
    bool thrown = false;
    try {
        experiment.run();
    } catch (const Numerical_Fault& e) {
        thrown = true;
        REQUIRE(e.get_component() == 0, "fault must name the offending component");
        REQUIRE(e.get_time() == 0.0, "fault must be detected at the first evaluation");
    }
    REQUIRE(thrown, "a non-finite derivative must raise Numerical_Fault");
    std::cout << "[PASS] numerical fault\n";
}

static void testComponentAccess() {
    ODE_Experiment<Decay> experiment(Decay{}, {1.0}, make_solver_parameters(1.0, 11));
    const auto& tr = experiment.run();

    const auto x = tr.component(0);
    REQUIRE(x.size() == 11, "component must have one value per sample");
    REQUIRE(x(0) == 1.0, "component must start at the initial value");
    REQUIRE_THROWS_AS(tr.component(1), std::out_of_range, "out of range component accepted");
    std::cout << "[PASS] component access\n";
}

static void testConsoleRenderer() {
    Plot_Parameters pp;
    pp.renderer     = "console";
    pp.console_rows = 3;

    Figure<double> fig;
    fig.xlabel = "Time, t (s)";
    fig.ylabel = "Position, x";
    fig.color  = "red";
    fig.x      = xt::linspace<double>(0.0, 10.0, 11);
    fig.y      = 2.0 * fig.x;

    std::ostringstream os;
    Console_Renderer<double> renderer(pp, os);
    renderer.render_all({fig});

    const auto out = os.str();
    REQUIRE(out.find("Position, x") != std::string::npos, "console output must carry the label");
    REQUIRE(out.find("min = 0, max = 20") != std::string::npos, "console output must report the range: " << out);

    std::size_t lines = 0;
    for (const auto c : out) {
        lines += (c == '\n');
    }
    REQUIRE(lines == 5, "header, three rows and the range line expected, got " << lines);

    fig.y = xt::zeros<double>({3});
    REQUIRE_THROWS_AS(renderer.render(fig), std::invalid_argument, "mismatched series accepted");
    std::cout << "[PASS] console renderer\n";
}

static void testRendererSelection() {
    Plot_Parameters pp;

    pp.renderer = "none";
    REQUIRE(make_renderer<double>(pp) == nullptr, "'none' must not create a renderer");

    pp.renderer = "console";
    REQUIRE(make_renderer<double>(pp) != nullptr, "'console' must create a renderer");

    pp.renderer = "matplotlib";
    REQUIRE_THROWS_AS(make_renderer<double>(pp), Configuration_Error, "unknown renderer accepted");
    std::cout << "[PASS] renderer selection\n";
}

static Figure<double> make_line_figure(const std::size_t n) {
    Figure<double> fig;
    fig.xlabel = "Time, t (min)";
    fig.ylabel = "Waste mass, M";
    fig.color  = "red";
    fig.x      = xt::linspace<double>(0.0, 180.0, n);
    fig.y      = 20.0 * fig.x;
    return fig;
}

static void testGnuplotPipeFailures() {
    // Start from the default disposition so the restore can be checked afterwards
    std::signal(SIGPIPE, SIG_DFL);

    Plot_Parameters pp;

    // A plotting process that exits at once: the broken pipe must surface as an
    // exception, whatever the amount of data, never as a SIGPIPE kill
    pp.gnuplot_command = "exit 127";
    for (const std::size_t n : {std::size_t(2), std::size_t(1000)}) {
        bool thrown = false;
        try {
            Gnuplot_Renderer<double> renderer(pp);
            const std::vector<Figure<double>> figures(6, make_line_figure(n));
            renderer.render_all(figures);
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        REQUIRE(thrown, "a dead plotting process must raise an error (" << n << " points per figure)");
    }
    REQUIRE(std::signal(SIGPIPE, SIG_DFL) == SIG_DFL, "SIGPIPE disposition must be restored");

    // Rendering after the pipe has been closed is rejected
    pp.gnuplot_command = "cat > /dev/null";
    Gnuplot_Renderer<double> renderer(pp);
    renderer.render_all({make_line_figure(10)});
    REQUIRE_THROWS_AS(renderer.render(make_line_figure(10)), std::logic_error, "render after finalize accepted");
    REQUIRE(std::signal(SIGPIPE, SIG_DFL) == SIG_DFL, "SIGPIPE disposition must be restored after finalize");
    std::cout << "[PASS] gnuplot pipe failures\n";
}

} // namespace

int main() {
    testMeshAndInitialSample();
    testAccuracyAgainstExponential();
    testDeterminism();
    testZeroHorizon();
    testConfigurationErrors();
    testIntegrationFailure();
    testNumericalFault();
    testComponentAccess();
    testConsoleRenderer();
    testRendererSelection();
    testGnuplotPipeFailures();

    std::cout << "All experiment runner tests passed\n";
    return 0;
}
