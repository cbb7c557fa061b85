#include "cmd_args.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "sim_setup.hpp"
#include "simulator.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace {

// Reference scenario: level flight at 30 m/s with gravity as the only load
const char* kDefaultScenario =
    "mass = 10.0\n"
    "inertia = [0.5, 0.5, 0.8]\n"
    "Vb0 = [30.0, 0.0, 0.0]\n"
    "force = [0.0, 0.0, -98.1]\n"
    "moment = [0.0, 0.0, 0.0]\n"
    "t0 = 0.0\n"
    "t1 = 30.0\n"
    "dt = 0.01\n"
    "method = rk4\n"
    "print_every = 500\n";

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c <config>        Config file (default: built-in 30 s level-flight scenario)\n";
    std::cerr << "  --method <name>    rk4, euler or adaptive (overrides config)\n";
    std::cerr << "  --dt <h>           Fixed step size (overrides config)\n";
    std::cerr << "  --t1 <T>           Final time (overrides config)\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << prog << "\n";
    std::cerr << "  " << prog << " -c configs/freefall.cfg --method adaptive\n";
}

std::string fmtVec(const Vec3& v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4)
       << "[" << std::setw(11) << v.x() << ", " << std::setw(11) << v.y()
       << ", " << std::setw(11) << v.z() << "]";
    return os.str();
}

void printSample(double t, const SixDofState& s) {
    std::cout << "t=" << std::fixed << std::setprecision(3) << std::setw(8) << t
              << "  Xe=" << fmtVec(s.Xe)
              << "  Vb=" << fmtVec(s.Vb)
              << "  euler=" << fmtVec(s.euler) << "\n";
}

int runSim(const Config& cfg) {
    RigidBody body = readRigidBody(cfg);
    SixDofState initial = readInitialState(cfg);
    SimulatorOptions opts = readSimulatorOptions(cfg);
    ForceMoment loads = readLoads(cfg);
    TimeSpan span = readTimeSpan(cfg);
    RunSettings settings = readRunSettings(cfg);

    const Simulator sim(body, opts);

    std::cout << "Rigid body: mass=" << sim.body().mass()
              << " inertia diag=" << fmtVec(sim.body().inertia().diagonal()) << "\n";
    std::cout << "Method: " << methodName(sim.method())
              << ", dt=" << sim.fixedStepSize()
              << ", t=[" << span.t0 << ", " << span.t1 << "]\n";
    if (sim.method() == IntegrationMethod::Adaptive) {
        const AdaptiveOptions& a = sim.adaptiveOptions();
        std::cout << "Adaptive: rtol=" << a.rtol << ", atol=" << a.atol
                  << ", dt_min=" << a.dt_min << ", dt_max=" << a.dt_max
                  << ", max_steps=" << a.max_steps << "\n";
    }
    std::cout << "Loads: force=" << fmtVec(loads.force)
              << " moment=" << fmtVec(loads.moment) << "\n\n";

    Trajectory traj = sim.run(initial, loads.force, loads.moment, span.t0, span.t1);

    for (size_t i = 0; i < traj.size(); i += static_cast<size_t>(settings.print_every)) {
        printSample(traj.time[i], traj.states[i]);
    }

    const SixDofState& last = traj.states.back();
    const Accelerations& accel = traj.accelerations.back();
    std::cout << "\nFinal state (" << traj.size() << " samples):\n";
    printSample(traj.time.back(), last);
    std::cout << "  Ve=" << fmtVec(last.Ve) << "  pqr=" << fmtVec(last.pqr) << "\n";
    std::cout << "  ab=" << fmtVec(accel.ab) << "  dotpqr=" << fmtVec(accel.dotpqr) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string method_override;
    std::string dt_override;
    std::string t1_override;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (cliarg::isHelpFlag(arg)) {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "-c") {
                config_path = cliarg::requireOptionValue(argc, argv, i, "-c");
            } else if (arg == "--method") {
                method_override = cliarg::requireMethod(
                    cliarg::requireOptionValue(argc, argv, i, "--method"), "--method");
            } else if (arg == "--dt") {
                dt_override = cliarg::requireOptionValue(argc, argv, i, "--dt");
                cliarg::validatePositive(dt_override, "--dt");
            } else if (arg == "--t1") {
                t1_override = cliarg::requireOptionValue(argc, argv, i, "--t1");
                cliarg::validateNumber(t1_override, "--t1");
            } else {
                std::cerr << "Unknown option: " << arg << "\n\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        Config cfg = config_path.empty() ? Config::parse(kDefaultScenario)
                                         : Config::load(config_path);
        if (!method_override.empty()) cfg.set("method", method_override);
        if (!dt_override.empty()) cfg.set("dt", dt_override);
        if (!t1_override.empty()) cfg.set("t1", t1_override);

        return runSim(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const SolverError& e) {
        std::cerr << "Solver error: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
