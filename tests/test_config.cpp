#include "config.hpp"
#include "errors.hpp"
#include "sim_setup.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path writeTempConfig(const std::string& contents) {
    static int counter = 0;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path path = fs::temp_directory_path() /
                    ("sixdof_config_test_" + std::to_string(stamp) + "_" +
                     std::to_string(counter++) + ".cfg");
    std::ofstream out(path);
    out << contents;
    out.close();
    return path;
}

bool expectThrow(const std::function<void()>& fn) {
    try {
        fn();
        return false;
    } catch (const std::exception&) {
        return true;
    }
}

template <typename E>
bool expectThrowType(const std::function<void()>& fn) {
    try {
        fn();
        return false;
    } catch (const E&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool testLoadWithInlineComments() {
    std::cout << "Test: Load file with comments and vector values\n";

    const std::string cfg_text =
        "# reference scenario\n"
        "mass = 10.0          # kg\n"
        "inertia = [0.5, 0.5, 0.8]\n"
        "Vb0 = 30, 0, 0\n"
        "method = RK4 # case-insensitive\n"
        "\n"
        "t1 = 30\n";

    fs::path path = writeTempConfig(cfg_text);
    bool passed = true;
    try {
        Config cfg = Config::load(path.string());

        if (std::abs(cfg.getDouble("mass") - 10.0) > 1e-12) {
            passed = false;
            std::cout << "  FAILED: mass was not parsed correctly\n";
        }
        std::vector<double> inertia = cfg.getDoubleList("inertia");
        if (inertia.size() != 3 || inertia[2] != 0.8) {
            passed = false;
            std::cout << "  FAILED: bracketed list parsed incorrectly\n";
        }
        std::vector<double> vb = cfg.getDoubleList("Vb0");
        if (vb.size() != 3 || vb[0] != 30.0) {
            passed = false;
            std::cout << "  FAILED: bare list parsed incorrectly\n";
        }
        if (cfg.getString("method") != "RK4") {
            passed = false;
            std::cout << "  FAILED: comment not stripped from method\n";
        }
        if (cfg.values().size() != 5) {
            passed = false;
            std::cout << "  FAILED: expected 5 keys, got " << cfg.values().size() << "\n";
        }
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: unexpected exception: " << e.what() << "\n";
    }

    fs::remove(path);
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testMissingFile() {
    std::cout << "Test: Missing config file\n";

    fs::path path = fs::temp_directory_path() / "sixdof_config_test_does_not_exist.cfg";
    bool passed = expectThrow([&]() { (void)Config::load(path.string()); });

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testStrictNumeric() {
    std::cout << "Test: Strict numeric and list parsing\n";

    Config cfg = Config::parse(
        "mass = 10kg\n"
        "max_steps = 12.5\n"
        "force = 1, , 3\n"
        "moment = 1, 2, 3,\n"
        "inertia = []\n"
        "flag = maybe\n");

    bool passed = true;
    passed &= expectThrow([&]() { (void)cfg.getDouble("mass"); });
    passed &= expectThrow([&]() { (void)cfg.getInt("max_steps"); });
    passed &= expectThrow([&]() { (void)cfg.getDoubleList("force"); });
    passed &= expectThrow([&]() { (void)cfg.getDoubleList("moment"); });
    passed &= expectThrow([&]() { (void)cfg.getDoubleList("inertia"); });
    passed &= expectThrow([&]() { (void)cfg.getBool("flag", false); });
    passed &= expectThrow([&]() { (void)cfg.getDouble("absent"); });

    // Defaults only apply to absent keys
    passed &= cfg.getDouble("absent", 2.5) == 2.5;
    passed &= expectThrow([&]() { (void)cfg.getDouble("mass", 1.0); });

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testMalformedLines() {
    std::cout << "Test: Malformed lines, sections and duplicate keys\n";

    bool passed = true;
    passed &= expectThrow([]() { (void)Config::parse("mass 10\n"); });
    passed &= expectThrow([]() { (void)Config::parse(" = 10\n"); });
    passed &= expectThrow([]() { (void)Config::parse("[body]\nmass = 10\n"); });
    passed &= expectThrow([]() { (void)Config::parse("mass = 10\nmass = 11\n"); });

    // A '#' ends the line even inside a value
    Config cfg = Config::parse("method = euler#rk4\n");
    passed &= cfg.getString("method") == "euler";

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testReadRigidBody() {
    std::cout << "Test: Rigid body from diagonal and full inertia\n";

    bool passed = true;
    try {
        RigidBody diag = readRigidBody(Config::parse("mass = 10\ninertia = 0.5, 0.5, 0.8\n"));
        passed &= diag.mass() == 10.0;
        passed &= std::abs(diag.inertia()(2, 2) - 0.8) < 1e-15 && diag.inertia()(0, 1) == 0.0;
        passed &= std::abs(diag.inertiaInverse()(2, 2) - 1.25) < 1e-12;

        RigidBody full = readRigidBody(Config::parse(
            "mass = 2\ninertia = 0.5, 0.01, 0, 0.01, 0.6, 0, 0, 0, 0.8\n"));
        passed &= full.inertia()(0, 1) == 0.01 && full.inertia()(1, 0) == 0.01;
        passed &= (full.inertia() * full.inertiaInverse() - Mat3::Identity()).norm() < 1e-12;
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: unexpected exception: " << e.what() << "\n";
    }

    passed &= expectThrowType<ConfigError>([]() {
        (void)readRigidBody(Config::parse("mass = 10\ninertia = 0.5, 0.5\n"));
    });
    passed &= expectThrowType<ConfigError>([]() {
        (void)readRigidBody(Config::parse("mass = -1\ninertia = 0.5, 0.5, 0.8\n"));
    });
    passed &= expectThrowType<SingularMatrixError>([]() {
        (void)readRigidBody(Config::parse("mass = 10\ninertia = 0.5, 0.0, 0.8\n"));
    });
    passed &= expectThrow([]() { (void)readRigidBody(Config::parse("inertia = 1, 1, 1\n")); });

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testReadInitialState() {
    std::cout << "Test: Initial state with defaults and degree attitude\n";

    bool passed = true;
    try {
        SixDofState zero = readInitialState(Config::parse("mass = 1\n"));
        passed &= toVector(zero).norm() == 0.0;

        SixDofState s = readInitialState(Config::parse(
            "Vb0 = 30, 0, 0\n"
            "Xe0 = 0, 0, -100\n"
            "euler0 = 90, 0, 180\n"
            "euler0_deg = true\n"
            "pqr0 = 0.1, 0.2, 0.3\n"));
        passed &= s.Vb == Vec3(30.0, 0.0, 0.0);
        passed &= s.Xe.z() == -100.0;
        passed &= std::abs(s.euler.x() - M_PI / 2.0) < 1e-15;
        passed &= std::abs(s.euler.z() - M_PI) < 1e-15;
        passed &= s.pqr == Vec3(0.1, 0.2, 0.3);
        passed &= s.Ve.norm() == 0.0;

        SixDofState rad = readInitialState(Config::parse("euler0 = 0.1, 0.2, 0.3\n"));
        passed &= rad.euler == Vec3(0.1, 0.2, 0.3);
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: unexpected exception: " << e.what() << "\n";
    }

    passed &= expectThrowType<ConfigError>([]() {
        (void)readInitialState(Config::parse("Vb0 = 30, 0\n"));
    });

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testReadSimulatorOptions() {
    std::cout << "Test: Integration method and solver options\n";

    bool passed = true;
    try {
        SimulatorOptions defaults = readSimulatorOptions(Config::parse(""));
        passed &= defaults.method == IntegrationMethod::RK4;
        passed &= defaults.fixed_step_size == 0.01;

        SimulatorOptions euler = readSimulatorOptions(Config::parse("method = Euler\ndt = 0.002\n"));
        passed &= euler.method == IntegrationMethod::Euler;
        passed &= euler.fixed_step_size == 0.002;

        SimulatorOptions adaptive = readSimulatorOptions(Config::parse(
            "method = diffrax\n"
            "rtol = 1e-8\n"
            "atol = 1e-10\n"
            "dt_max = 0.5\n"
            "max_steps = 5000\n"));
        passed &= adaptive.method == IntegrationMethod::Adaptive;
        passed &= adaptive.adaptive.rtol == 1e-8;
        passed &= adaptive.adaptive.atol == 1e-10;
        passed &= adaptive.adaptive.dt_max == 0.5;
        passed &= adaptive.adaptive.max_steps == 5000;
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: unexpected exception: " << e.what() << "\n";
    }

    passed &= expectThrowType<ConfigError>([]() {
        (void)readSimulatorOptions(Config::parse("method = midpoint\n"));
    });
    passed &= expectThrowType<ConfigError>([]() {
        (void)readSimulatorOptions(Config::parse("dt = 0\n"));
    });
    passed &= expectThrowType<ConfigError>([]() {
        (void)readSimulatorOptions(Config::parse("method = adaptive\nrtol = -1\n"));
    });
    passed &= expectThrowType<ConfigError>([]() {
        (void)readSimulatorOptions(Config::parse("method = adaptive\natol = 0\n"));
    });
    // Pure relative tolerance is not accepted; fixed-step runs ignore the key
    try {
        SimulatorOptions rk4 = readSimulatorOptions(Config::parse("method = rk4\natol = 0\n"));
        passed &= rk4.method == IntegrationMethod::RK4;
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: atol ignored for rk4 threw: " << e.what() << "\n";
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testReadLoadsAndTimeSpan() {
    std::cout << "Test: Loads, time span and run settings\n";

    bool passed = true;
    try {
        Config cfg = Config::parse(
            "force = 0, 0, -98.1\n"
            "t1 = 30\n"
            "print_every = 250\n");
        ForceMoment fm = readLoads(cfg);
        passed &= fm.force == Vec3(0.0, 0.0, -98.1);
        passed &= fm.moment.norm() == 0.0;

        TimeSpan span = readTimeSpan(cfg);
        passed &= span.t0 == 0.0 && span.t1 == 30.0;

        passed &= readRunSettings(cfg).print_every == 250;
        passed &= readRunSettings(Config::parse("")).print_every == 100;
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: unexpected exception: " << e.what() << "\n";
    }

    passed &= expectThrow([]() { (void)readTimeSpan(Config::parse("t0 = 1\n")); });
    passed &= expectThrowType<ConfigError>([]() {
        (void)readTimeSpan(Config::parse("t0 = 5\nt1 = 5\n"));
    });
    passed &= expectThrowType<ConfigError>([]() {
        (void)readLoads(Config::parse("moment = 1, 2, 3, 4\n"));
    });
    passed &= expectThrowType<ConfigError>([]() {
        (void)readRunSettings(Config::parse("print_every = 0\n"));
    });

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Config Tests\n";
    std::cout << "============\n\n";

    int passed = 0;
    const int total = 8;

    if (testLoadWithInlineComments()) passed++;
    if (testMissingFile()) passed++;
    if (testStrictNumeric()) passed++;
    if (testMalformedLines()) passed++;
    if (testReadRigidBody()) passed++;
    if (testReadInitialState()) passed++;
    if (testReadSimulatorOptions()) passed++;
    if (testReadLoadsAndTimeSpan()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
