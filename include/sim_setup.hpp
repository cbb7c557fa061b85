#pragma once

#include "config.hpp"
#include "eom.hpp"
#include "rigid_body.hpp"
#include "simulator.hpp"
#include "state.hpp"

#include <string>

struct TimeSpan {
    double t0 = 0.0;
    double t1 = 0.0;
};

// Values the CLI needs besides the simulator inputs
struct RunSettings {
    int print_every = 100;
};

// 3-element vector key, or the default if absent. Throws ConfigError on size mismatch.
Vec3 readVec3(const Config& cfg, const std::string& key, const Vec3& default_val);

// mass + inertia (3 diagonal values or 9 row-major values)
RigidBody readRigidBody(const Config& cfg);
SixDofState readInitialState(const Config& cfg);
SimulatorOptions readSimulatorOptions(const Config& cfg);
ForceMoment readLoads(const Config& cfg);
TimeSpan readTimeSpan(const Config& cfg);
RunSettings readRunSettings(const Config& cfg);
