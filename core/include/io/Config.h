#ifndef SIMULATION_CONFIG_H
#define SIMULATION_CONFIG_H

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "kernel/Population.h"
#include "kernel/Simulation.h"
#include "kernel/Species.h"
#include "modules/Coverage.h"

class SolarPosition;

// Configuration text: "KEY = value" lines ('#' starts a comment), a line of
// dashes, then the observed parameters as "name;width" lines.
SimulationConfig loadConfig(std::istream& in);
SimulationConfig loadConfigFile(const std::string& path);

// ANIMAT_SEED and ANIMAT_MAX_STEPS take precedence over the loaded values.
void applyEnvironmentOverrides(SimulationConfig& cfg);

// Throws std::invalid_argument on the first unusable value.
void validate(const SimulationConfig& cfg);

// "yyyy/MM/dd", UTC midnight.
Timestamp parseDate(const std::string& text);

// Building blocks for an environment described by a configuration
std::shared_ptr<Clock> makeClock(const SimulationConfig& cfg,
                                 std::shared_ptr<const SolarPosition> sun = nullptr);
std::vector<Parameter> makeParameters(const SimulationConfig& cfg);  // heading first
std::vector<std::shared_ptr<const Species>> makeSpecies(const SimulationConfig& cfg);
MovementConfig makeMovement(const SimulationConfig& cfg);

// Grid cells across the perception diameter at RESOLUTION (one nautical mile
// is one arc-minute of latitude), between 1 and 4096.
int searchGridSize(const SimulationConfig& cfg);
std::shared_ptr<PeakSearchCoverage> makePeakSearchCoverage(const SimulationConfig& cfg,
                                                           PeakSearchCoverage::Field field);

#endif // SIMULATION_CONFIG_H
