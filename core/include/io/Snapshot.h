#ifndef SIMULATION_SNAPSHOT_H
#define SIMULATION_SNAPSHOT_H

#include "kernel/Simulation.h"
#include <string>
#include <iosfwd>

// CSV metrics logging
std::string metricsHeader();
void logMetrics(const Simulation& simulation, std::ostream& out);

#endif
