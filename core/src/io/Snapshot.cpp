#include "io/Snapshot.h"
#include <ostream>
#include <iomanip>

std::string metricsHeader() {
    return "step,populations,agents,points,pointsOutside,percentOutside,listenerFailures\n";
}

void logMetrics(const Simulation& simulation, std::ostream& out) {
    auto s = simulation.getStatistics();
    const auto flags = out.flags();
    const auto precision = out.precision();
    out << s.masterStep << ","
        << s.populations << ","
        << s.aliveAgents << ","
        << s.lastStep.points << ","
        << s.lastStep.pointsOutside << ","
        << std::fixed << std::setprecision(2) << s.lastStep.percentOutside() << ","
        << s.listenerFailures << "\n";
    out.flags(flags);
    out.precision(precision);
}
