#ifndef OBSERVATIONS_H
#define OBSERVATIONS_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "kernel/Species.h"
#include "modules/Geometry.h"

// One parameter's observation: its value and, for located parameters, where
// the value was found. For the heading parameter the value is the heading in
// degrees and the location is the agent position.
struct Observation {
    const Parameter* parameter = nullptr;
    float value = 0.0f;
    std::optional<GeoPoint> location;
};

// Read-only view of one agent record, laid out with the species offsets.
class Observations {
public:
    Observations(std::shared_ptr<const Species> species, int step,
                 std::vector<float> record, float heading);

    int step() const { return step_; }
    const Species& species() const { return *species_; }
    const std::vector<float>& record() const { return record_; }

    std::size_t size() const { return species_->parameters().size(); }
    Observation at(std::size_t index) const;
    std::optional<Observation> find(const std::string& parameterName) const;

private:
    std::shared_ptr<const Species> species_;
    int step_;
    std::vector<float> record_;  // species_->recordWidth() floats
    float heading_;
};

#endif // OBSERVATIONS_H
