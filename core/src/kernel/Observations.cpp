#include "kernel/Observations.h"

#include <cmath>
#include <stdexcept>
#include <utility>

Observations::Observations(std::shared_ptr<const Species> species, int step,
                           std::vector<float> record, float heading)
    : species_(std::move(species)), step_(step), record_(std::move(record)), heading_(heading) {
    if (record_.size() != static_cast<std::size_t>(species_->recordWidth())) {
        throw std::invalid_argument("Record width " + std::to_string(record_.size()) +
                                    " does not match species layout " +
                                    std::to_string(species_->recordWidth()));
    }
}

Observation Observations::at(std::size_t index) const {
    const auto& params = species_->parameters();
    if (index >= params.size()) {
        throw std::out_of_range("No parameter at index " + std::to_string(index));
    }
    const Parameter& p = params[index];
    const std::size_t offset = static_cast<std::size_t>(species_->offsets()[index]);

    Observation obs;
    obs.parameter = &p;
    if (p.isHeading()) {
        obs.value = heading_;
        obs.location = GeoPoint{record_[offset], record_[offset + 1]};
        return obs;
    }
    obs.value = record_[offset + Parameter::kValueOffset];
    if (p.sampleWidth() >= Parameter::kLocatedWidth) {
        const float x = record_[offset + Parameter::kXOffset];
        const float y = record_[offset + Parameter::kYOffset];
        if (!std::isnan(x) || !std::isnan(y)) {
            obs.location = GeoPoint{x, y};
        }
    }
    return obs;
}

std::optional<Observation> Observations::find(const std::string& parameterName) const {
    const int index = species_->indexOf(parameterName);
    if (index < 0) {
        return std::nullopt;
    }
    return at(static_cast<std::size_t>(index));
}
