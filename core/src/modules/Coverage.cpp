#include "modules/Coverage.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

bool UniformCoverage::evaluate(const Agent&, const GeoPoint&, const Ellipse&, float* dest) const {
    dest[0] = value_;
    return true;
}

GradientCoverage::GradientCoverage(const GeoRect& domain, double base,
                                   double perDegreeX, double perDegreeY)
    : domain_(domain), base_(base), dx_(perDegreeX), dy_(perDegreeY) {
    if (domain_.empty()) {
        throw std::invalid_argument("GradientCoverage domain is empty");
    }
}

bool GradientCoverage::evaluate(const Agent&, const GeoPoint& position, const Ellipse&,
                                float* dest) const {
    if (!domain_.contains(position)) {
        return false;
    }
    dest[0] = static_cast<float>(base_ + dx_ * (position.x - domain_.xmin) +
                                 dy_ * (position.y - domain_.ymin));
    return true;
}

PeakSearchCoverage::PeakSearchCoverage(Field field, int gridSize)
    : field_(std::move(field)), gridSize_(gridSize) {
    if (!field_) {
        throw std::invalid_argument("PeakSearchCoverage needs a field");
    }
    if (gridSize_ < 1) {
        throw std::invalid_argument("PeakSearchCoverage grid size must be >= 1 (got " +
                                    std::to_string(gridSize_) + ")");
    }
}

bool PeakSearchCoverage::evaluate(const Agent&, const GeoPoint& position,
                                  const Ellipse& perceptionArea, float* dest) const {
    GeoPoint best = position;
    double bestValue = field_(position);

    const GeoRect box = perceptionArea.bounds();
    if (!box.empty() && box.width() > 0 && box.height() > 0) {
        for (int i = 0; i <= gridSize_; ++i) {
            for (int j = 0; j <= gridSize_; ++j) {
                const GeoPoint p{box.xmin + box.width() * i / gridSize_,
                                 box.ymin + box.height() * j / gridSize_};
                if (!perceptionArea.contains(p)) continue;
                const double v = field_(p);
                if (std::isnan(bestValue) || v > bestValue) {
                    bestValue = v;
                    best = p;
                }
            }
        }
    }
    if (std::isnan(bestValue)) {
        return false;
    }
    dest[0] = static_cast<float>(bestValue);
    dest[1] = static_cast<float>(best.x);
    dest[2] = static_cast<float>(best.y);
    return true;
}
