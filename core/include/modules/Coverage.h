#ifndef COVERAGE_H
#define COVERAGE_H

#include <functional>
#include "modules/Geometry.h"

class Agent;

// ---------- Environmental Coverage ----------
// Samples one observed parameter for an agent. Implementations are called
// concurrently for different agents during the observation pass and run while
// the environment lock is held by the driver: they must be thread-safe and may
// only use the non-locking accessors of the agent.
class CoverageSampler {
public:
    virtual ~CoverageSampler() = default;

    // Writes sampleWidth() floats to dest. Returns false when the position is
    // outside the coverage; dest is then left for the caller to reset.
    virtual bool evaluate(const Agent& agent, const GeoPoint& position,
                          const Ellipse& perceptionArea, float* dest) const = 0;

    virtual int sampleWidth() const { return 1; }
};

// Same value everywhere.
class UniformCoverage : public CoverageSampler {
public:
    explicit UniformCoverage(float value) : value_(value) {}
    bool evaluate(const Agent&, const GeoPoint&, const Ellipse&, float* dest) const override;

private:
    float value_;
};

// Linear field over a lon/lat box; undefined outside of it.
class GradientCoverage : public CoverageSampler {
public:
    GradientCoverage(const GeoRect& domain, double base, double perDegreeX, double perDegreeY);
    bool evaluate(const Agent&, const GeoPoint& position, const Ellipse&, float* dest) const override;

private:
    GeoRect domain_;
    double base_;
    double dx_;
    double dy_;
};

// Best value of an analytic field inside the perception area, with the place
// where it was found (value, x, y).
class PeakSearchCoverage : public CoverageSampler {
public:
    using Field = std::function<double(const GeoPoint&)>;

    explicit PeakSearchCoverage(Field field, int gridSize = 8);
    bool evaluate(const Agent&, const GeoPoint& position, const Ellipse& perceptionArea,
                  float* dest) const override;
    int sampleWidth() const override { return 3; }

private:
    Field field_;
    int gridSize_;
};

#endif // COVERAGE_H
