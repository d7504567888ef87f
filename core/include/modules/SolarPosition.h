#ifndef SOLAR_POSITION_H
#define SOLAR_POSITION_H

#include <chrono>
#include "modules/Geometry.h"

// Solar elevation above the horizon, in degrees, at a geographic position.
class SolarPosition {
public:
    virtual ~SolarPosition() = default;
    virtual double elevation(const GeoPoint& position,
                             std::chrono::system_clock::time_point instant) const = 0;
};

// Low-precision solar model (declination and equation of time from the
// fractional year). Good to a fraction of a degree, enough for day/night tests.
class SimpleSolarPosition : public SolarPosition {
public:
    double elevation(const GeoPoint& position,
                     std::chrono::system_clock::time_point instant) const override;
};

#endif // SOLAR_POSITION_H
