#include "modules/SolarPosition.h"

#include <algorithm>
#include <cmath>

namespace {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kMillisPerDay = 86400000.0;
}

double SimpleSolarPosition::elevation(const GeoPoint& position,
                                      std::chrono::system_clock::time_point instant) const {
    const double millis = static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(
        instant.time_since_epoch()).count());
    const double days = millis / kMillisPerDay;            // days since 1970-01-01 UTC
    const double dayFraction = days - std::floor(days);
    // Day of year approximated on a 365.2422-day tropical year anchored at the epoch
    const double yearDays = std::fmod(days, 365.2422);
    const double gamma = 2.0 * kPi / 365.2422 * (std::floor(yearDays) + dayFraction - 0.5);

    const double eqTime = 229.18 * (0.000075 + 0.001868 * std::cos(gamma) - 0.032077 * std::sin(gamma)
                        - 0.014615 * std::cos(2 * gamma) - 0.040849 * std::sin(2 * gamma));
    const double decl = 0.006918 - 0.399912 * std::cos(gamma) + 0.070257 * std::sin(gamma)
                      - 0.006758 * std::cos(2 * gamma) + 0.000907 * std::sin(2 * gamma)
                      - 0.002697 * std::cos(3 * gamma) + 0.00148 * std::sin(3 * gamma);

    // True solar time in minutes, longitude east positive
    const double trueSolarMinutes = dayFraction * 1440.0 + eqTime + 4.0 * position.x;
    const double hourAngle = (trueSolarMinutes / 4.0 - 180.0) * kPi / 180.0;
    const double lat = position.y * kPi / 180.0;

    const double cosZenith = std::sin(lat) * std::sin(decl)
                           + std::cos(lat) * std::cos(decl) * std::cos(hourAngle);
    const double zenith = std::acos(std::clamp(cosZenith, -1.0, 1.0));
    return 90.0 - zenith * 180.0 / kPi;
}
