#include "modules/Path.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace {
    constexpr double kPi = 3.14159265358979323846;

    double toRadians(double deg) { return deg * kPi / 180.0; }
    double toDegrees(double rad) { return rad * 180.0 / kPi; }

    // Local Mercator projection centred on (x, y), in radians.
    struct LocalMercator {
        double ak0;
        double northing;
        double meridian;

        LocalMercator(double x, double y)
            : ak0(std::cos(y) * GeoPath::kEarthRadius),
              northing(-ak0 * std::log(std::tan(kPi / 4 + 0.5 * y))),
              meridian(x) {}

        void forward(double lon, double lat, double& px, double& py) const {
            px = ak0 * (lon - meridian);
            py = ak0 * std::log(std::tan(kPi / 4 + 0.5 * lat)) + northing;
        }

        void inverse(double px, double py, double& lon, double& lat) const {
            lon = px / ak0 + meridian;
            lat = kPi / 2 - 2 * std::atan(std::exp((northing - py) / ak0));
        }
    };
}

void Path::locationAt(int step, float* out) const {
    const GeoPoint p = locationAt(step);
    out[0] = static_cast<float>(p.x);
    out[1] = static_cast<float>(p.y);
}

GeoPath::GeoPath(const GeoPoint& position) : direction_(kPi / 2) {
    records_.push_back({toRadians(position.x), toRadians(position.y), heading()});
    bounds_.add(position);
}

void GeoPath::setPointCount(int n) {
    if (n < 1) {
        throw std::invalid_argument("Path point count must be >= 1 (got " + std::to_string(n) + ")");
    }
    const std::size_t count = static_cast<std::size_t>(n);
    if (count == records_.size()) {
        return;
    }
    if (count > records_.size()) {
        records_.resize(count, records_.back());
    } else {
        // Several moves within one step collapse to the final position
        records_[count - 1] = records_.back();
        records_.resize(count);
    }
}

GeoPoint GeoPath::location() const {
    const Record& r = records_.back();
    return {toDegrees(r.x), toDegrees(r.y)};
}

GeoPoint GeoPath::locationAt(int step) const {
    const Record& r = record(step);
    return {toDegrees(r.x), toDegrees(r.y)};
}

double GeoPath::heading() const {
    double h = std::fmod(90.0 - toDegrees(direction_), 360.0);
    if (h < 0) h += 360.0;
    return h;
}

double GeoPath::headingAt(int step) const {
    return record(step).heading;
}

void GeoPath::rotate(double angle) {
    direction_ -= toRadians(angle);
    records_.back().heading = heading();
}

void GeoPath::moveForward(double distance) {
    const Record& r = records_.back();
    const LocalMercator proj(r.x, r.y);
    double x, y;
    proj.inverse(distance * std::cos(direction_), distance * std::sin(direction_), x, y);
    setCurrent(x, y);
}

bool GeoPath::moveToward(const GeoPoint& point, double distance) {
    const Record& r = records_.back();
    const LocalMercator proj(r.x, r.y);
    double px, py;
    proj.forward(toRadians(point.x), toRadians(point.y), px, py);

    const double newDirection = std::atan2(py, px);
    if (!std::isnan(newDirection) && (px != 0.0 || py != 0.0)) {
        direction_ = newDirection;
    }
    const double remaining = std::hypot(px, py);
    if (remaining == 0.0) {
        setCurrent(toRadians(point.x), toRadians(point.y));
        return true;
    }
    const double fc = distance / remaining;
    if (fc >= 1.0) {
        setCurrent(toRadians(point.x), toRadians(point.y));
        return true;
    }
    double x, y;
    proj.inverse(px * fc, py * fc, x, y);
    setCurrent(x, y);
    return false;
}

void GeoPath::setCurrent(double x, double y) {
    Record& r = records_.back();
    r.x = x;
    r.y = y;
    r.heading = heading();
    bounds_.add(GeoPoint{toDegrees(x), toDegrees(y)});
}

const GeoPath::Record& GeoPath::record(int step) const {
    if (step < 0 || static_cast<std::size_t>(step) >= records_.size()) {
        throw std::out_of_range("Path has no point for step " + std::to_string(step));
    }
    return records_[static_cast<std::size_t>(step)];
}
