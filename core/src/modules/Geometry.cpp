#include "modules/Geometry.h"

#include <algorithm>
#include <cmath>

void GeoRect::add(const GeoPoint& p) {
    xmin = std::min(xmin, p.x);
    ymin = std::min(ymin, p.y);
    xmax = std::max(xmax, p.x);
    ymax = std::max(ymax, p.y);
}

void GeoRect::add(const GeoRect& other) {
    if (other.empty()) return;
    xmin = std::min(xmin, other.xmin);
    ymin = std::min(ymin, other.ymin);
    xmax = std::max(xmax, other.xmax);
    ymax = std::max(ymax, other.ymax);
}

bool GeoRect::contains(const GeoPoint& p) const {
    return p.x >= xmin && p.x <= xmax && p.y >= ymin && p.y <= ymax;
}

bool Ellipse::contains(const GeoPoint& p) const {
    if (radiusX <= 0.0 || radiusY <= 0.0) return false;
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    const double dx = p.x - center.x;
    const double dy = p.y - center.y;
    // Rotate back into the ellipse frame
    const double u = ( dx * c + dy * s) / radiusX;
    const double v = (-dx * s + dy * c) / radiusY;
    return u * u + v * v <= 1.0;
}

GeoRect Ellipse::bounds() const {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    const double hx = std::hypot(radiusX * c, radiusY * s);
    const double hy = std::hypot(radiusX * s, radiusY * c);
    GeoRect r;
    r.add(GeoPoint{center.x - hx, center.y - hy});
    r.add(GeoPoint{center.x + hx, center.y + hy});
    return r;
}
