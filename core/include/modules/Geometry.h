#ifndef GEOMETRY_H
#define GEOMETRY_H

#include <limits>

// Geographic point, degrees (x = longitude, y = latitude).
struct GeoPoint {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const GeoPoint& a, const GeoPoint& b) { return !(a == b); }

// Axis-aligned box in degrees. Default-constructed boxes are empty.
struct GeoRect {
    double xmin = std::numeric_limits<double>::infinity();
    double ymin = std::numeric_limits<double>::infinity();
    double xmax = -std::numeric_limits<double>::infinity();
    double ymax = -std::numeric_limits<double>::infinity();

    bool empty() const { return xmin > xmax || ymin > ymax; }
    double width() const { return empty() ? 0.0 : xmax - xmin; }
    double height() const { return empty() ? 0.0 : ymax - ymin; }

    void add(const GeoPoint& p);
    void add(const GeoRect& other);
    bool contains(const GeoPoint& p) const;
};

// Rotated ellipse in degrees. angle is the rotation of the x radius from east, radians.
struct Ellipse {
    GeoPoint center;
    double radiusX = 0.0;
    double radiusY = 0.0;
    double angle = 0.0;

    bool contains(const GeoPoint& p) const;
    GeoRect bounds() const;
};

#endif // GEOMETRY_H
