#ifndef PATH_H
#define PATH_H

#include <vector>
#include "modules/Geometry.h"

// ---------- Track of a mobile agent ----------
// One record per simulation step of the owning agent. The last record is the
// current position; movements update it in place until the track is extended.
class Path {
public:
    virtual ~Path() = default;

    // Step alignment
    virtual int pointCount() const = 0;
    virtual void setPointCount(int n) = 0;
    void appendStep() { setPointCount(pointCount() + 1); }

    // Position and heading (degrees clockwise from north)
    virtual GeoPoint location() const = 0;
    virtual GeoPoint locationAt(int step) const = 0;
    void locationAt(int step, float* out) const;
    virtual double heading() const = 0;
    virtual double headingAt(int step) const = 0;
    virtual GeoRect boundingShape() const = 0;

    // Motion, distances in nautical miles
    virtual void rotate(double angle) = 0;
    virtual void moveForward(double distance) = 0;
    virtual bool moveToward(const GeoPoint& point, double distance) = 0;
};

// Geographic track using a local Mercator projection centred on the current
// position for every displacement.
class GeoPath : public Path {
public:
    explicit GeoPath(const GeoPoint& position);

    int pointCount() const override { return static_cast<int>(records_.size()); }
    void setPointCount(int n) override;

    GeoPoint location() const override;
    using Path::locationAt;
    GeoPoint locationAt(int step) const override;
    double heading() const override;
    double headingAt(int step) const override;
    GeoRect boundingShape() const override { return bounds_; }

    void rotate(double angle) override;
    void moveForward(double distance) override;
    bool moveToward(const GeoPoint& point, double distance) override;

    // Earth radius in nautical miles (WGS84 semi-major axis / 1852).
    static constexpr double kEarthRadius = 6378137.0 / 1852.0;

private:
    struct Record {
        double x = 0.0;        // radians
        double y = 0.0;        // radians
        double heading = 0.0;  // degrees
    };

    void setCurrent(double x, double y);
    const Record& record(int step) const;

    std::vector<Record> records_;
    double direction_;  // arithmetic radians, 0 = east
    GeoRect bounds_;
};

#endif // PATH_H
