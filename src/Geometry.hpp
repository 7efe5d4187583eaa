#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include <vector>

struct LngLat {
    double lng;
    double lat;
};

namespace Geo {
    constexpr double METERS_PER_DEG_LAT = 110540.0;
    constexpr double METERS_PER_DEG_LON = 111320.0; // at the equator
    constexpr double EARTH_RADIUS_M = 6371008.8;

    bool isValidCoordinate(double lng, double lat);

    // Flat-earth approximation, good for city-scale distances.
    double equirectangularDistance(double lng1, double lat1, double lng2, double lat2);
    double haversineDistance(double lng1, double lat1, double lng2, double lat2);

    double haversineDistance(const LngLat& a, const LngLat& b);
    double polylineLength(const std::vector<LngLat>& points);
}

// Projects lng/lat onto a plane in metres around a fixed reference
// latitude, so every point shares the same scale.
class LocalProjection {
private:
    double lon_scale;
public:
    explicit LocalProjection(double reference_lat = 0.0);

    double x(double lng) const { return lng * lon_scale; }
    double y(double lat) const { return lat * Geo::METERS_PER_DEG_LAT; }
    double distance(double lng1, double lat1, double lng2, double lat2) const;
};
#endif
