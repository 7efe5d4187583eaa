#include "Geometry.hpp"
#include <cmath>

static double toRadians(double deg){
    return deg*M_PI/180.0;
}

bool Geo::isValidCoordinate(double lng, double lat){
    if(!std::isfinite(lng) || !std::isfinite(lat)) return false;
    return lng >= -180.0 && lng <= 180.0 && lat >= -90.0 && lat <= 90.0;
}

double Geo::equirectangularDistance(double lng1, double lat1, double lng2, double lat2){
    double dx = (lng2 - lng1) * METERS_PER_DEG_LON * cos(toRadians((lat1+lat2)/2.0));
    double dy = (lat2 - lat1) * METERS_PER_DEG_LAT;
    return sqrt(dx*dx+dy*dy);
}

double Geo::haversineDistance(double lng1, double lat1, double lng2, double lat2){
    double phi1 = toRadians(lat1);
    double phi2 = toRadians(lat2);
    double dphi = toRadians(lat2 - lat1);
    double dlambda = toRadians(lng2 - lng1);
    double a = sin(dphi/2.0)*sin(dphi/2.0) + cos(phi1)*cos(phi2)*sin(dlambda/2.0)*sin(dlambda/2.0);
    return 2.0 * EARTH_RADIUS_M * atan2(sqrt(a), sqrt(1.0 - a));
}

double Geo::haversineDistance(const LngLat& a, const LngLat& b){
    return haversineDistance(a.lng, a.lat, b.lng, b.lat);
}

double Geo::polylineLength(const std::vector<LngLat>& points){
    double total = 0.0;
    for(size_t i = 1; i < points.size(); ++i){
        total += haversineDistance(points[i-1], points[i]);
    }
    return total;
}

LocalProjection::LocalProjection(double reference_lat)
    : lon_scale(Geo::METERS_PER_DEG_LON * cos(toRadians(reference_lat))) {}

double LocalProjection::distance(double lng1, double lat1, double lng2, double lat2) const {
    double dx = x(lng2) - x(lng1);
    double dy = y(lat2) - y(lat1);
    return sqrt(dx*dx + dy*dy);
}
