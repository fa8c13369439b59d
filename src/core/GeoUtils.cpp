#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>

double GeoUtils::haversineKm(double lat1, double lng1, double lat2,
                             double lng2) {
  double phi1 = lat1 * (M_PI / 180);
  double phi2 = lat2 * (M_PI / 180);
  double delta_phi = (lat2 - lat1) * (M_PI / 180);
  double delta_lambda = (lng2 - lng1) * (M_PI / 180);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_lambda / 2), 2);
  h = std::min(1.0, h); // rounding can push antipodal points past 1
  return kEarthRadiusKm * 2 * atan2(sqrt(h), sqrt(1 - h));
}

double GeoUtils::haversineKm(const Point &a, const Point &b) {
  return haversineKm(a.lat, a.lng, b.lat, b.lng);
}

double GeoUtils::fallbackSpeedKmh(TransportMode mode) {
  switch (mode) {
  case TransportMode::Walking:
    return 4.5;
  case TransportMode::Transit:
    return 28.0;
  default:
    return 35.0;
  }
}

FallbackEstimate GeoUtils::fallbackEstimate(const Point &a, const Point &b,
                                            TransportMode mode) {
  const double road_km = haversineKm(a, b) * kRoadInflation;
  const double minutes = (road_km / fallbackSpeedKmh(mode)) * 60.0;
  return {roundTo(road_km, 2), roundTo(minutes, 1)};
}

// half-up; every value rounded here is non-negative
double GeoUtils::roundTo(double value, int decimals) {
  const double factor = std::pow(10.0, decimals);
  return std::round(value * factor) / factor;
}

bool GeoUtils::isValidCoordinate(const Point &p) {
  return std::isfinite(p.lat) && std::isfinite(p.lng) &&
         std::fabs(p.lat) <= 90.0 && std::fabs(p.lng) <= 180.0;
}
