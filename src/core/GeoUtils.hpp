#pragma once
#include "models/RouteTypes.hpp"

// Result of the geometric fallback for one directed segment.
struct FallbackEstimate {
  double distance_km;
  double duration_min;
};

class GeoUtils {
public:
  static constexpr double kEarthRadiusKm = 6371.0;
  // Straight-line distance is inflated by this factor to approximate roads.
  static constexpr double kRoadInflation = 1.25;

  // haversine great-circle distance in kilometres
  static double haversineKm(double lat1, double lng1, double lat2,
                            double lng2);
  static double haversineKm(const Point &a, const Point &b);

  // Assumed average speed (km/h) when no provider answered.
  static double fallbackSpeedKmh(TransportMode mode);

  // haversine * inflation, divided by the mode speed. Distance rounded to 2
  // decimals, duration to 1 decimal.
  static FallbackEstimate fallbackEstimate(const Point &a, const Point &b,
                                           TransportMode mode);

  static double roundTo(double value, int decimals);

  // finite and inside [-90,90] x [-180,180]
  static bool isValidCoordinate(const Point &p);
};
