#include "core/GeoUtils.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <gtest/gtest.h>

TEST(GeoUtils, HaversineZeroForSamePoint) {
  auto p = make_point(37.5, 127.0);
  EXPECT_DOUBLE_EQ(GeoUtils::haversineKm(p, p), 0.0);
}

TEST(GeoUtils, HaversineOneDegreeOnEquator) {
  // 2 * pi * 6371 / 360
  EXPECT_NEAR(GeoUtils::haversineKm(make_point(0, 0), make_point(0, 1)),
              111.19492664, 1e-6);
}

TEST(GeoUtils, HaversineSeoulToBusan) {
  auto seoul = make_point(37.5665, 126.9780);
  auto busan = make_point(35.1796, 129.0756);
  EXPECT_NEAR(GeoUtils::haversineKm(seoul, busan), 325.0, 5.0);
  EXPECT_DOUBLE_EQ(GeoUtils::haversineKm(seoul, busan),
                   GeoUtils::haversineKm(busan, seoul));
}

TEST(GeoUtils, HaversineAntipodalIsFinite) {
  double d = GeoUtils::haversineKm(make_point(0, 0), make_point(0, 180));
  EXPECT_TRUE(std::isfinite(d));
  EXPECT_NEAR(d, M_PI * GeoUtils::kEarthRadiusKm, 1e-6);
}

TEST(GeoUtils, FallbackSpeedsPerMode) {
  EXPECT_DOUBLE_EQ(GeoUtils::fallbackSpeedKmh(TransportMode::Walking), 4.5);
  EXPECT_DOUBLE_EQ(GeoUtils::fallbackSpeedKmh(TransportMode::Transit), 28.0);
  EXPECT_DOUBLE_EQ(GeoUtils::fallbackSpeedKmh(TransportMode::Driving), 35.0);
}

TEST(GeoUtils, FallbackEstimateInflatesAndRounds) {
  auto a = make_point(0, 0);
  auto b = make_point(0, 0.01); // 1.11195 km straight line

  auto walk = GeoUtils::fallbackEstimate(a, b, TransportMode::Walking);
  EXPECT_DOUBLE_EQ(walk.distance_km, 1.39);
  EXPECT_DOUBLE_EQ(walk.duration_min, 18.5);

  auto drive = GeoUtils::fallbackEstimate(a, b, TransportMode::Driving);
  EXPECT_DOUBLE_EQ(drive.distance_km, 1.39);
  EXPECT_DOUBLE_EQ(drive.duration_min, 2.4);

  auto transit = GeoUtils::fallbackEstimate(a, b, TransportMode::Transit);
  EXPECT_DOUBLE_EQ(transit.duration_min, 3.0);
}

TEST(GeoUtils, FallbackEstimateZeroForSamePoint) {
  auto p = make_point(37.5, 127.0);
  auto est = GeoUtils::fallbackEstimate(p, p, TransportMode::Driving);
  EXPECT_DOUBLE_EQ(est.distance_km, 0.0);
  EXPECT_DOUBLE_EQ(est.duration_min, 0.0);
}

TEST(GeoUtils, RoundTo) {
  EXPECT_DOUBLE_EQ(GeoUtils::roundTo(1.005001, 2), 1.01);
  EXPECT_DOUBLE_EQ(GeoUtils::roundTo(18.56, 1), 18.6);
  EXPECT_DOUBLE_EQ(GeoUtils::roundTo(2.0, 1), 2.0);
}

TEST(GeoUtils, CoordinateValidity) {
  EXPECT_TRUE(GeoUtils::isValidCoordinate(make_point(90, 180)));
  EXPECT_TRUE(GeoUtils::isValidCoordinate(make_point(-90, -180)));
  EXPECT_FALSE(GeoUtils::isValidCoordinate(make_point(90.1, 0)));
  EXPECT_FALSE(GeoUtils::isValidCoordinate(make_point(0, -180.5)));
  EXPECT_FALSE(GeoUtils::isValidCoordinate(make_point(NAN, 0)));
}
