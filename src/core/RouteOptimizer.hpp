#pragma once
#include "core/EstimationProviderChain.hpp"
#include "core/PointSequencer.hpp"
#include "models/RouteTypes.hpp"
#include <utility>

// Builds the ordered route and rolls up the per segment estimates.
class RouteOptimizer {
public:
  static constexpr const char *kNoCredentialsWarning =
      "No KAKAO/ODSAY API key found in environment. Using local fallback "
      "estimates.";

  explicit RouteOptimizer(EstimationProviderChain chain)
      : chain_(std::move(chain)) {}

  // Throws ValidationError for out-of-range coordinates and
  // InsufficientPointsError when fewer than two points remain.
  RouteResult optimize(const RouteRequest &request) const;

  // [origin] + sequenced waypoints + closing point (destination, or origin
  // on a round trip)
  std::vector<Point> buildOrderedPoints(const RouteRequest &request) const;

  static RouteSource classifySource(const std::vector<SegmentEstimate> &segs);

private:
  PointSequencer sequencer_;
  EstimationProviderChain chain_;
};
