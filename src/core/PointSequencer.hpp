#pragma once
#include "models/RouteTypes.hpp"
#include <vector>

// Greedy nearest-neighbour ordering of waypoints from a fixed origin.
class PointSequencer {
public:
  PointSequencer() = default;

  // Returns copies of `waypoints` in visiting order. The origin itself is not
  // part of the output. Equal distances resolve to the earliest input index.
  std::vector<Point> sequence(const Point &origin,
                              const std::vector<Point> &waypoints) const;
};
