// PointSequencer orders waypoints by repeatedly visiting the closest
// unvisited one. O(n^2) over the waypoint count, which the request parser
// caps at 25.

#include "PointSequencer.hpp"
#include "core/GeoUtils.hpp"
#include <limits>

std::vector<Point>
PointSequencer::sequence(const Point &origin,
                         const std::vector<Point> &waypoints) const {
  std::vector<Point> ordered;
  ordered.reserve(waypoints.size());
  std::vector<bool> visited(waypoints.size(), false);

  Point current = origin;
  for (std::size_t step = 0; step < waypoints.size(); ++step) {
    std::size_t best_idx = 0;
    double best_km = std::numeric_limits<double>::infinity();
    bool found = false;
    for (std::size_t i = 0; i < waypoints.size(); ++i) {
      if (visited[i])
        continue;
      const double d = GeoUtils::haversineKm(current, waypoints[i]);
      // strict < keeps the first candidate on ties
      if (!found || d < best_km) {
        best_km = d;
        best_idx = i;
        found = true;
      }
    }
    visited[best_idx] = true;
    ordered.push_back(waypoints[best_idx]);
    current = waypoints[best_idx];
  }
  return ordered;
}
