// RouteOptimizer: sequencing, closure and sequential per segment estimation.
//
// Segments are estimated one after another, never in parallel. This keeps
// outbound load on the rate limited providers bounded and keeps the warning
// list in segment order.

#include "core/RouteOptimizer.hpp"
#include "core/GeoUtils.hpp"
#include "core/RouteErrors.hpp"

static void check_point(const Point &p, const std::string &label,
                        std::vector<std::string> &errors) {
  if (!GeoUtils::isValidCoordinate(p))
    errors.push_back(label + " has an invalid coordinate.");
}

std::vector<Point>
RouteOptimizer::buildOrderedPoints(const RouteRequest &request) const {
  std::vector<Point> ordered;
  ordered.reserve(request.waypoints.size() + 2);
  ordered.push_back(request.origin);

  auto seq = sequencer_.sequence(request.origin, request.waypoints);
  ordered.insert(ordered.end(), seq.begin(), seq.end());

  if (request.destination)
    ordered.push_back(*request.destination);
  else if (request.round_trip)
    ordered.push_back(request.origin);
  return ordered;
}

RouteSource
RouteOptimizer::classifySource(const std::vector<SegmentEstimate> &segs) {
  if (segs.empty())
    return RouteSource::Fallback;
  const ProviderId first = segs.front().provider;
  for (const auto &s : segs) {
    if (s.provider != first)
      return RouteSource::Mixed;
  }
  return RouteSourceFromProvider(first);
}

RouteResult RouteOptimizer::optimize(const RouteRequest &request) const {
  std::vector<std::string> errors;
  check_point(request.origin, "origin", errors);
  for (std::size_t i = 0; i < request.waypoints.size(); ++i)
    check_point(request.waypoints[i], "waypoints[" + std::to_string(i) + "]",
                errors);
  if (request.destination)
    check_point(*request.destination, "destination", errors);
  if (!errors.empty())
    throw ValidationError("Invalid route request.", errors);

  RouteResult result;
  if (!chain_.hasProviders())
    result.warnings.push_back(kNoCredentialsWarning);

  result.ordered_points = buildOrderedPoints(request);
  if (result.ordered_points.size() < 2)
    throw InsufficientPointsError();

  result.segments.reserve(result.ordered_points.size() - 1);
  double sum_km = 0.0, sum_min = 0.0;
  for (std::size_t i = 0; i + 1 < result.ordered_points.size(); ++i) {
    SegmentEstimate seg =
        chain_.estimate(result.ordered_points[i], result.ordered_points[i + 1],
                        request.mode, result.warnings);
    sum_km += seg.distance_km;
    sum_min += seg.duration_min;
    result.segments.push_back(std::move(seg));
  }

  result.total_distance_km = GeoUtils::roundTo(sum_km, 2);
  result.total_duration_min = GeoUtils::roundTo(sum_min, 1);
  result.source = classifySource(result.segments);
  return result;
}
