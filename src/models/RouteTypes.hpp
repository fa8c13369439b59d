#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using Json = nlohmann::json;

// A geographic stop. Copied by value wherever it is reordered or returned so
// the caller's objects are never aliased.
struct Point {
  std::optional<std::string> id;
  std::optional<std::string> name;
  double lat = 0.0;
  double lng = 0.0;
};

enum class TransportMode : uint8_t { Driving, Transit, Walking };

// Identity of the source that produced a segment estimate.
enum class ProviderId : uint8_t {
  Kakao, // general directions (driving / walking)
  Odsay, // public transit aware
  Fallback
};

// Route level source: a single provider, or Mixed when segments disagree.
enum class RouteSource : uint8_t { Kakao, Odsay, Fallback, Mixed };

inline const char *TransportModeToString(TransportMode mode) {
  switch (mode) {
  case TransportMode::Transit:
    return "transit";
  case TransportMode::Walking:
    return "walking";
  default:
    return "driving";
  }
}

inline const char *ProviderIdToString(ProviderId id) {
  switch (id) {
  case ProviderId::Kakao:
    return "kakao";
  case ProviderId::Odsay:
    return "odsay";
  default:
    return "fallback";
  }
}

inline const char *RouteSourceToString(RouteSource source) {
  switch (source) {
  case RouteSource::Kakao:
    return "kakao";
  case RouteSource::Odsay:
    return "odsay";
  case RouteSource::Fallback:
    return "fallback";
  default:
    return "mixed";
  }
}

inline RouteSource RouteSourceFromProvider(ProviderId id) {
  switch (id) {
  case ProviderId::Kakao:
    return RouteSource::Kakao;
  case ProviderId::Odsay:
    return RouteSource::Odsay;
  default:
    return RouteSource::Fallback;
  }
}

// Validated input handed to the optimizer by the HTTP layer.
struct RouteRequest {
  Point origin;
  std::vector<Point> waypoints; // visiting order is decided by the sequencer
  std::optional<Point> destination;
  bool round_trip = false;
  TransportMode mode = TransportMode::Driving;
};

struct SegmentEstimate {
  Point from;
  Point to;
  double distance_km = 0.0;
  double duration_min = 0.0;
  ProviderId provider = ProviderId::Fallback;
};

struct RouteResult {
  std::vector<Point> ordered_points;
  std::vector<SegmentEstimate> segments;
  double total_distance_km = 0.0;
  double total_duration_min = 0.0;
  RouteSource source = RouteSource::Fallback;
  std::vector<std::string> warnings;
};

// Define to_json() overloads so results can be assigned straight into Json

// --- Point ----
inline void to_json(Json &j, const Point &p) {
  j = Json::object();
  if (p.id)
    j["id"] = *p.id;
  if (p.name)
    j["name"] = *p.name;
  j["lat"] = p.lat;
  j["lng"] = p.lng;
}

// --- SegmentEstimate ----
inline void to_json(Json &j, const SegmentEstimate &s) {
  j = Json{{"from", s.from},
           {"to", s.to},
           {"distanceKm", s.distance_km},
           {"durationMin", s.duration_min},
           {"provider", ProviderIdToString(s.provider)}};
}

// --- RouteResult ----
inline void to_json(Json &j, const RouteResult &r) {
  j = Json{{"orderedPoints", r.ordered_points},
           {"segments", r.segments},
           {"totalDistanceKm", r.total_distance_km},
           {"totalDurationMin", r.total_duration_min},
           {"source", RouteSourceToString(r.source)},
           {"warnings", r.warnings}};
}
