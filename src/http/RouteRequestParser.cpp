#include "http/RouteRequestParser.hpp"
#include "core/RouteErrors.hpp"
#include "models/ProviderResponse.hpp" // finite_number
#include <algorithm>
#include <cctype>
#include <initializer_list>

using json = nlohmann::json;

// First member among `names` that is present and not null.
static const json *first_present(const json &obj,
                                 std::initializer_list<const char *> names) {
  for (const char *n : names) {
    auto it = obj.find(n);
    if (it != obj.end() && !it->is_null())
      return &*it;
  }
  return nullptr;
}

static std::string lower_trim(const std::string &s) {
  const auto a = s.find_first_not_of(" \t\r\n");
  if (a == std::string::npos)
    return "";
  const auto b = s.find_last_not_of(" \t\r\n");
  std::string out = s.substr(a, b - a + 1);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

// trimmed, non-empty, at most kMaxTextLength code points
static std::optional<std::string> read_optional_string(const json *v) {
  if (!v || !v->is_string())
    return std::nullopt;
  const std::string &s = v->get_ref<const std::string &>();
  const auto a = s.find_first_not_of(" \t\r\n");
  if (a == std::string::npos)
    return std::nullopt;
  const auto b = s.find_last_not_of(" \t\r\n");
  std::string out = s.substr(a, b - a + 1);

  std::size_t chars = 0, i = 0;
  for (; i < out.size(); ++i) {
    if ((static_cast<unsigned char>(out[i]) & 0xC0) != 0x80) {
      if (chars == RouteRequestParser::kMaxTextLength)
        break;
      ++chars;
    }
  }
  out.resize(i);
  return out;
}

std::optional<double> RouteRequestParser::toFiniteNumber(const json &v) {
  return finite_number(v);
}

std::optional<TransportMode>
RouteRequestParser::parseModeName(const std::string &raw) {
  const std::string n = lower_trim(raw);
  if (n == "driving" || n == "drive" || n == "car" || n == "auto")
    return TransportMode::Driving;
  if (n == "transit" || n == "public" || n == "public-transit" || n == "bus" ||
      n == "subway")
    return TransportMode::Transit;
  if (n == "walking" || n == "walk" || n == "pedestrian")
    return TransportMode::Walking;
  return std::nullopt;
}

std::optional<Point>
RouteRequestParser::parsePoint(const json *raw, const std::string &label,
                               std::vector<std::string> &errors) {
  if (!raw)
    return std::nullopt;
  if (!raw->is_object()) {
    errors.push_back(label + " must be an object.");
    return std::nullopt;
  }

  const json *lat_v = first_present(*raw, {"lat", "latitude", "y"});
  const json *lng_v = first_present(*raw, {"lng", "lon", "longitude", "x"});
  const auto lat = lat_v ? toFiniteNumber(*lat_v) : std::nullopt;
  const auto lng = lng_v ? toFiniteNumber(*lng_v) : std::nullopt;

  if (!lat || *lat < -90 || *lat > 90)
    errors.push_back(label + ".lat must be a valid number between -90 and 90.");
  if (!lng || *lng < -180 || *lng > 180)
    errors.push_back(label +
                     ".lng must be a valid number between -180 and 180.");
  if (!lat || !lng)
    return std::nullopt;

  Point p;
  p.id = read_optional_string(first_present(*raw, {"id"}));
  p.name = read_optional_string(first_present(*raw, {"name", "title"}));
  p.lat = *lat;
  p.lng = *lng;
  return p;
}

std::vector<Point>
RouteRequestParser::parsePointArray(const json *raw, const std::string &label,
                                    std::vector<std::string> &errors) {
  std::vector<Point> points;
  if (!raw)
    return points;
  if (!raw->is_array()) {
    errors.push_back(label + " must be an array.");
    return points;
  }
  if (raw->size() > kMaxWaypoints)
    errors.push_back(label + " can include at most " +
                     std::to_string(kMaxWaypoints) + " points.");

  const std::size_t n = std::min(raw->size(), kMaxWaypoints);
  for (std::size_t i = 0; i < n; ++i) {
    auto p = parsePoint(&(*raw)[i], label + "[" + std::to_string(i) + "]",
                        errors);
    if (p)
      points.push_back(std::move(*p));
  }
  return points;
}

TransportMode RouteRequestParser::parseMode(const json *raw,
                                            std::vector<std::string> &errors) {
  if (!raw || (raw->is_string() && raw->get_ref<const std::string &>().empty()))
    return TransportMode::Driving;
  if (!raw->is_string()) {
    errors.push_back("mode must be a string.");
    return TransportMode::Driving;
  }
  if (auto m = parseModeName(raw->get<std::string>()))
    return *m;
  errors.push_back("mode must be one of driving, transit, or walking.");
  return TransportMode::Driving;
}

bool RouteRequestParser::parseRoundTrip(const json *raw,
                                        std::vector<std::string> &errors) {
  if (!raw)
    return false;
  if (raw->is_boolean())
    return raw->get<bool>();
  if (raw->is_string()) {
    const std::string &s = raw->get_ref<const std::string &>();
    if (s.empty() || s == "false")
      return false;
    if (s == "true")
      return true;
  }
  errors.push_back("roundTrip must be a boolean.");
  return false;
}

RouteRequest RouteRequestParser::parse(const json &body) {
  if (!body.is_object())
    throw ValidationError(kNotAnObject);

  std::vector<std::string> errors;
  auto start = parsePoint(first_present(body, {"start", "origin"}), "start",
                          errors);
  auto end = parsePoint(first_present(body, {"end", "destination"}), "end",
                        errors);
  auto waypoints = parsePointArray(
      first_present(body, {"waypoints", "points", "stops"}), "waypoints",
      errors);
  const TransportMode mode =
      parseMode(first_present(body, {"mode", "transportMode"}), errors);
  const bool round_trip = parseRoundTrip(first_present(body, {"roundTrip"}),
                                         errors);

  if (!start && !waypoints.empty()) {
    start = waypoints.front();
    waypoints.erase(waypoints.begin());
  }

  const bool closes = end.has_value() || (round_trip && start.has_value());
  const std::size_t total =
      (start ? 1 : 0) + waypoints.size() + (closes ? 1 : 0);

  if (!start)
    errors.push_back("A start/origin point is required. Provide start/origin "
                     "or include waypoints/points with at least one item.");
  if (total < 2)
    errors.push_back("At least two points are required to optimize a route.");

  if (!errors.empty() || !start)
    throw ValidationError(kInvalidPayload, std::move(errors));

  RouteRequest req;
  req.origin = std::move(*start);
  req.waypoints = std::move(waypoints);
  req.destination = std::move(end);
  req.round_trip = round_trip;
  req.mode = mode;
  return req;
}
