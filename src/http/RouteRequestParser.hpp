#pragma once
#include "models/RouteTypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Turns a raw optimize request body into a validated RouteRequest. Accepts
// the field aliases older clients send (origin/start, points/stops, ...).
class RouteRequestParser {
public:
  static constexpr std::size_t kMaxWaypoints = 25;
  static constexpr std::size_t kMaxTextLength = 120;
  static constexpr const char *kInvalidPayload =
      "Invalid optimize route payload.";
  static constexpr const char *kNotAnObject =
      "Request body must be a JSON object.";

  // Throws ValidationError carrying every problem found.
  static RouteRequest parse(const nlohmann::json &body);

  // helpers, exposed for tests
  static std::optional<TransportMode>
  parseModeName(const std::string &raw); // nullopt when unrecognised
  static std::optional<double> toFiniteNumber(const nlohmann::json &v);

private:
  static std::optional<Point> parsePoint(const nlohmann::json *raw,
                                         const std::string &label,
                                         std::vector<std::string> &errors);
  static std::vector<Point> parsePointArray(const nlohmann::json *raw,
                                            const std::string &label,
                                            std::vector<std::string> &errors);
  static TransportMode parseMode(const nlohmann::json *raw,
                                 std::vector<std::string> &errors);
  static bool parseRoundTrip(const nlohmann::json *raw,
                             std::vector<std::string> &errors);
};
