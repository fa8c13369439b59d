// Concrete estimators for the two external providers. Both turn any
// transport, status or payload problem into a ProviderOutcome failure and
// never throw.

#include "infra/ProviderClients.hpp"
#include "core/GeoUtils.hpp"
#include "models/ProviderResponse.hpp"
#include <iomanip>
#include <sstream>

std::string format_coordinate(double value) {
  std::ostringstream os;
  os << std::setprecision(15) << value;
  return os.str();
}

// Common first stage: transport outcome, status, JSON body.
static bool read_json_body(const HttpReply &reply, Json &body,
                           std::string &error) {
  // a cancelled call never counts, even if bytes arrived before the cut
  if (reply.timed_out) {
    error = reply.error.empty() ? "timed out" : reply.error;
    return false;
  }
  if (!reply.completed) {
    error = reply.error.empty() ? "request failed" : reply.error;
    return false;
  }
  if (!reply.success()) {
    error = "HTTP " + std::to_string(reply.status);
    return false;
  }
  body = Json::parse(reply.body, nullptr, /*allow_exceptions=*/false);
  if (body.is_discarded()) {
    error = "invalid JSON response";
    return false;
  }
  return true;
}

// ---------------------- Kakao ----------------------------------------------

KakaoDirectionsClient::KakaoDirectionsClient(
    std::shared_ptr<HttpFetcher> fetcher, ProviderEndpoint endpoint,
    std::string api_key)
    : fetcher_(std::move(fetcher)), endpoint_(std::move(endpoint)),
      api_key_(std::move(api_key)) {}

HttpRequestSpec KakaoDirectionsClient::buildRequest(const Point &from,
                                                    const Point &to) const {
  HttpRequestSpec req;
  req.base_url = endpoint_.base_url;
  req.path = endpoint_.path;
  // Kakao takes "x,y" i.e. longitude first
  req.query = {
      {"origin", format_coordinate(from.lng) + "," + format_coordinate(from.lat)},
      {"destination", format_coordinate(to.lng) + "," + format_coordinate(to.lat)},
      {"priority", "RECOMMEND"},
      {"alternatives", "false"},
      {"road_details", "false"}};
  req.headers = {{"Authorization", "KakaoAK " + api_key_}};
  return req;
}

ProviderOutcome KakaoDirectionsClient::parseReply(const HttpReply &reply) {
  Json body;
  std::string error;
  if (!read_json_body(reply, body, error))
    return ProviderOutcome::failure(error);

  const auto directions = body.get<KakaoDirections>();
  // Kakao answers 200 with a non-zero result_code (e.g. 104, origin and
  // destination too close) and no summary when it cannot route.
  if (!directions.routes.empty() && directions.routes.front().result_code != 0 &&
      !directions.routes.front().summary) {
    const KakaoRoute &route = directions.routes.front();
    std::string reason = "Kakao result " + std::to_string(route.result_code);
    if (!route.result_msg.empty())
      reason += ": " + route.result_msg;
    return ProviderOutcome::failure(reason);
  }
  if (directions.routes.empty() || !directions.routes.front().summary ||
      !directions.routes.front().summary->distance_m ||
      !directions.routes.front().summary->duration_s ||
      *directions.routes.front().summary->distance_m < 0 ||
      *directions.routes.front().summary->duration_s < 0)
    return ProviderOutcome::failure("Kakao response missing distance/duration");

  const auto &summary = *directions.routes.front().summary;
  RawEstimate est;
  est.distance_km = GeoUtils::roundTo(*summary.distance_m / 1000.0, 2);
  est.duration_min = GeoUtils::roundTo(*summary.duration_s / 60.0, 1);
  est.provider = ProviderId::Kakao;
  return ProviderOutcome::success(est);
}

ProviderOutcome KakaoDirectionsClient::estimate(const Point &from,
                                                const Point &to) const {
  return parseReply(fetcher_->get(buildRequest(from, to), endpoint_.timeout));
}

// ---------------------- ODsay ----------------------------------------------

OdsayTransitClient::OdsayTransitClient(std::shared_ptr<HttpFetcher> fetcher,
                                       ProviderEndpoint endpoint,
                                       std::string api_key)
    : fetcher_(std::move(fetcher)), endpoint_(std::move(endpoint)),
      api_key_(std::move(api_key)) {}

HttpRequestSpec OdsayTransitClient::buildRequest(const Point &from,
                                                 const Point &to) const {
  HttpRequestSpec req;
  req.base_url = endpoint_.base_url;
  req.path = endpoint_.path;
  req.query = {{"SX", format_coordinate(from.lng)},
               {"SY", format_coordinate(from.lat)},
               {"EX", format_coordinate(to.lng)},
               {"EY", format_coordinate(to.lat)},
               {"apiKey", api_key_}};
  return req;
}

ProviderOutcome OdsayTransitClient::parseReply(const HttpReply &reply) {
  Json body;
  std::string error;
  if (!read_json_body(reply, body, error))
    return ProviderOutcome::failure(error);

  const auto result = body.get<OdsayResult>();
  if (!result.error_message.empty() && result.paths.empty())
    return ProviderOutcome::failure("ODSAY error: " + result.error_message);
  if (result.paths.empty() || !result.paths.front().info ||
      !result.paths.front().info->total_distance_m ||
      !result.paths.front().info->total_time_min ||
      *result.paths.front().info->total_distance_m < 0 ||
      *result.paths.front().info->total_time_min < 0)
    return ProviderOutcome::failure("ODSAY response missing distance/time");

  const auto &info = *result.paths.front().info;
  RawEstimate est;
  est.distance_km = GeoUtils::roundTo(*info.total_distance_m / 1000.0, 2);
  est.duration_min = GeoUtils::roundTo(*info.total_time_min, 1);
  est.provider = ProviderId::Odsay;
  return ProviderOutcome::success(est);
}

ProviderOutcome OdsayTransitClient::estimate(const Point &from,
                                             const Point &to) const {
  return parseReply(fetcher_->get(buildRequest(from, to), endpoint_.timeout));
}
