#pragma once
#include "infra/HttpFetcher.hpp"
#include "models/ProviderOutcome.hpp"
#include <memory>
#include <string>

// Kakao Mobility car directions: distance in metres, duration in seconds.
class KakaoDirectionsClient {
public:
  KakaoDirectionsClient(std::shared_ptr<HttpFetcher> fetcher,
                        ProviderEndpoint endpoint, std::string api_key);

  ProviderOutcome estimate(const Point &from, const Point &to) const;

  HttpRequestSpec buildRequest(const Point &from, const Point &to) const;
  static ProviderOutcome parseReply(const HttpReply &reply);

private:
  std::shared_ptr<HttpFetcher> fetcher_;
  ProviderEndpoint endpoint_;
  std::string api_key_;
};

// ODsay public transit search: distance in metres, time already in minutes.
class OdsayTransitClient {
public:
  OdsayTransitClient(std::shared_ptr<HttpFetcher> fetcher,
                     ProviderEndpoint endpoint, std::string api_key);

  ProviderOutcome estimate(const Point &from, const Point &to) const;

  HttpRequestSpec buildRequest(const Point &from, const Point &to) const;
  static ProviderOutcome parseReply(const HttpReply &reply);

private:
  std::shared_ptr<HttpFetcher> fetcher_;
  ProviderEndpoint endpoint_;
  std::string api_key_;
};

// Shortest decimal text for a coordinate ("127.01", not "127.010000").
std::string format_coordinate(double value);
