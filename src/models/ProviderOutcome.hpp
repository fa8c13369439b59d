#pragma once
#include "models/RouteTypes.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <utility>

// Normalised answer of one provider: kilometres and minutes.
struct RawEstimate {
  double distance_km = 0.0;
  double duration_min = 0.0;
  ProviderId provider = ProviderId::Fallback;
};

// Either a value or the reason the attempt failed. A failed attempt is
// recoverable; the chain moves on to the next provider.
struct ProviderOutcome {
  bool ok = false;
  RawEstimate value;
  std::string error;

  static ProviderOutcome success(RawEstimate v) {
    ProviderOutcome o;
    o.ok = true;
    o.value = v;
    return o;
  }
  static ProviderOutcome failure(std::string reason) {
    ProviderOutcome o;
    o.error = std::move(reason);
    return o;
  }
};

// Uniform estimator signature every provider is bound to.
using ProviderEstimator =
    std::function<ProviderOutcome(const Point &from, const Point &to)>;

// Where and how long to wait for a provider.
struct ProviderEndpoint {
  std::string base_url;
  std::string path;
  std::chrono::milliseconds timeout{0};
};

struct ProviderEndpoints {
  ProviderEndpoint kakao{"https://apis-navi.kakaomobility.com",
                         "/v1/directions", std::chrono::milliseconds(4000)};
  ProviderEndpoint odsay{"https://api.odsay.com",
                         "/v1/api/searchPubTransPathT",
                         std::chrono::milliseconds(4500)};
};
