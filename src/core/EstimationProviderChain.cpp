#include "core/EstimationProviderChain.hpp"
#include "core/GeoUtils.hpp"
#include "infra/ProviderClients.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

static std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

static const std::string &label(const Point &p) {
  static const std::string kUnnamed = "point";
  return p.name ? *p.name : kUnnamed;
}

EstimationProviderChain::EstimationProviderChain(
    std::map<ProviderId, ProviderEstimator> estimators, ResponseSafety safety)
    : estimators_(std::move(estimators)), safety_(std::move(safety)) {
  // the fallback is not an attemptable provider
  estimators_.erase(ProviderId::Fallback);
  for (auto it = estimators_.begin(); it != estimators_.end();) {
    if (!it->second)
      it = estimators_.erase(it);
    else
      ++it;
  }
}

EstimationProviderChain EstimationProviderChain::forCapabilities(
    const ProviderCapabilities &caps, std::shared_ptr<HttpFetcher> fetcher,
    const ProviderEndpoints &endpoints) {
  std::map<ProviderId, ProviderEstimator> estimators;
  if (caps.has(ProviderId::Kakao)) {
    auto client = std::make_shared<KakaoDirectionsClient>(
        fetcher, endpoints.kakao, caps.key(ProviderId::Kakao));
    estimators[ProviderId::Kakao] = [client](const Point &a, const Point &b) {
      return client->estimate(a, b);
    };
  }
  if (caps.has(ProviderId::Odsay)) {
    auto client = std::make_shared<OdsayTransitClient>(
        fetcher, endpoints.odsay, caps.key(ProviderId::Odsay));
    estimators[ProviderId::Odsay] = [client](const Point &a, const Point &b) {
      return client->estimate(a, b);
    };
  }
  return EstimationProviderChain(std::move(estimators),
                                 ResponseSafety(caps.secrets()));
}

std::vector<ProviderId> EstimationProviderChain::providerOrder(TransportMode mode) {
  if (mode == TransportMode::Transit)
    return {ProviderId::Odsay, ProviderId::Kakao};
  return {ProviderId::Kakao, ProviderId::Odsay};
}

std::vector<ProviderId>
EstimationProviderChain::attemptOrder(TransportMode mode) const {
  std::vector<ProviderId> out;
  for (ProviderId id : providerOrder(mode)) {
    if (estimators_.count(id))
      out.push_back(id);
  }
  return out;
}

ProviderOutcome EstimationProviderChain::attempt(ProviderId id,
                                                 const Point &from,
                                                 const Point &to) const {
  try {
    return estimators_.at(id)(from, to);
  } catch (const std::exception &e) {
    return ProviderOutcome::failure(e.what());
  }
}

SegmentEstimate
EstimationProviderChain::estimate(const Point &from, const Point &to,
                                  TransportMode mode,
                                  std::vector<std::string> &warnings) const {
  SegmentEstimate seg;
  seg.from = from;
  seg.to = to;

  for (ProviderId id : attemptOrder(mode)) {
    const ProviderOutcome outcome = attempt(id, from, to);
    if (outcome.ok) {
      seg.distance_km = outcome.value.distance_km;
      seg.duration_min = outcome.value.duration_min;
      seg.provider = id;
      return seg;
    }
    const std::string reason =
        outcome.error.empty() ? "unknown error" : outcome.error;
    const std::string warning = safety_.normalizeWarning(
        upper(ProviderIdToString(id)) + " estimate failed for " + label(from) +
            " -> " + label(to) + " (" + reason + ").",
        upper(ProviderIdToString(id)) + " estimate failed.");
    std::cerr << "[provider-chain] " << warning << "\n";
    warnings.push_back(warning);
  }

  const FallbackEstimate fb = GeoUtils::fallbackEstimate(from, to, mode);
  seg.distance_km = fb.distance_km;
  seg.duration_min = fb.duration_min;
  seg.provider = ProviderId::Fallback;
  return seg;
}
