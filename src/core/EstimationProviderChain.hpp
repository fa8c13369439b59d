#pragma once
#include "infra/HttpFetcher.hpp"
#include "infra/ProviderCapabilities.hpp"
#include "models/ProviderOutcome.hpp"
#include "util/ResponseSafety.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

// Estimates one directed segment by trying providers in mode order and
// falling back to the geometric estimate when none of them answers.
class EstimationProviderChain {
public:
  // Only providers present in `estimators` are ever attempted.
  EstimationProviderChain(std::map<ProviderId, ProviderEstimator> estimators,
                          ResponseSafety safety);

  // Binds the HTTP clients of every provider that has a credential.
  static EstimationProviderChain
  forCapabilities(const ProviderCapabilities &caps,
                  std::shared_ptr<HttpFetcher> fetcher,
                  const ProviderEndpoints &endpoints);

  // transit prefers ODsay, everything else prefers Kakao
  static std::vector<ProviderId> providerOrder(TransportMode mode);

  // providerOrder() restricted to the bound providers
  std::vector<ProviderId> attemptOrder(TransportMode mode) const;
  bool hasProviders() const { return !estimators_.empty(); }

  // Failed attempts append one sanitized warning each; the call itself
  // always produces an estimate.
  SegmentEstimate estimate(const Point &from, const Point &to,
                           TransportMode mode,
                           std::vector<std::string> &warnings) const;

private:
  ProviderOutcome attempt(ProviderId id, const Point &from,
                          const Point &to) const;

  std::map<ProviderId, ProviderEstimator> estimators_;
  ResponseSafety safety_;
};
