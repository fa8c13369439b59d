#pragma once
#include "models/RouteTypes.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Which external providers have usable credentials. Built once and never
// mutated afterwards, so it can be shared across request threads.
class ProviderCapabilities {
public:
  // name -> value, nullopt when the variable is unset
  using Lookup = std::function<std::optional<std::string>(const std::string &)>;

  static const std::vector<std::string> &kakaoAliases();
  static const std::vector<std::string> &odsayAliases();

  ProviderCapabilities() = default;
  ProviderCapabilities(std::optional<std::string> kakao_key,
                       std::optional<std::string> odsay_key);

  // First alias with a non-blank (trimmed) value wins.
  static ProviderCapabilities fromLookup(const Lookup &lookup);
  static ProviderCapabilities fromEnvironment();

  bool has(ProviderId id) const;
  bool any() const { return kakao_key_.has_value() || odsay_key_.has_value(); }
  // Precondition: has(id)
  const std::string &key(ProviderId id) const;
  std::vector<std::string> secrets() const;

private:
  std::optional<std::string> kakao_key_;
  std::optional<std::string> odsay_key_;
};

// Process wide capability set. The environment is read on the first call;
// every later call returns the same object.
const ProviderCapabilities &resolveCapabilities();
