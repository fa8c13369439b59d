// Credential resolution for the estimation providers.

#include "infra/ProviderCapabilities.hpp"
#include <cstdlib>
#include <stdexcept>

static std::optional<std::string> trimmed_or_none(const std::string &raw) {
  const auto a = raw.find_first_not_of(" \t\r\n\f\v");
  if (a == std::string::npos)
    return std::nullopt;
  const auto b = raw.find_last_not_of(" \t\r\n\f\v");
  return raw.substr(a, b - a + 1);
}

static std::optional<std::string>
first_usable(const ProviderCapabilities::Lookup &lookup,
             const std::vector<std::string> &names) {
  for (const auto &name : names) {
    auto raw = lookup(name);
    if (!raw)
      continue;
    if (auto v = trimmed_or_none(*raw))
      return v;
  }
  return std::nullopt;
}

const std::vector<std::string> &ProviderCapabilities::kakaoAliases() {
  static const std::vector<std::string> names = {
      "KAKAO_REST_API_KEY", "KAKAO_API_KEY", "KAKAO_KEY"};
  return names;
}

const std::vector<std::string> &ProviderCapabilities::odsayAliases() {
  static const std::vector<std::string> names = {"ODSAY_API_KEY",
                                                 "ODSAY_KEY"};
  return names;
}

ProviderCapabilities::ProviderCapabilities(
    std::optional<std::string> kakao_key, std::optional<std::string> odsay_key)
    : kakao_key_(kakao_key ? trimmed_or_none(*kakao_key) : std::nullopt),
      odsay_key_(odsay_key ? trimmed_or_none(*odsay_key) : std::nullopt) {}

ProviderCapabilities ProviderCapabilities::fromLookup(const Lookup &lookup) {
  return ProviderCapabilities(first_usable(lookup, kakaoAliases()),
                              first_usable(lookup, odsayAliases()));
}

ProviderCapabilities ProviderCapabilities::fromEnvironment() {
  return fromLookup([](const std::string &name) -> std::optional<std::string> {
    const char *v = std::getenv(name.c_str());
    if (!v)
      return std::nullopt;
    return std::string(v);
  });
}

bool ProviderCapabilities::has(ProviderId id) const {
  switch (id) {
  case ProviderId::Kakao:
    return kakao_key_.has_value();
  case ProviderId::Odsay:
    return odsay_key_.has_value();
  default:
    return false;
  }
}

const std::string &ProviderCapabilities::key(ProviderId id) const {
  if (id == ProviderId::Kakao && kakao_key_)
    return *kakao_key_;
  if (id == ProviderId::Odsay && odsay_key_)
    return *odsay_key_;
  throw std::logic_error(std::string("no credential for provider ") +
                         ProviderIdToString(id));
}

std::vector<std::string> ProviderCapabilities::secrets() const {
  std::vector<std::string> out;
  if (kakao_key_)
    out.push_back(*kakao_key_);
  if (odsay_key_)
    out.push_back(*odsay_key_);
  return out;
}

const ProviderCapabilities &resolveCapabilities() {
  // function-local static: initialised exactly once, thread-safe
  static const ProviderCapabilities caps =
      ProviderCapabilities::fromEnvironment();
  return caps;
}
