#include "util/ResponseSafety.hpp"
#include "core/RouteErrors.hpp"
#include <algorithm>
#include <cstring>
#include <regex>

extern char **environ;

namespace {

const std::regex &whitespace_re() {
  static const std::regex re(R"(\s+)");
  return re;
}

const std::regex &auth_scheme_re() {
  static const std::regex re(R"(\b(Bearer|Basic|KakaoAK)\s+[^\s]+)",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex &query_secret_re() {
  static const std::regex re(
      R"(([?&](api[_-]?key|key|token|secret|password)=)[^&\s]+)",
      std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex &sensitive_name_re() {
  static const std::regex re(R"(key|token|secret|password|passwd|private|auth)",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

std::string trim(const std::string &s) {
  const auto a = s.find_first_not_of(" \t\r\n\f\v");
  if (a == std::string::npos)
    return "";
  const auto b = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(a, b - a + 1);
}

void replace_all(std::string &text, const std::string &needle,
                 const std::string &with) {
  if (needle.empty())
    return;
  std::size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), with);
    pos += with.size();
  }
}

std::vector<std::string> sorted_secrets(std::vector<std::string> values) {
  values.erase(std::remove_if(values.begin(), values.end(),
                              [](const std::string &v) { return v.empty(); }),
               values.end());
  std::sort(values.begin(), values.end(),
            [](const std::string &a, const std::string &b) {
              if (a.size() != b.size())
                return a.size() > b.size();
              return a < b;
            });
  values.erase(std::unique(values.begin(), values.end()), values.end());
  return values;
}

} // namespace

ResponseSafety::ResponseSafety(std::vector<std::string> secrets) {
  for (auto &s : secrets)
    s = trim(s);
  const auto &env = sensitiveEnvValues();
  secrets.insert(secrets.end(), env.begin(), env.end());
  secrets_ = sorted_secrets(std::move(secrets));
}

const std::vector<std::string> &ResponseSafety::sensitiveEnvValues() {
  static const std::vector<std::string> values = [] {
    std::vector<std::string> out;
    for (char **e = environ; e && *e; ++e) {
      const char *eq = std::strchr(*e, '=');
      if (!eq)
        continue;
      const std::string name(*e, eq - *e);
      if (!std::regex_search(name, sensitive_name_re()))
        continue;
      std::string value = trim(eq + 1);
      if (value.size() >= 6)
        out.push_back(std::move(value));
    }
    return sorted_secrets(std::move(out));
  }();
  return values;
}

std::string ResponseSafety::sanitize(const std::string &raw) const {
  std::string text = trim(std::regex_replace(raw, whitespace_re(), " "));
  if (text.empty())
    return text;

  text = std::regex_replace(text, auth_scheme_re(),
                            std::string("$1 ") + kRedacted);
  text = std::regex_replace(text, query_secret_re(),
                            std::string("$1") + kRedacted);
  for (const auto &secret : secrets_)
    replace_all(text, secret, kRedacted);

  if (text.size() > kMaxPublicMessageLength) {
    // do not split a UTF-8 sequence (place names are often Hangul)
    std::size_t cut = kMaxPublicMessageLength - 3;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
      --cut;
    text = text.substr(0, cut) + "...";
  }
  return text;
}

std::string ResponseSafety::normalizeWarning(const std::string &raw,
                                             const std::string &fallback) const {
  std::string sanitized = sanitize(raw);
  return sanitized.empty() ? fallback : sanitized;
}

std::string
ResponseSafety::normalizeRouteErrorMessage(const std::exception &e) const {
  const std::string sanitized = sanitize(e.what());
  if (sanitized == InsufficientPointsError::kMessage)
    return sanitized;
  return genericRouteErrorMessage();
}

std::string ResponseSafety::genericRouteErrorMessage() {
  return "Failed to optimize route.";
}

std::string ResponseSafety::internalErrorMessage() {
  return "Unexpected error.";
}
