#pragma once
#include <exception>
#include <string>
#include <vector>

// Scrubs text derived from internal errors or provider responses before it
// is placed in warnings or returned to clients.
class ResponseSafety {
public:
  static constexpr const char *kRedacted = "[REDACTED]";
  static constexpr std::size_t kMaxPublicMessageLength = 180;

  // `secrets` are literal values to redact in addition to the values of
  // sensitive environment variables.
  explicit ResponseSafety(std::vector<std::string> secrets = {});

  std::string sanitize(const std::string &raw) const;

  // sanitized text, or `fallback` when nothing is left
  std::string normalizeWarning(const std::string &raw,
                               const std::string &fallback) const;

  // Only messages on the safe list survive; everything else becomes the
  // generic optimize failure message.
  std::string normalizeRouteErrorMessage(const std::exception &e) const;
  static std::string genericRouteErrorMessage();
  static std::string internalErrorMessage();

  // Values (>= 6 chars) of environment variables whose name looks like a
  // credential. Read once per process.
  static const std::vector<std::string> &sensitiveEnvValues();

private:
  std::vector<std::string> secrets_; // longest first
};
