#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Malformed request input. `details` lists every problem found, in the order
// the fields were checked.
class ValidationError : public std::runtime_error {
public:
  ValidationError(const std::string &message,
                  std::vector<std::string> details = {})
      : std::runtime_error(message), details_(std::move(details)) {}

  const std::vector<std::string> &details() const noexcept { return details_; }

private:
  std::vector<std::string> details_;
};

// Fewer than two points after sequencing and closure. The message is fixed
// and safe to show to clients.
class InsufficientPointsError : public std::runtime_error {
public:
  static constexpr const char *kMessage =
      "Route optimization requires at least two points.";

  InsufficientPointsError() : std::runtime_error(kMessage) {}
};
