#pragma once
#include "models/Settings.hpp"
#include <functional>
#include <optional>
#include <string>

// Reads settings.json and applies HOST / PORT / API_PREFIX overrides.
// Throws std::runtime_error on unreadable files or invalid values.
class SettingsLoader {
public:
  using Lookup = std::function<std::optional<std::string>(const std::string &)>;

  static Settings load(const std::string &path);
  static Settings load(const std::string &path, const Lookup &env);
  static Settings parse(const std::string &text, const Lookup &env);

  static std::string normalizeApiPrefix(const std::string &raw);
};
