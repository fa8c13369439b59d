#include "infra/SettingsLoader.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

static std::string trim_copy(const std::string &s) {
  const auto a = s.find_first_not_of(" \t\r\n");
  if (a == std::string::npos)
    return "";
  const auto b = s.find_last_not_of(" \t\r\n");
  return s.substr(a, b - a + 1);
}

static int parse_port(const std::string &raw) {
  std::size_t used = 0;
  int port = 0;
  try {
    port = std::stoi(raw, &used);
  } catch (const std::exception &) {
    throw std::runtime_error("Invalid PORT: " + raw);
  }
  if (used == 0 || port < 1 || port > 65535)
    throw std::runtime_error("Invalid PORT: " + raw);
  return port;
}

std::string SettingsLoader::normalizeApiPrefix(const std::string &raw) {
  const std::string trimmed = trim_copy(raw);
  if (trimmed.empty() || trimmed.front() != '/')
    return "/" + trimmed;
  return trimmed;
}

Settings SettingsLoader::parse(const std::string &text, const Lookup &env) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(std::string("settings: ") + e.what());
  }
  if (!j.is_object())
    throw std::runtime_error("settings: top level must be an object");
  Settings s;
  try {
    s = Settings::from_json(j);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("settings: ") + e.what());
  }

  if (auto host = env("HOST"); host && !trim_copy(*host).empty())
    s.server.host = trim_copy(*host);
  if (auto port = env("PORT"); port && !trim_copy(*port).empty())
    s.server.port = parse_port(trim_copy(*port));
  if (auto prefix = env("API_PREFIX"); prefix && !trim_copy(*prefix).empty())
    s.server.api_prefix = *prefix;
  s.server.api_prefix = normalizeApiPrefix(s.server.api_prefix);

  if (s.server.port < 1 || s.server.port > 65535)
    throw std::runtime_error("Invalid PORT: " +
                             std::to_string(s.server.port));
  if (s.providers.kakao.timeout.count() <= 0 ||
      s.providers.odsay.timeout.count() <= 0)
    throw std::runtime_error("settings: provider timeout_ms must be positive");
  return s;
}

Settings SettingsLoader::load(const std::string &path, const Lookup &env) {
  std::ifstream cfg(path);
  if (!cfg)
    throw std::runtime_error("Cannot open " + path);
  std::stringstream buf;
  buf << cfg.rdbuf();
  return parse(buf.str(), env);
}

Settings SettingsLoader::load(const std::string &path) {
  return load(path, [](const std::string &name) -> std::optional<std::string> {
    const char *v = std::getenv(name.c_str());
    if (!v)
      return std::nullopt;
    return std::string(v);
  });
}
