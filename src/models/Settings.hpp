#pragma once

#include "models/ProviderOutcome.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

// Server side configuration read from config/settings.json. Every key is
// optional; missing keys keep the defaults below.
struct ServerSettings {
  std::string host = "0.0.0.0";
  int port = 4000;
  std::string api_prefix = "/api/v1";
  int read_timeout_s = 30;
  int write_timeout_s = 30;
  std::size_t payload_max_bytes = 1024 * 1024; // 1MB
  std::vector<std::string> post_endpoints = {"route/optimize"};
  std::vector<std::string> get_endpoints = {"health"};
};

struct Settings {
  ServerSettings server;
  ProviderEndpoints providers;

  static ProviderEndpoint endpoint_from_json(const nlohmann::json &j,
                                             ProviderEndpoint p) {
    if (!j.is_object())
      throw std::runtime_error("settings: provider endpoint must be an object");
    if (j.contains("base_url"))
      p.base_url = j.at("base_url").get<std::string>();
    if (j.contains("path"))
      p.path = j.at("path").get<std::string>();
    if (j.contains("timeout_ms"))
      p.timeout = std::chrono::milliseconds(j.at("timeout_ms").get<int>());
    return p;
  }

  static Settings from_json(const nlohmann::json &j) {
    Settings s;
    if (j.contains("server")) {
      const auto &sj = j.at("server");
      if (!sj.is_object())
        throw std::runtime_error("settings: server must be an object");
      ServerSettings &p = s.server;
      if (sj.contains("host"))
        p.host = sj.at("host").get<std::string>();
      if (sj.contains("port"))
        p.port = sj.at("port").get<int>();
      if (sj.contains("api_prefix"))
        p.api_prefix = sj.at("api_prefix").get<std::string>();
      if (sj.contains("read_timeout_s"))
        p.read_timeout_s = sj.at("read_timeout_s").get<int>();
      if (sj.contains("write_timeout_s"))
        p.write_timeout_s = sj.at("write_timeout_s").get<int>();
      if (sj.contains("payload_max_bytes"))
        p.payload_max_bytes = sj.at("payload_max_bytes").get<std::size_t>();
      if (sj.contains("post_endpoints"))
        p.post_endpoints =
            sj.at("post_endpoints").get<std::vector<std::string>>();
      if (sj.contains("get_endpoints"))
        p.get_endpoints = sj.at("get_endpoints").get<std::vector<std::string>>();
    }
    if (j.contains("providers")) {
      const auto &pj = j.at("providers");
      if (!pj.is_object())
        throw std::runtime_error("settings: providers must be an object");
      if (pj.contains("kakao"))
        s.providers.kakao = endpoint_from_json(pj.at("kakao"), s.providers.kakao);
      if (pj.contains("odsay"))
        s.providers.odsay = endpoint_from_json(pj.at("odsay"), s.providers.odsay);
    }
    return s;
  }
};
