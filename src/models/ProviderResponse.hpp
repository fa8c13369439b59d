#pragma once

#include "models/RouteTypes.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

// Structures modelling the subset of each provider's JSON response we care
// about. Numeric fields stay optional: a provider answering 200 with a body
// that lacks them is treated as a failed attempt.

// Numbers may arrive as JSON numbers or numeric strings; anything else
// (including NaN / inf) counts as missing.
inline std::optional<double> finite_number(const Json &x) {
  if (x.is_number()) {
    const double v = x.get<double>();
    if (std::isfinite(v))
      return v;
    return std::nullopt;
  }
  if (x.is_string()) {
    const std::string &s = x.get_ref<const std::string &>();
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a])))
      ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
      --b;
    if (a == b)
      return std::nullopt;
    const std::string trimmed = s.substr(a, b - a);
    char *end = nullptr;
    const double v = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(v))
      return std::nullopt;
    return v;
  }
  return std::nullopt;
}

// ---------- Kakao Mobility directions ----------
struct KakaoSummary {
  std::optional<double> distance_m;
  std::optional<double> duration_s;
};

struct KakaoRoute {
  int result_code = 0;
  std::string result_msg;
  std::optional<KakaoSummary> summary;
};

struct KakaoDirections {
  std::vector<KakaoRoute> routes;
};

// ---------- ODsay public transit path ----------
struct OdsayPathInfo {
  std::optional<double> total_distance_m;
  std::optional<double> total_time_min;
};

struct OdsayPath {
  std::optional<OdsayPathInfo> info;
};

struct OdsayResult {
  std::vector<OdsayPath> paths;
  std::string error_message; // filled from the "error" envelope if present
};

// --- KakaoSummary ----
inline void from_json(const Json &j, KakaoSummary &s) {
  s.distance_m.reset();
  s.duration_s.reset();
  if (j.contains("distance"))
    s.distance_m = finite_number(j["distance"]);
  if (j.contains("duration"))
    s.duration_s = finite_number(j["duration"]);
}

// --- KakaoRoute ----
inline void from_json(const Json &j, KakaoRoute &r) {
  r.result_code = j.contains("result_code") && j["result_code"].is_number()
                      ? j["result_code"].get<int>()
                      : 0;
  r.result_msg = j.contains("result_msg") && j["result_msg"].is_string()
                     ? j["result_msg"].get<std::string>()
                     : "";
  r.summary.reset();
  if (j.contains("summary") && j["summary"].is_object())
    r.summary = j["summary"].get<KakaoSummary>();
}

// --- KakaoDirections ----
inline void from_json(const Json &j, KakaoDirections &d) {
  d.routes.clear();
  if (j.is_object() && j.contains("routes") && j["routes"].is_array()) {
    for (const auto &R : j["routes"]) {
      if (R.is_object())
        d.routes.push_back(R.get<KakaoRoute>());
    }
  }
}

// --- OdsayPathInfo ----
inline void from_json(const Json &j, OdsayPathInfo &i) {
  i.total_distance_m.reset();
  i.total_time_min.reset();
  if (j.contains("totalDistance"))
    i.total_distance_m = finite_number(j["totalDistance"]);
  if (j.contains("totalTime"))
    i.total_time_min = finite_number(j["totalTime"]);
}

// --- OdsayPath ----
inline void from_json(const Json &j, OdsayPath &p) {
  p.info.reset();
  if (j.contains("info") && j["info"].is_object())
    p.info = j["info"].get<OdsayPathInfo>();
}

// --- OdsayResult ----
// ODsay reports application errors with HTTP 200 and an "error" member that
// is either an object {code,msg} or an array of them.
inline void from_json(const Json &j, OdsayResult &r) {
  r.paths.clear();
  r.error_message.clear();
  if (!j.is_object())
    return;
  if (j.contains("error")) {
    const Json &e = j["error"];
    const Json &first = (e.is_array() && !e.empty()) ? e.front() : e;
    if (first.is_object()) {
      if (first.contains("msg") && first["msg"].is_string())
        r.error_message = first["msg"].get<std::string>();
      else if (first.contains("message") && first["message"].is_string())
        r.error_message = first["message"].get<std::string>();
    }
    if (r.error_message.empty())
      r.error_message = "provider error";
  }
  if (j.contains("result") && j["result"].is_object()) {
    const Json &res = j["result"];
    if (res.contains("path") && res["path"].is_array()) {
      for (const auto &P : res["path"]) {
        if (P.is_object())
          r.paths.push_back(P.get<OdsayPath>());
      }
    }
  }
}
