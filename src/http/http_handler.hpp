#pragma once

#include "core/RouteOptimizer.hpp"
#include "util/ResponseSafety.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Thin wrapper around httplib callbacks. The server forwards requests to
// these member functions based on the action string taken from the URL.
class HttpHandler {
public:
  HttpHandler(const RouteOptimizer &optimizer, ResponseSafety safety,
              std::string service_name = "route-engine")
      : optimizer_(optimizer), safety_(std::move(safety)),
        service_(std::move(service_name)) {}

  // Registers every configured action under `api_prefix` (health stays at
  // the root), plus the 404 and exception handlers.
  void registerRoutes(httplib::Server &server, const std::string &api_prefix,
                      const std::vector<std::string> &post_actions,
                      const std::vector<std::string> &get_actions);

  void callPostHandler(const std::string &action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(const std::string &action, const httplib::Request &req,
                      httplib::Response &res);

  static void sendJson(httplib::Response &res, int status,
                       const nlohmann::json &body);
  // 500 for anything optimize() throws besides validation errors
  void sendOptimizeFailure(httplib::Response &res,
                           const std::exception &e) const;

private:
  const RouteOptimizer &optimizer_;
  ResponseSafety safety_;
  std::string service_;

  // Individual request handlers
  void handleOptimize(const httplib::Request &req, httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);
  void handleNotFound(const httplib::Request &req, httplib::Response &res);
};
