#include "http_handler.hpp"
#include "core/RouteErrors.hpp"
#include "http/RouteRequestParser.hpp"
#include "http/json_errors.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

using json = nlohmann::json;

static std::string iso_timestamp_utc() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

void HttpHandler::sendJson(httplib::Response &res, int status,
                           const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

// ===== routes =====

void HttpHandler::registerRoutes(httplib::Server &server,
                                 const std::string &api_prefix,
                                 const std::vector<std::string> &post_actions,
                                 const std::vector<std::string> &get_actions) {
  for (const auto &action : post_actions) {
    server.Post(api_prefix + "/" + action,
                [this, action](const httplib::Request &req,
                               httplib::Response &res) {
                  callPostHandler(action, req, res);
                });
  }
  for (const auto &action : get_actions) {
    const std::string path =
        action == "health" ? "/health" : api_prefix + "/" + action;
    server.Get(path, [this, action](const httplib::Request &req,
                                    httplib::Response &res) {
      callGetHandler(action, req, res);
    });
  }

  // 404 for anything no handler claimed. Handlers that set their own error
  // status already wrote a body.
  server.set_error_handler(
      [this](const httplib::Request &req, httplib::Response &res) {
        if (res.status == 404 && res.body.empty())
          handleNotFound(req, res);
      });

  server.set_exception_handler([](const httplib::Request &req,
                                  httplib::Response &res,
                                  std::exception_ptr ep) {
    try {
      if (ep)
        std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      std::cerr << "[http] unhandled error on " << req.path << ": " << e.what()
                << "\n";
    } catch (...) {
      std::cerr << "[http] unhandled error on " << req.path << ": unknown\n";
    }
    sendJson(res, 500,
             {{"error", "Internal Server Error"},
              {"message", ResponseSafety::internalErrorMessage()}});
  });
}

void HttpHandler::callPostHandler(const std::string &action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "route/optimize") {
    handleOptimize(req, res);
  } else {
    handleNotFound(req, res);
  }
}

void HttpHandler::callGetHandler(const std::string &action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "health") {
    handleHealth(req, res);
  } else {
    handleNotFound(req, res);
  }
}

// ===== POST: /route/optimize =====

void HttpHandler::handleOptimize(const httplib::Request &req,
                                 httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    sendJson(res, 400,
             {{"error", "Bad Request"},
              {"message", RouteRequestParser::kNotAnObject},
              {"details", {describe_parse_error(req.body, e)}}});
    return;
  }

  RouteRequest request;
  try {
    request = RouteRequestParser::parse(body);
  } catch (const ValidationError &e) {
    sendJson(res, 400,
             {{"error", "Bad Request"},
              {"message", e.what()},
              {"details", e.details()}});
    return;
  }

  try {
    const RouteResult result = optimizer_.optimize(request);
    sendJson(res, 200, {{"success", true}, {"data", result}});
  } catch (const ValidationError &e) {
    std::vector<std::string> details;
    for (const auto &d : e.details())
      details.push_back(safety_.sanitize(d));
    sendJson(res, 400,
             {{"error", "Bad Request"},
              {"message", RouteRequestParser::kInvalidPayload},
              {"details", details}});
  } catch (const std::exception &e) {
    sendOptimizeFailure(res, e);
  }
}

// Only the insufficient-points message reaches the client verbatim.
void HttpHandler::sendOptimizeFailure(httplib::Response &res,
                                      const std::exception &e) const {
  std::cerr << "[route-optimize] failed: " << safety_.sanitize(e.what())
            << "\n";
  sendJson(res, 500,
           {{"error", "Internal Server Error"},
            {"message", safety_.normalizeRouteErrorMessage(e)}});
}

// ===== GET: /health =====

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  sendJson(res, 200,
           {{"status", "ok"},
            {"service", service_},
            {"timestamp", iso_timestamp_utc()}});
}

void HttpHandler::handleNotFound(const httplib::Request &req,
                                 httplib::Response &res) {
  sendJson(res, 404,
           {{"error", "Not Found"},
            {"message", "No route matched " + req.method + " " + req.path}});
}
