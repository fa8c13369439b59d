// Entry point for the route engine HTTP server. It loads configuration,
// resolves provider credentials once and exposes the endpoints handled by
// `HttpHandler`.

#include "core/RouteOptimizer.hpp"
#include "http/http_handler.hpp"
#include "infra/HttplibFetcher.hpp"
#include "infra/ProviderCapabilities.hpp"
#include "infra/SettingsLoader.hpp"

#include <execinfo.h>
#include <iostream>
#include <signal.h>
#include <unistd.h>

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  Settings settings;
  try {
    settings = SettingsLoader::load(cfg_path);
  } catch (const std::exception &e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // ---------------------- Providers ---------------------------------------
  const ProviderCapabilities &caps = resolveCapabilities();
  std::cout << "[main] providers: kakao="
            << (caps.has(ProviderId::Kakao) ? "on" : "off")
            << " odsay=" << (caps.has(ProviderId::Odsay) ? "on" : "off")
            << std::endl;
  if (!caps.any())
    std::cout << "[main] no provider credentials, using fallback estimates"
              << std::endl;

  RouteOptimizer optimizer(EstimationProviderChain::forCapabilities(
      caps, std::make_shared<HttplibFetcher>(), settings.providers));
  HttpHandler handler(optimizer, ResponseSafety(caps.secrets()));

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(settings.server.payload_max_bytes);
  server.set_read_timeout(settings.server.read_timeout_s, 0);
  server.set_write_timeout(settings.server.write_timeout_s, 0);

  handler.registerRoutes(server, settings.server.api_prefix,
                         settings.server.post_endpoints,
                         settings.server.get_endpoints);

  // ---------------------- Start server ------------------------------------
  std::cout << "[main] listening on " << settings.server.host << ":"
            << settings.server.port << settings.server.api_prefix
            << std::endl;
  if (!server.listen(settings.server.host, settings.server.port)) {
    std::cerr << "[main] cannot listen on " << settings.server.host << ":"
              << settings.server.port << "\n";
    return 1;
  }
  return 0;
}
