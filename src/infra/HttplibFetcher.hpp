#pragma once
#include "infra/HttpFetcher.hpp"

// cpp-httplib backed fetcher. Each call gets its own client so a cancelled
// call cannot disturb any other.
class HttplibFetcher final : public HttpFetcher {
public:
  // socket timeouts = deadline + grace
  static constexpr std::chrono::milliseconds kSocketGrace{500};

  HttplibFetcher() = default;

  HttpReply get(const HttpRequestSpec &request,
                std::chrono::milliseconds timeout) override;
};
