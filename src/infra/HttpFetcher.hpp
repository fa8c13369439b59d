#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

// One plain GET against an external provider.
struct HttpRequestSpec {
  std::string base_url; // scheme://host[:port]
  std::string path;
  std::vector<std::pair<std::string, std::string>> query;
  std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpReply {
  bool completed = false; // a response (of any status) was received
  bool timed_out = false; // the deadline elapsed and the call was cancelled
  int status = 0;
  std::string body;
  std::string error; // transport error text when !completed

  bool success() const { return completed && status >= 200 && status < 300; }
};

// Transport seam for the provider clients. Implementations must return once
// `timeout` has elapsed, cancelling whatever is still in flight.
class HttpFetcher {
public:
  virtual ~HttpFetcher() = default;
  virtual HttpReply get(const HttpRequestSpec &request,
                        std::chrono::milliseconds timeout) = 0;
};
