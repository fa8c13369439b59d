// HttplibFetcher issues provider requests with a hard per-call deadline.
//
// The request runs on an async task. If the deadline passes first, the
// client's sockets are shut down and the progress callback starts refusing
// data, which makes the pending Get() return promptly with a cancellation
// error. Socket level timeouts sit slightly above the deadline so a call
// that never reaches the progress callback still terminates, while the
// deadline itself always fires first.

#include "infra/HttplibFetcher.hpp"
#include <httplib.h>

#include <atomic>
#include <future>
#include <memory>

HttpReply HttplibFetcher::get(const HttpRequestSpec &request,
                              std::chrono::milliseconds timeout) {
  HttpReply reply;

  auto cli = std::make_shared<httplib::Client>(request.base_url);
  if (!cli->is_valid()) {
    reply.error = "invalid provider base url";
    return reply;
  }
  const auto socket_timeout = timeout + kSocketGrace;
  cli->set_connection_timeout(socket_timeout);
  cli->set_read_timeout(socket_timeout);
  cli->set_write_timeout(socket_timeout);

  httplib::Params params(request.query.begin(), request.query.end());
  httplib::Headers headers(request.headers.begin(), request.headers.end());
  auto cancelled = std::make_shared<std::atomic<bool>>(false);

  auto pending = std::async(
      std::launch::async, [cli, cancelled, path = request.path, params,
                           headers]() {
        return cli->Get(path, params, headers,
                        [cancelled](uint64_t, uint64_t) {
                          return !cancelled->load();
                        });
      });

  if (pending.wait_for(timeout) == std::future_status::timeout) {
    cancelled->store(true);
    cli->stop();
    pending.wait(); // bounded by the socket timeouts above
    reply.timed_out = true;
    reply.error = "timed out after " + std::to_string(timeout.count()) + " ms";
    return reply;
  }

  httplib::Result res = pending.get();
  if (!res) {
    reply.error = httplib::to_string(res.error());
    return reply;
  }
  reply.completed = true;
  reply.status = res->status;
  reply.body = res->body;
  return reply;
}
