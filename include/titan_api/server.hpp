#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace titan_api {

struct BindAddress {
  std::string host;
  std::uint16_t port = 0;

  // "host:port", optionally prefixed with http://. Throws std::invalid_argument
  // for a missing host, a missing port or a port outside 1-65535.
  static BindAddress parse(const std::string &api_base_url);
};

// Owns the crow app and the thread that runs it. Handlers execute on crow's
// pool of `num_workers` threads.
class Server {
 public:
  Server(const BindAddress &address, int num_workers);
  ~Server();

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  const BindAddress &address() const {
    return address_;
  }

  void start();

  // Blocks until crow's event loop has returned
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  BindAddress address_;
  int num_workers_;
  std::future<void> run_future_;
  bool running_ = false;
};

}  // namespace titan_api
