#include "titan_api/server.hpp"

#include <iostream>
#include <stdexcept>

namespace titan_api {

BindAddress BindAddress::parse(const std::string &api_base_url) {
  std::string rest = api_base_url;
  const std::string scheme = "http://";
  if (rest.compare(0, scheme.size(), scheme) == 0) {
    rest.erase(0, scheme.size());
  }
  if (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }

  auto colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == rest.size()) {
    throw std::invalid_argument("api_base_url must look like host:port, got '" + api_base_url + "'");
  }

  BindAddress address;
  address.host = rest.substr(0, colon);
  const std::string port_text = rest.substr(colon + 1);
  if (port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
    throw std::invalid_argument("api_base_url has a non-numeric port: '" + port_text + "'");
  }
  int port = std::stoi(port_text);
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("api_base_url port out of range: " + port_text);
  }
  address.port = static_cast<std::uint16_t>(port);
  return address;
}

Server::Server(const BindAddress &address, int num_workers)
    : address_(address), num_workers_(num_workers) {
  if (num_workers_ <= 0) {
    throw std::invalid_argument("Server needs at least one worker thread");
  }
}

Server::~Server() {
  if (!running_) {
    return;
  }
  try {
    stop();
  } catch (const std::exception &e) {
    std::cerr << "[Server] Error while stopping: " << e.what() << std::endl;
  }
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "[Server] Listening on " << address_.host << ":" << address_.port << " with "
            << num_workers_ << " workers" << std::endl;
  run_future_ = std::async(std::launch::async, [this] {
    app_.port(address_.port)
        .bindaddr(address_.host)
        .concurrency(static_cast<std::uint16_t>(num_workers_))
        .run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (run_future_.valid()) {
    run_future_.get();
  }
  running_ = false;
  std::cout << "[Server] Stopped" << std::endl;
}

}  // namespace titan_api
