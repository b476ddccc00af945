#include "ephem_api/server.hpp"

#include <iostream>

namespace ephem_api {

Server::Server(const std::string &host, int port, unsigned int threads)
    : host_(host), port_(port), threads_(threads) {}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.port(static_cast<std::uint16_t>(port_)).bindaddr(host_);
  if (threads_ > 0) {
    app_.concurrency(threads_);
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] { app_.run(); });
  app_.wait_for_server_start();
  std::cout << "[Server] Listening on " << host_ << ":" << port_ << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    try {
      server_thread_future_.get();
    } catch (const std::exception &e) {
      std::cerr << "[Server] Server thread exited with error: " << e.what() << std::endl;
    }
  }
  running_ = false;
  std::cout << "[Server] Stopped." << std::endl;
}

}  // namespace ephem_api
