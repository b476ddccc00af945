#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace ephem_api {

// Owns the Crow app and runs it on a background thread
class Server {
 public:
  Server(const std::string &host, int port, unsigned int threads = 0);
  ~Server();

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Returns once the listener is bound
  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  unsigned int threads_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};

}  // namespace ephem_api
