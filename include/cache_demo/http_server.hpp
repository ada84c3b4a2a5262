#pragma once
#include <string>

namespace cd {

class ServerState;

// cpp-httplib front end: routes the demo endpoints onto the strategy and
// utility handlers, logs each request and turns escaped exceptions into 500s.
class HttpServer {
public:
  struct Config {
    std::string host = "0.0.0.0";
    int port = 3000;               // 0 = pick an ephemeral port
#ifdef CD_DEFAULT_TEMPLATE_DIR
    std::string template_dir = CD_DEFAULT_TEMPLATE_DIR;
#else
    std::string template_dir = "templates";
#endif
    bool log_requests = true;
  };

  // `state` must outlive the server.
  HttpServer(Config cfg, ServerState& state);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind only; returns false on bind error.
  bool start();

  // Blocking accept loop on an already bound socket; returns when stopped.
  bool serve();

  // Stop if running.
  void stop();

  // Port actually bound (differs from Config::port when that was 0); -1 before start().
  int bound_port() const;

private:
  struct Impl;
  Impl* p_;
};

}
