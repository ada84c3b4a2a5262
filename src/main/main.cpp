#include "cache_demo/config.hpp"
#include "cache_demo/http_server.hpp"
#include "cache_demo/server_state.hpp"

#include <iostream>

int main() {
  cd::ServerState state;

  cd::HttpServer::Config cfg;
  cfg.port = cd::port_from_env();

  cd::HttpServer server(cfg, state);
  if (!server.start()) {
    std::cerr << "[error] server failed to bind " << cfg.host << ":" << cfg.port << "\n";
    return 1;
  }

  std::cout << "[server] Cache Control Demo Server running on http://localhost:" << server.bound_port() << "\n"
            << "[server] Visit http://localhost:" << server.bound_port() << " to see the demo navigation\n"
            << "[server] Open the browser DevTools (Network tab) to observe caching behavior" << std::endl;

  if (!server.serve()) {
    std::cerr << "[error] server stopped with a listen error\n";
    return 1;
  }
  return 0;
}
