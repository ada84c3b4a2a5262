#include "cache_demo/http_server.hpp"
#include "cache_demo/http_date.hpp"
#include "cache_demo/json_body.hpp"
#include "cache_demo/nav_page.hpp"
#include "cache_demo/response.hpp"
#include "cache_demo/server_state.hpp"
#include "cache_demo/strategy.hpp"
#include "cache_demo/utility_routes.hpp"

#include <httplib.h>
#include <exception>
#include <iostream>
#include <string>

namespace cd {

namespace {

RequestValidators validators_from(const httplib::Request& req) {
  RequestValidators v;
  if (req.has_header("If-None-Match"))     v.if_none_match = req.get_header_value("If-None-Match");
  if (req.has_header("If-Modified-Since")) v.if_modified_since = req.get_header_value("If-Modified-Since");
  return v;
}

// Copy a handler result onto the wire response, headers in list order.
void apply(const Response& r, httplib::Response& res) {
  res.status = r.status;
  for (auto& kv : r.headers) res.set_header(kv.first, kv.second);
  if (!r.content_type.empty()) res.set_content(r.body, r.content_type);
}

void send_error(httplib::Response& res, int status, const std::string& what) {
  JsonObject body;
  body.add("error", what)
      .add("timestamp", format_iso8601_ms(Clock::now()));
  apply(json_response(status, body), res);
}

}

struct HttpServer::Impl {
  Config cfg;
  ServerState& state;
  httplib::Server svr;
  int port = -1;

  Impl(Config c, ServerState& s) : cfg(std::move(c)), state(s) {}

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      NavPageRenderer::Config ncfg;
      ncfg.template_dir = cfg.template_dir;
      NavPageRenderer nav(ncfg);
      std::string html;
      if (!nav.render(html)) {
        std::cerr << "[error] navigation page: " << nav.error() << "\n";
        send_error(res, 500, "navigation page unavailable");
        return;
      }
      res.set_content(html, "text/html; charset=utf-8");
    });

    for (const Strategy& s : strategies()) {
      svr.Get(std::string(s.path), [this, s](const httplib::Request& req, httplib::Response& res) {
        apply(respond(s, state.snapshot(), validators_from(req)), res);
      });
    }

    svr.Get("/update-data", [this](const httplib::Request&, httplib::Response& res) {
      apply(update_data(state), res);
    });

    svr.Get("/force-error", [](const httplib::Request&, httplib::Response& res) {
      apply(force_error(), res);
    });

    svr.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
      apply(api_status(state), res);
    });
  }

  void hooks() {
    // Only unrouted requests land here; handler-set 4xx/5xx bodies stay untouched.
    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
      if (res.status != 404 || !res.body.empty())
        return httplib::Server::HandlerResponse::Unhandled;
      JsonObject body;
      body.add("error", "Not found").add("path", req.path);
      apply(json_response(404, body), res);
      return httplib::Server::HandlerResponse::Handled;
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
      std::string what = "unknown error";
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        what = e.what();
      } catch (...) {
        // non-std exception; reported with the generic message
      }
      std::cerr << "[error] " << req.method << " " << req.path << ": " << what << "\n";
      send_error(res, 500, what);
    });

    if (cfg.log_requests) {
      svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[http] " << format_iso8601_ms(Clock::now()) << " - "
                  << req.method << " " << req.path << " -> " << res.status << "\n";
      });
    }
  }
};

HttpServer::HttpServer(Config cfg, ServerState& state) : p_(new Impl(std::move(cfg), state)) {
  p_->routes();
  p_->hooks();
}
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->cfg.port == 0) {
    p_->port = p_->svr.bind_to_any_port(p_->cfg.host);
    return p_->port > 0;
  }
  if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
  p_->port = p_->cfg.port;
  return true;
}

bool HttpServer::serve() { return p_->svr.listen_after_bind(); }

void HttpServer::stop() { p_->svr.stop(); }

int HttpServer::bound_port() const { return p_->port; }

}
