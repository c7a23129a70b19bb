#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>

#include "SarService.hpp"

using nlohmann::json;

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true;
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static void reply(httplib::Response& res, const safesar::SarResponse& r) {
  res.status = r.status;
  res.set_content(r.body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

// -------- server --------

namespace safesar {

void register_routes(httplib::Server& svr,
                     SarService& service,
                     const std::string& apiKey) {
  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /sar
  // Body: {"security_detail_json": <case object or JSON text>}
  svr.Post("/sar", [&service, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    reply(res, service.handle(req.body));
  });

  // POST /redact
  // Body: raw case JSON. Returns exactly what /sar would send to the model.
  svr.Post("/redact", [&service, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    res.status = 200;
    res.set_content(service.redact(req.body), "application/json");
  });

  // GET /sar/cases/<case_id>
  svr.Get(R"(/sar/cases/([A-Za-z0-9._-]+))", [&service, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    reply(res, service.listCase(req.matches[1]));
  });

  // GET /sar/narratives/<id>
  svr.Get(R"(/sar/narratives/([0-9a-f-]+))", [&service, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    reply(res, service.describe(req.matches[1]));
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

bool run_http_server(SarService& service,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;
  register_routes(svr, service, apiKey);

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
    return false;
  }
  return true;
}

} // namespace safesar
