#pragma once
#include <string>

namespace httplib { class Server; }

namespace safesar {
  class SarService;

  // Installs /health, /sar, /redact and the /sar lookup routes on svr.
  // apiKey: if empty, auth is disabled.
  void register_routes(httplib::Server& svr,
                       SarService& service,
                       const std::string& apiKey);

  // Start a blocking HTTP server with register_routes on 0.0.0.0:port.
  // Returns false if the port could not be bound.
  bool run_http_server(SarService& service,
                       int port,
                       const std::string& apiKey);
}
