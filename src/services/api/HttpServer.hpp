#pragma once
#include <string>

namespace httplib { class Server; }

namespace zipcat {

class CatalogStore;

// Installs the read-only catalog endpoints on `svr`.
// apiKey: if empty, auth is disabled.
void register_routes(httplib::Server& svr, const CatalogStore& store, const std::string& apiKey);

// Blocking HTTP server over the catalog.
void run_http_server(const CatalogStore& store, int port, const std::string& apiKey);

} // namespace zipcat
