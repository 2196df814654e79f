// Entry point for the walkscore HTTP server. It loads configuration, opens
// every configured sidewalk dataset read-only, and exposes the score
// endpoints handled by `HttpHandler`.

#include "core/InMemorySidewalkStore.hpp"
#include "core/SidewalkCatalog.hpp"
#include "http/http_handler.hpp"
#include "infra/MySQLSidewalkStore.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

#include <cstdio>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  std::ifstream cfg(cfg_path);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << cfg_path << "\n";
    return 1;
  }
  json settings;
  QueryParams params;
  std::string host = "0.0.0.0";
  int port = 5005;
  json get_endpoints = json::array();
  try {
    cfg >> settings;
    params = QueryParams::from_json(settings.value("query", json::object()));
    const json server_cfg = settings.value("server", json::object());
    host = server_cfg.value("host", host);
    port = server_cfg.value("port", port);
    get_endpoints = server_cfg.value("get_endpoints", json::array());
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Bad configuration in " << cfg_path << ": "
              << e.what() << "\n";
    return 1;
  }

  // ---------------------- Open datasets ------------------------------------
  // Stores are owned here and outlive the catalog and the handler.
  std::vector<std::unique_ptr<SidewalkStore>> stores;
  SidewalkCatalog catalog(params);
  std::vector<std::pair<std::string, const MySQLSidewalkStore *>> pingable;
  try {
    const std::string default_source =
        settings.at("default_source").get<std::string>();
    for (const auto &src : settings.at("sources")) {
      const std::string name = src.at("name").get<std::string>();
      const std::string type = src.value("type", "mysql");
      const SidewalkSchema schema =
          SidewalkSchema::from_json(src.value("schema", json::object()));

      if (type == "mysql") {
        const auto conn = MySQLConnectionConfig::from_json(
            src, name, name == default_source);
        auto store = std::make_unique<MySQLSidewalkStore>(
            conn.uri, conn.user, conn.password, conn.database, schema);
        pingable.emplace_back(name, store.get());
        stores.push_back(std::move(store));
      } else if (type == "json") {
        stores.push_back(std::make_unique<InMemorySidewalkStore>(
            InMemorySidewalkStore::fromFile(src.at("path").get<std::string>(),
                                            schema)));
      } else {
        std::cerr << "[main] unknown source type '" << type << "' for "
                  << name << "\n";
        return 1;
      }
      catalog.add(name, *stores.back());
      std::cerr << "[main] source " << name << ": "
                << stores.back()->describe() << "\n";
    }
    catalog.setDefaultSource(default_source);
  } catch (const std::exception &e) {
    std::cerr << "[main] cannot open datasets: " << e.what() << "\n";
    return 1;
  }

  HttpHandler handler(catalog);
  for (const auto &[name, store] : pingable)
    handler.addPingable(name, *store);

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : get_endpoints) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
  }

  // ---------------------- Start server ------------------------------------
  std::cout << "[DEBUG] Starting server on " << host << ":" << port
            << std::endl;
  if (!server.listen(host, port)) {
    std::cerr << "[main] cannot listen on " << host << ":" << port << "\n";
    return 1;
  }
  return 0;
}
