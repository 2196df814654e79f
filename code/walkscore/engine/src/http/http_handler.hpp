#pragma once

#include "core/SidewalkCatalog.hpp"
#include "httplib.h"
#include "infra/MySQLSidewalkStore.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>

// Thin wrapper around httplib callbacks. The main server forwards requests to
// these member functions based on the action string parsed from the URL. No
// retrieval logic lives here: requests are validated, handed to the catalog
// and the result serialised.
class HttpHandler {
public:
  explicit HttpHandler(const SidewalkCatalog &catalog) : catalog_(catalog) {}

  // Sources reachable by /dbping. Borrowed, must outlive the handler.
  void addPingable(const std::string &source, const MySQLSidewalkStore &store) {
    pingable_[source] = &store;
  }

  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  const SidewalkCatalog &catalog_;
  std::map<std::string, const MySQLSidewalkStore *> pingable_;

  // Individual request handlers
  void handleScoreGps(const httplib::Request &req, httplib::Response &res);
  void handleScoreRange(const httplib::Request &req, httplib::Response &res);
  void handleSources(const httplib::Request &req, httplib::Response &res);
  void handleDBPing(const httplib::Request &req, httplib::Response &res);
};
