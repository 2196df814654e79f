#include "http_handler.hpp"
#include "core/Errors.hpp"
#include "core/GeoMath.hpp"
#include "core/ScoreReport.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

#include <cmath>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using json = nlohmann::json;

// ===== request helpers =====

// Error body in the shape public clients already parse:
// {"errors":[{"msg":..., "param":..., "location":"query"}]}
static void send_error(httplib::Response &res, int status,
                       const std::string &msg, const json &param) {
  json err = {{"msg", msg}, {"param", param}, {"location", "query"}};
  res.status = status;
  res.set_content(json{{"errors", json::array({err})}}.dump(),
                  "application/json");
}

// Strict float parse of a query parameter; the whole value must be numeric.
static std::optional<double> parse_double(const httplib::Request &req,
                                          const std::string &name) {
  if (!req.has_param(name))
    return std::nullopt;
  const std::string s = req.get_param_value(name);
  try {
    size_t used = 0;
    double v = std::stod(s, &used);
    if (used != s.size() || !std::isfinite(v))
      return std::nullopt;
    return v;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

struct PointQuery {
  double latitude = 0;
  double longitude = 0;
  double range = 0;
  std::string source;
};

// Validates latitude/longitude/range/source. Writes a 400 and returns false
// on the first bad parameter.
static bool parse_point_query(const httplib::Request &req,
                              const SidewalkCatalog &catalog, PointQuery &q,
                              httplib::Response &res) {
  auto lat = parse_double(req, "latitude");
  if (!lat || *lat < -90.0 || *lat > 90.0) {
    send_error(res, 400, "Must be between -90 and 90", "latitude");
    return false;
  }
  auto lon = parse_double(req, "longitude");
  if (!lon || *lon < -180.0 || *lon > 180.0) {
    send_error(res, 400, "Must be between -180 and 180", "longitude");
    return false;
  }
  q.latitude = *lat;
  q.longitude = *lon;

  const auto &params = catalog.params();
  q.range = params.default_range_miles;
  if (req.has_param("range") && !req.get_param_value("range").empty()) {
    auto r = parse_double(req, "range");
    if (!r || !params.isAllowedRange(*r)) {
      std::ostringstream msg;
      msg << "Must be one of";
      for (size_t i = 0; i < params.allowed_ranges_miles.size(); ++i)
        msg << (i ? ", " : " ") << params.allowed_ranges_miles[i];
      msg << " miles";
      send_error(res, 400, msg.str(), "range");
      return false;
    }
    q.range = *r;
  }

  if (req.has_param("source") && !req.get_param_value("source").empty()) {
    q.source = req.get_param_value("source");
    if (!catalog.contains(q.source)) {
      send_error(res, 400, "Unknown source: " + q.source, "source");
      return false;
    }
  } else {
    q.source = catalog.defaultSource();
  }
  return true;
}

// Maps engine errors onto HTTP statuses; anything else is a 500.
template <typename Fn>
static void run_guarded(const char *tag, httplib::Response &res, Fn &&fn) {
  try {
    fn();
  } catch (const InvalidGeometry &e) {
    send_error(res, 400, e.what(), json::array({"latitude", "longitude"}));
  } catch (const UnknownSource &e) {
    send_error(res, 400, e.what(), "source");
  } catch (const SidewalkNotFound &e) {
    std::cerr << "[" << tag << "] not found: " << e.what() << "\n";
    res.status = 404;
    res.set_content(json{{"error", e.what()}}.dump(), "application/json");
  } catch (const std::exception &e) {
    std::cerr << "[" << tag << "] EXCEPTION: " << e.what() << "\n";
    res.status = 500;
    res.set_content(json{{"error", e.what()}}.dump(), "application/json");
  }
}

// ===== routes =====

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "score/gps") {
    handleScoreGps(req, res);
  } else if (action == "score/range") {
    handleScoreRange(req, res);
  } else if (action == "sources") {
    handleSources(req, res);
  } else if (action == "dbping") {
    handleDBPing(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== score =====

// /score/gps: scores of the closest sidewalk; include_range=true adds the
// sidewalks around the point as a FeatureCollection
void HttpHandler::handleScoreGps(const httplib::Request &req,
                                 httplib::Response &res) {
  run_guarded("handleScoreGps", res, [&] {
    PointQuery q;
    if (!parse_point_query(req, catalog_, q, res))
      return;

    bool include_range = false;
    if (req.has_param("include_range")) {
      const std::string v = req.get_param_value("include_range");
      if (v != "true" && v != "false" && !v.empty()) {
        send_error(res, 400, "Must be true, false or null", "include_range");
        return;
      }
      include_range = (v == "true");
    }

    std::optional<double> range;
    if (include_range)
      range = q.range;
    ScoreReport report =
        resolveScore(catalog_, q.source, q.latitude, q.longitude, range);
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(report_json(report).dump(), "application/json");
  });
}

// /score/range: every sidewalk in range as GeoJSON
void HttpHandler::handleScoreRange(const httplib::Request &req,
                                   httplib::Response &res) {
  run_guarded("handleScoreRange", res, [&] {
    PointQuery q;
    if (!parse_point_query(req, catalog_, q, res))
      return;

    const SidewalkIndex index = catalog_.index(q.source);
    const auto sidewalks =
        index.findSegmentsInRange(q.latitude, q.longitude, q.range);

    json fc = to_feature_collection(sidewalks);
    fc["source"] = q.source;
    fc["range"] = q.range;
    fc["box"] = GeoMath::deriveBoundingBox(q.latitude, q.longitude, q.range);
    fc["containment"] = ContainmentModeToString(index.params().containment);
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(fc.dump(), "application/json");
  });
}

// ===== metadata =====

void HttpHandler::handleSources(const httplib::Request &,
                                httplib::Response &res) {
  run_guarded("handleSources", res, [&] {
    json out = {{"sources", catalog_.sources()},
                {"default", catalog_.defaultSource()},
                {"candidate_count", catalog_.params().candidate_count}};
    res.set_content(out.dump(), "application/json");
  });
}

void HttpHandler::handleDBPing(const httplib::Request &,
                               httplib::Response &res) {
  std::cerr << "hit ping" << "\n";
  json results = json::object();
  bool all_ok = true;
  for (const auto &[name, store] : pingable_) {
    const bool ok = store->ping();
    all_ok = all_ok && ok;
    results[name] = ok;
  }
  if (!all_ok)
    res.status = 500;
  res.set_content(json{{"ok", all_ok}, {"sources", results}}.dump(),
                  "application/json");
}
