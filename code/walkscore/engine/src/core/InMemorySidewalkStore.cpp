// InMemorySidewalkStore keeps a whole dataset resident and answers the store
// queries with linear scans.

#include "core/InMemorySidewalkStore.hpp"
#include "core/GeoMath.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

Sidewalk sidewalk_from_row(const Json &row, const SidewalkSchema &schema) {
  if (!row.is_object())
    throw std::runtime_error("sidewalk row is not an object");
  Sidewalk s;
  s.start.lat = row.at(schema.start_lat).get<double>();
  s.start.lon = row.at(schema.start_lon).get<double>();
  s.end.lat = row.at(schema.end_lat).get<double>();
  s.end.lon = row.at(schema.end_lon).get<double>();
  for (const auto &col : schema.score_columns) {
    const auto &v = row.at(col);
    if (v.is_null())
      continue;
    s.scores[col] = v.get<double>();
  }
  return s;
}

InMemorySidewalkStore::InMemorySidewalkStore(std::vector<Sidewalk> sidewalks,
                                             std::string label)
    : sidewalks_(std::move(sidewalks)), label_(std::move(label)) {}

InMemorySidewalkStore
InMemorySidewalkStore::fromJson(const Json &rows, const SidewalkSchema &schema,
                                std::string label) {
  if (!rows.is_array())
    throw std::runtime_error("InMemorySidewalkStore: expected a JSON array of "
                             "rows");
  std::vector<Sidewalk> sidewalks;
  sidewalks.reserve(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    try {
      sidewalks.push_back(sidewalk_from_row(rows[i], schema));
    } catch (const Json::exception &e) {
      throw std::runtime_error("InMemorySidewalkStore: row " +
                               std::to_string(i) + ": " + e.what());
    }
  }
  return InMemorySidewalkStore(std::move(sidewalks), std::move(label));
}

InMemorySidewalkStore
InMemorySidewalkStore::fromFile(const std::filesystem::path &path,
                                const SidewalkSchema &schema) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("InMemorySidewalkStore: cannot open " +
                             path.string());
  Json rows;
  try {
    in >> rows;
  } catch (const Json::parse_error &e) {
    throw std::runtime_error("InMemorySidewalkStore: " + path.string() + ": " +
                             e.what());
  }
  return fromJson(rows, schema, path.filename().string());
}

std::string InMemorySidewalkStore::describe() const {
  return label_ + " (" + std::to_string(sidewalks_.size()) + " sidewalks)";
}

std::vector<Sidewalk>
InMemorySidewalkStore::nearest_by_endpoint(const Coordinate &p,
                                           std::size_t k) const {
  // (key, storage index): the index makes ties resolve in storage order.
  std::vector<std::pair<double, std::size_t>> keyed;
  keyed.reserve(sidewalks_.size());
  for (std::size_t i = 0; i < sidewalks_.size(); ++i) {
    double key = GeoMath::endpointManhattan(p, sidewalks_[i]);
    if (std::isnan(key))
      key = std::numeric_limits<double>::infinity();
    keyed.emplace_back(key, i);
  }
  const std::size_t n = std::min(k, keyed.size());
  std::partial_sort(keyed.begin(), keyed.begin() + n, keyed.end());

  std::vector<Sidewalk> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i)
    out.push_back(sidewalks_[keyed[i].second]);
  return out;
}

std::vector<Sidewalk>
InMemorySidewalkStore::query_endpoints_in_bbox(const BoundingBox &box) const {
  std::vector<Sidewalk> out;
  for (const auto &s : sidewalks_) {
    if (box.contains(s.start) || box.contains(s.end))
      out.push_back(s);
  }
  return out;
}

std::vector<Sidewalk>
InMemorySidewalkStore::query_extent_overlapping(const BoundingBox &box) const {
  std::vector<Sidewalk> out;
  for (const auto &s : sidewalks_) {
    const double minLat = std::min(s.start.lat, s.end.lat);
    const double maxLat = std::max(s.start.lat, s.end.lat);
    const double minLon = std::min(s.start.lon, s.end.lon);
    const double maxLon = std::max(s.start.lon, s.end.lon);
    if (minLat <= box.topLat && maxLat >= box.bottomLat &&
        minLon <= box.rightLng && maxLon >= box.leftLng)
      out.push_back(s);
  }
  return out;
}
