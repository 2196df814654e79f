#pragma once

#include "models/CoreTypes.hpp"
#include <cmath>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Named quality dimensions attached to a sidewalk. The engine never
// interprets these; they are handed back to the caller unchanged.
using ScoreSet = std::map<std::string, double>;

// One sidewalk-like path element as presented by a store.
struct Sidewalk {
  Coordinate start;
  Coordinate end;
  ScoreSet scores;

  bool isDegenerate() const {
    return start.lat == end.lat && start.lon == end.lon;
  }
};

inline bool operator==(const Sidewalk &a, const Sidewalk &b) {
  return a.start.lat == b.start.lat && a.start.lon == b.start.lon &&
         a.end.lat == b.end.lat && a.end.lon == b.end.lon &&
         a.scores == b.scores;
}

// Keys the score response writes next to the flat scores; a score column
// may not use one of them.
inline const std::vector<std::string> &reserved_response_keys() {
  static const std::vector<std::string> keys = {
      "latitude", "longitude", "source",           "distance_m",
      "sidewalk", "range",     "sidewalks_in_range"};
  return keys;
}

// Table layout of a sidewalk dataset. Datasets over the same geography use
// different column names and score scales, so every source carries its own.
struct SidewalkSchema {
  std::string table = "Walkspan";
  std::string start_lat = "sidewalk_starting_latitude";
  std::string start_lon = "sidewalk_starting_longitude";
  std::string end_lat = "sidewalk_ending_latitude";
  std::string end_lon = "sidewalk_ending_longitude";
  std::vector<std::string> score_columns = {
      "natural_beauty_score", "manmade_beauty_score", "comfort_score",
      "interest_score",       "safety_score",         "access_score",
      "amenities_score"};

  static SidewalkSchema from_json(const Json &j) {
    SidewalkSchema s;
    if (j.contains("table"))
      s.table = j.at("table").get<std::string>();
    if (j.contains("start_lat"))
      s.start_lat = j.at("start_lat").get<std::string>();
    if (j.contains("start_lon"))
      s.start_lon = j.at("start_lon").get<std::string>();
    if (j.contains("end_lat"))
      s.end_lat = j.at("end_lat").get<std::string>();
    if (j.contains("end_lon"))
      s.end_lon = j.at("end_lon").get<std::string>();
    if (j.contains("score_columns"))
      s.score_columns = j.at("score_columns").get<std::vector<std::string>>();
    if (s.score_columns.empty())
      throw std::invalid_argument("schema '" + s.table +
                                  "' has no score columns");
    for (const auto &col : s.score_columns) {
      for (const auto &key : reserved_response_keys())
        if (col == key)
          throw std::invalid_argument("schema '" + s.table +
                                      "': score column '" + col +
                                      "' clashes with a response field");
    }
    return s;
  }
};

// Scores are stored as doubles; integral values go back out as integers so
// a 3 in the table is a 3 in the response.
inline Json score_value_json(double v) {
  if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15)
    return static_cast<int64_t>(v);
  return v;
}

inline Json scores_json(const ScoreSet &scores) {
  Json out = Json::object();
  for (const auto &[name, value] : scores)
    out[name] = score_value_json(value);
  return out;
}

inline void to_json(Json &j, const Sidewalk &s) {
  j = Json{{"start", s.start}, {"end", s.end}, {"scores", scores_json(s.scores)}};
}

// GeoJSON Feature with a two-point LineString ([lon, lat] order).
inline Json to_feature(const Sidewalk &s) {
  Json feat;
  feat["type"] = "Feature";
  feat["properties"] = scores_json(s.scores);
  feat["geometry"] = {
      {"type", "LineString"},
      {"coordinates",
       Json::array({Json::array({s.start.lon, s.start.lat}),
                    Json::array({s.end.lon, s.end.lat})})}};
  return feat;
}

inline Json to_feature_collection(const std::vector<Sidewalk> &sidewalks) {
  Json fc = {{"type", "FeatureCollection"}, {"features", Json::array()}};
  for (const auto &s : sidewalks)
    fc["features"].push_back(to_feature(s));
  return fc;
}
