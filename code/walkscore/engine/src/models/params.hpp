#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

// Which sidewalks count as "in range" of a bounding box.
enum class ContainmentMode : uint8_t {
  AnyEndpoint = 0, // start OR end inside the box
  BothEndpoints,   // start AND end inside the box
  Intersects       // any part of the segment touches the box
};

inline const char *ContainmentModeToString(ContainmentMode mode) {
  switch (mode) {
  case ContainmentMode::BothEndpoints:
    return "both_endpoints";
  case ContainmentMode::Intersects:
    return "intersects";
  default:
    return "any_endpoint";
  }
}

inline ContainmentMode ContainmentModeFromString(const std::string &s) {
  if (s == "any_endpoint")
    return ContainmentMode::AnyEndpoint;
  if (s == "both_endpoints")
    return ContainmentMode::BothEndpoints;
  if (s == "intersects")
    return ContainmentMode::Intersects;
  throw std::invalid_argument("unknown containment mode: " + s);
}

// Tunables for the query engine and the HTTP front end.
struct QueryParams {
  // Number of endpoint-nearest candidates resolved exactly per nearest query.
  std::size_t candidate_count = 8;
  ContainmentMode containment = ContainmentMode::AnyEndpoint;
  double default_range_miles = 0.35;
  std::vector<double> allowed_ranges_miles = {0.25, 0.5, 1.0};

  bool isAllowedRange(double range) const {
    if (allowed_ranges_miles.empty())
      return range > 0.0;
    for (double r : allowed_ranges_miles)
      if (r == range)
        return true;
    return false;
  }

  static QueryParams from_json(const nlohmann::json &j) {
    QueryParams p;
    if (j.contains("candidate_count")) {
      const int k = j.at("candidate_count").get<int>();
      if (k < 1)
        throw std::invalid_argument("candidate_count must be at least 1");
      p.candidate_count = static_cast<std::size_t>(k);
    }
    if (j.contains("containment"))
      p.containment =
          ContainmentModeFromString(j.at("containment").get<std::string>());
    if (j.contains("default_range_miles"))
      p.default_range_miles = j.at("default_range_miles").get<double>();
    if (j.contains("allowed_ranges_miles"))
      p.allowed_ranges_miles =
          j.at("allowed_ranges_miles").get<std::vector<double>>();
    if (!(p.default_range_miles > 0.0))
      throw std::invalid_argument("default_range_miles must be positive");
    for (double r : p.allowed_ranges_miles)
      if (!(r > 0.0))
        throw std::invalid_argument("allowed_ranges_miles must be positive");
    return p;
  }
};
