#pragma once
#include "core/SidewalkCatalog.hpp"
#include "models/SidewalkModel.hpp"
#include <optional>
#include <string>
#include <vector>

// Everything the score endpoints answer for one query point.
struct ScoreReport {
  std::string source;
  Coordinate query;
  Sidewalk nearest;
  double planar_distance = 0.0; // degrees
  double distance_m = 0.0;      // to the closest point of `nearest`
  std::optional<double> range_miles;
  std::vector<Sidewalk> in_range; // only filled when range_miles is set
};

// Nearest sidewalk of `source`, plus the sidewalks in range when a range is
// given. Propagates every engine error unchanged.
ScoreReport resolveScore(const SidewalkCatalog &catalog,
                         const std::string &source, double latitude,
                         double longitude,
                         std::optional<double> rangeMiles = std::nullopt);

// Flat score fields at top level, as the public API has always returned
// them, followed by the query point and metadata.
Json report_json(const ScoreReport &report);
