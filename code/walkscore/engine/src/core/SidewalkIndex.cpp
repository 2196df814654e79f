// SidewalkIndex resolves nearest / in-range queries against a SidewalkStore.

#include "core/SidewalkIndex.hpp"
#include "core/Errors.hpp"
#include "core/GeoMath.hpp"
#include <iostream>
#include <limits>
#include <string>

namespace {
void log_skipped(const char *query, const Sidewalk &s) {
  std::cerr << "[SidewalkIndex] " << query
            << ": skipping malformed sidewalk (" << s.start.lat << ","
            << s.start.lon << ") -> (" << s.end.lat << "," << s.end.lon
            << ")\n";
}
} // namespace

NearestResult SidewalkIndex::resolveNearest(double latitude,
                                            double longitude) const {
  GeoMath::validateQueryPoint(latitude, longitude);
  const Coordinate p{latitude, longitude};

  // 1) Cheap pre-filter on endpoint proximity
  auto candidates = store_.nearest_by_endpoint(p, params_.candidate_count);
  if (candidates.empty())
    throw SidewalkNotFound("no sidewalk candidates near (" +
                           std::to_string(latitude) + ", " +
                           std::to_string(longitude) + ") in " +
                           store_.describe());

  // 2) Exact distance; strict '<' keeps the first of equal candidates
  NearestResult best;
  best.distance = std::numeric_limits<double>::infinity();
  bool found = false;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto &c = candidates[i];
    if (!GeoMath::isWellFormed(c)) {
      log_skipped("nearest", c);
      continue;
    }
    const double d = GeoMath::distanceToSegment(p, c);
    if (!found || d < best.distance) {
      best.sidewalk = c;
      best.distance = d;
      best.candidate_rank = i;
      found = true;
    }
  }
  if (!found)
    throw MalformedSegment("all " + std::to_string(candidates.size()) +
                           " nearest candidates in " + store_.describe() +
                           " have malformed coordinates");
  return best;
}

Sidewalk SidewalkIndex::findNearestSegment(double latitude,
                                           double longitude) const {
  return resolveNearest(latitude, longitude).sidewalk;
}

std::vector<Sidewalk> SidewalkIndex::findSegmentsInRange(
    double latitude, double longitude, double rangeMiles) const {
  return findSegmentsInRange(latitude, longitude, rangeMiles,
                             params_.containment);
}

std::vector<Sidewalk>
SidewalkIndex::findSegmentsInRange(double latitude, double longitude,
                                   double rangeMiles,
                                   ContainmentMode mode) const {
  const BoundingBox box =
      GeoMath::deriveBoundingBox(latitude, longitude, rangeMiles);

  const auto rows = (mode == ContainmentMode::Intersects)
                        ? store_.query_extent_overlapping(box)
                        : store_.query_endpoints_in_bbox(box);

  std::vector<Sidewalk> out;
  out.reserve(rows.size());
  for (const auto &s : rows) {
    if (!GeoMath::isWellFormed(s)) {
      log_skipped("range", s);
      continue;
    }
    switch (mode) {
    case ContainmentMode::AnyEndpoint:
      if (box.contains(s.start) || box.contains(s.end))
        out.push_back(s);
      break;
    case ContainmentMode::BothEndpoints:
      if (box.contains(s.start) && box.contains(s.end))
        out.push_back(s);
      break;
    case ContainmentMode::Intersects:
      if (GeoMath::segmentTouchesBox(s, box))
        out.push_back(s);
      break;
    }
  }
  return out;
}
