#include "core/ScoreReport.hpp"
#include "core/GeoMath.hpp"

ScoreReport resolveScore(const SidewalkCatalog &catalog,
                         const std::string &source, double latitude,
                         double longitude, std::optional<double> rangeMiles) {
  const SidewalkIndex index = catalog.index(source);

  ScoreReport report;
  report.source = source;
  report.query = Coordinate{latitude, longitude};

  const NearestResult nearest = index.resolveNearest(latitude, longitude);
  report.nearest = nearest.sidewalk;
  report.planar_distance = nearest.distance;
  report.distance_m = GeoMath::haversine(
      report.query,
      GeoMath::closestPointOnSegment(report.query, nearest.sidewalk));

  if (rangeMiles) {
    report.range_miles = rangeMiles;
    report.in_range = index.findSegmentsInRange(latitude, longitude, *rangeMiles);
  }
  return report;
}

Json report_json(const ScoreReport &report) {
  Json out = scores_json(report.nearest.scores);
  out["latitude"] = report.query.lat;
  out["longitude"] = report.query.lon;
  out["source"] = report.source;
  out["distance_m"] = report.distance_m;
  out["sidewalk"] = {{"start", report.nearest.start},
                     {"end", report.nearest.end}};
  if (report.range_miles) {
    out["range"] = *report.range_miles;
    out["sidewalks_in_range"] = to_feature_collection(report.in_range);
  }
  return out;
}
