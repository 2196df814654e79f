#include "core/GeoMath.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace {
constexpr double kMetersPerMile = 1609.344;
// Empirical km per degree of latitude / of longitude at the equator.
constexpr double kKmPerDegLat = 110.574235;
constexpr double kKmPerDegLng = 110.572833;
constexpr double kEarthRadiusM = 6371000.0;
} // namespace

bool GeoMath::isWellFormed(const Coordinate &c) {
  return std::isfinite(c.lat) && std::isfinite(c.lon) && c.lat >= -90.0 &&
         c.lat <= 90.0 && c.lon >= -180.0 && c.lon <= 180.0;
}

void GeoMath::validateQueryPoint(double latitude, double longitude) {
  if (!std::isfinite(latitude) || latitude < -90.0 || latitude > 90.0)
    throw InvalidGeometry("latitude must be between -90 and 90, got " +
                          std::to_string(latitude));
  if (!std::isfinite(longitude) || longitude < -180.0 || longitude > 180.0)
    throw InvalidGeometry("longitude must be between -180 and 180, got " +
                          std::to_string(longitude));
}

BoundingBox GeoMath::deriveBoundingBox(double latitude, double longitude,
                                       double rangeMiles) {
  validateQueryPoint(latitude, longitude);
  if (!std::isfinite(rangeMiles) || rangeMiles <= 0.0)
    throw InvalidGeometry("range must be a positive number of miles, got " +
                          std::to_string(rangeMiles));

  // Keep the operation order fixed: callers pin exact outputs.
  const double meters = rangeMiles * kMetersPerMile;
  const double latRadian = latitude * M_PI / 180;
  const double degLngKm = kKmPerDegLng * std::cos(latRadian);
  const double deltaLat = meters / 1000.0 / kKmPerDegLat;
  const double deltaLng = meters / 1000.0 / degLngKm;

  // Near the poles cos() -> 0 and the box would wrap the whole globe.
  if (!std::isfinite(deltaLng) || deltaLng > 180.0)
    throw InvalidGeometry("latitude " + std::to_string(latitude) +
                          " is too close to a pole for a " +
                          std::to_string(rangeMiles) + " mile box");

  BoundingBox box{latitude + deltaLat, latitude - deltaLat,
                  longitude - deltaLng, longitude + deltaLng};
  if (!(box.bottomLat < box.topLat && box.leftLng < box.rightLng))
    throw InvalidGeometry("range " + std::to_string(rangeMiles) +
                          " is too small to resolve at this coordinate");
  return box;
}

double GeoMath::projectOntoSegment(double px, double py, double ax, double ay,
                                   double bx, double by) {
  const double dx = bx - ax;
  const double dy = by - ay;
  const double len2 = dx * dx + dy * dy;
  if (!(len2 > 0.0))
    return 0.0;
  const double t = ((px - ax) * dx + (py - ay) * dy) / len2;
  return std::clamp(t, 0.0, 1.0);
}

double GeoMath::distanceToSegment(double px, double py, double ax, double ay,
                                  double bx, double by) {
  const double t = projectOntoSegment(px, py, ax, ay, bx, by);
  const double ex = px - (ax + t * (bx - ax));
  const double ey = py - (ay + t * (by - ay));
  return std::sqrt(ex * ex + ey * ey);
}

double GeoMath::distanceToSegment(const Coordinate &p, const Sidewalk &s) {
  return distanceToSegment(p.lat, p.lon, s.start.lat, s.start.lon, s.end.lat,
                           s.end.lon);
}

Coordinate GeoMath::closestPointOnSegment(const Coordinate &p,
                                          const Sidewalk &s) {
  const double t = projectOntoSegment(p.lat, p.lon, s.start.lat, s.start.lon,
                                      s.end.lat, s.end.lon);
  return Coordinate{s.start.lat + t * (s.end.lat - s.start.lat),
                    s.start.lon + t * (s.end.lon - s.start.lon)};
}

double GeoMath::endpointManhattan(const Coordinate &p, const Sidewalk &s) {
  const double toStart =
      std::fabs(s.start.lat - p.lat) + std::fabs(s.start.lon - p.lon);
  const double toEnd = std::fabs(s.end.lat - p.lat) + std::fabs(s.end.lon - p.lon);
  return std::min(toStart, toEnd);
}

double GeoMath::haversine(const Coordinate &a, const Coordinate &b) {
  const double phi1 = a.lat * (M_PI / 180);
  const double phi2 = b.lat * (M_PI / 180);
  const double delta_phi = (b.lat - a.lat) * (M_PI / 180);
  const double delta_lambda = (b.lon - a.lon) * (M_PI / 180);
  const double h = std::pow(std::sin(delta_phi / 2), 2) +
                   std::cos(phi1) * std::cos(phi2) *
                       std::pow(std::sin(delta_lambda / 2), 2);
  return 2 * kEarthRadiusM * std::asin(std::sqrt(h));
}

// Liang-Barsky clip of the segment against the box, x = lon, y = lat.
bool GeoMath::segmentTouchesBox(const Sidewalk &s, const BoundingBox &box) {
  const double dx = s.end.lon - s.start.lon;
  const double dy = s.end.lat - s.start.lat;
  const double p[4] = {-dx, dx, -dy, dy};
  const double q[4] = {s.start.lon - box.leftLng, box.rightLng - s.start.lon,
                       s.start.lat - box.bottomLat, box.topLat - s.start.lat};
  double t0 = 0.0, t1 = 1.0;
  for (int i = 0; i < 4; ++i) {
    if (p[i] == 0.0) {
      if (q[i] < 0.0)
        return false; // parallel to and outside this edge
      continue;
    }
    const double r = q[i] / p[i];
    if (p[i] < 0.0) {
      if (r > t1)
        return false;
      t0 = std::max(t0, r);
    } else {
      if (r < t0)
        return false;
      t1 = std::min(t1, r);
    }
  }
  return t0 <= t1;
}
