#pragma once
#include "models/CoreTypes.hpp"
#include "models/SidewalkModel.hpp"

// Pure coordinate geometry used by the query engine. Latitude/longitude are
// treated as planar coordinates for ranking; this only holds because every
// ranking runs over a small local neighbourhood.
class GeoMath {
public:
  // Flat-earth bounding box of `rangeMiles` around (latitude, longitude).
  // Throws InvalidGeometry for out-of-range input, a non-positive range, or a
  // latitude so close to a pole that the longitude span blows up.
  static BoundingBox deriveBoundingBox(double latitude, double longitude,
                                       double rangeMiles);

  // Minimum euclidean distance from P to segment AB, in the input units.
  // A zero-length segment collapses to the point-to-point distance.
  static double distanceToSegment(double px, double py, double ax, double ay,
                                  double bx, double by);
  static double distanceToSegment(const Coordinate &p, const Sidewalk &s);

  // Point of the sidewalk closest to `p` under the same planar metric.
  static Coordinate closestPointOnSegment(const Coordinate &p,
                                          const Sidewalk &s);

  // min(|dlat|+|dlon|) over the two endpoints; cheap pre-filter key only.
  static double endpointManhattan(const Coordinate &p, const Sidewalk &s);

  // Great-circle distance in metres.
  static double haversine(const Coordinate &a, const Coordinate &b);

  // True if any part of the segment lies inside the (inclusive) box.
  static bool segmentTouchesBox(const Sidewalk &s, const BoundingBox &box);

  static bool isWellFormed(const Coordinate &c);
  static bool isWellFormed(const Sidewalk &s) {
    return isWellFormed(s.start) && isWellFormed(s.end);
  }

  // Throws InvalidGeometry unless latitude is in [-90, 90] and longitude in
  // [-180, 180].
  static void validateQueryPoint(double latitude, double longitude);

private:
  // Clamped projection parameter of P onto AB; 0 for a zero-length AB.
  static double projectOntoSegment(double px, double py, double ax, double ay,
                                   double bx, double by);
};
