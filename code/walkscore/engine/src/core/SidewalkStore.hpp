#pragma once
#include "models/CoreTypes.hpp"
#include "models/SidewalkModel.hpp"
#include <cstddef>
#include <string>
#include <vector>

// Read-only query surface over one sidewalk dataset. Implementations never
// mutate the dataset; a single instance may be shared by concurrent queries
// as long as the implementation does whatever its backend needs for
// concurrent reads.
class SidewalkStore {
public:
  virtual ~SidewalkStore() = default;

  // Human readable identity for logs.
  virtual std::string describe() const = 0;

  // The `k` sidewalks with the smallest endpoint-Manhattan distance to `p`,
  // ascending. Fewer than `k` only when the dataset is smaller.
  virtual std::vector<Sidewalk> nearest_by_endpoint(const Coordinate &p,
                                                    std::size_t k) const = 0;

  // Sidewalks with at least one endpoint inside the box (inclusive).
  virtual std::vector<Sidewalk>
  query_endpoints_in_bbox(const BoundingBox &box) const = 0;

  // Sidewalks whose own lat/lon extent overlaps the box. A superset of
  // every sidewalk that touches the box; exact clipping is left to the
  // caller.
  virtual std::vector<Sidewalk>
  query_extent_overlapping(const BoundingBox &box) const = 0;
};
