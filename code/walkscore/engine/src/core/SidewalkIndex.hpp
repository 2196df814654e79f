#pragma once
#include "core/SidewalkStore.hpp"
#include "models/params.hpp"
#include <cstddef>
#include <vector>

struct NearestResult {
  Sidewalk sidewalk;
  double distance = 0.0;          // planar, in degrees
  std::size_t candidate_rank = 0; // position among the retrieved candidates
};

// Query engine over one store. The store is borrowed: whoever constructs the
// index keeps the store alive for as long as the index is used.
class SidewalkIndex {
public:
  explicit SidewalkIndex(const SidewalkStore &store,
                         QueryParams params = QueryParams{})
      : store_(store), params_(params) {}

  // Two-phase nearest lookup: the store's K endpoint-nearest candidates are
  // ranked by exact point-to-segment distance, first candidate wins ties.
  // Best effort: a long sidewalk whose endpoints are both far away can lose
  // to a shorter one with a close endpoint.
  // Throws SidewalkNotFound when the store yields no candidate and
  // MalformedSegment when every candidate has unusable coordinates.
  Sidewalk findNearestSegment(double latitude, double longitude) const;
  NearestResult resolveNearest(double latitude, double longitude) const;

  // Sidewalks in the flat-earth box of `rangeMiles` around the point, using
  // the configured containment mode. Unordered; empty is not an error.
  std::vector<Sidewalk> findSegmentsInRange(double latitude, double longitude,
                                            double rangeMiles) const;
  std::vector<Sidewalk> findSegmentsInRange(double latitude, double longitude,
                                            double rangeMiles,
                                            ContainmentMode mode) const;

  const QueryParams &params() const noexcept { return params_; }
  const SidewalkStore &store() const noexcept { return store_; }

private:
  const SidewalkStore &store_;
  QueryParams params_;
};
