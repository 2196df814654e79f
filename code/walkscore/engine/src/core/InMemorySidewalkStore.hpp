#pragma once
#include "core/SidewalkStore.hpp"
#include <filesystem>
#include <string>
#include <vector>

// Resident dataset. Immutable after construction, so concurrent readers need
// no locking.
class InMemorySidewalkStore final : public SidewalkStore {
public:
  explicit InMemorySidewalkStore(std::vector<Sidewalk> sidewalks,
                                 std::string label = "memory");

  // Load a JSON array of row objects keyed by the schema's column names,
  // i.e. the shape of a table dump. Throws std::runtime_error on I/O or
  // parse failures and on rows missing a column.
  static InMemorySidewalkStore fromFile(const std::filesystem::path &path,
                                        const SidewalkSchema &schema);
  static InMemorySidewalkStore fromJson(const Json &rows,
                                        const SidewalkSchema &schema,
                                        std::string label = "memory");

  std::string describe() const override;
  std::vector<Sidewalk> nearest_by_endpoint(const Coordinate &p,
                                            std::size_t k) const override;
  std::vector<Sidewalk>
  query_endpoints_in_bbox(const BoundingBox &box) const override;
  std::vector<Sidewalk>
  query_extent_overlapping(const BoundingBox &box) const override;

  std::size_t size() const noexcept { return sidewalks_.size(); }

private:
  std::vector<Sidewalk> sidewalks_;
  std::string label_;
};

// Build one sidewalk from a row object. Score columns that hold null are
// left out of the score set.
Sidewalk sidewalk_from_row(const Json &row, const SidewalkSchema &schema);
