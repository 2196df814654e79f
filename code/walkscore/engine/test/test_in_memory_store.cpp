#include "core/InMemorySidewalkStore.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace
{

SidewalkSchema bronx_schema()
{
  return SidewalkSchema::from_json(Json{
    {"table", "Bronx_Walkability"},
    {"start_lat", "start_lat"},
    {"start_lon", "start_long"},
    {"end_lat", "end_lat"},
    {"end_lon", "end_long"},
    {"score_columns", Json::array({"beauty_n", "access"})}});
}

Json bronx_row(double slat, double slon, double elat, double elon, Json beauty, Json access)
{
  return Json{{"start_lat", slat}, {"start_long", slon}, {"end_lat", elat},
              {"end_long", elon},  {"beauty_n", beauty}, {"access", access}};
}

Sidewalk make_sidewalk(double slat, double slon, double elat, double elon, double id)
{
  Sidewalk s;
  s.start = Coordinate{slat, slon};
  s.end = Coordinate{elat, elon};
  s.scores["id"] = id;
  return s;
}

}  // namespace

TEST(InMemorySidewalkStore, LoadsRowsWithSchemaColumns)
{
  const Json rows = Json::array({
    bronx_row(40.8448, -73.8648, 40.8452, -73.8641, 2, 3),
    bronx_row(40.8452, -73.8641, 40.8457, -73.8633, 1, nullptr),
  });
  auto store = InMemorySidewalkStore::fromJson(rows, bronx_schema(), "bronx");
  ASSERT_EQ(store.size(), 2u);
  EXPECT_EQ(store.describe(), "bronx (2 sidewalks)");

  const auto all = store.nearest_by_endpoint(Coordinate{40.8448, -73.8648}, 10);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_DOUBLE_EQ(all[0].start.lat, 40.8448);
  EXPECT_DOUBLE_EQ(all[0].end.lon, -73.8641);
  EXPECT_EQ(all[0].scores, (ScoreSet{{"beauty_n", 2}, {"access", 3}}));
  // null score columns are left out
  EXPECT_EQ(all[1].scores, (ScoreSet{{"beauty_n", 1}}));
}

TEST(InMemorySidewalkStore, RejectsRowsMissingColumns)
{
  Json row = bronx_row(40.8, -73.8, 40.9, -73.9, 1, 1);
  row.erase("end_long");
  EXPECT_THROW(
    InMemorySidewalkStore::fromJson(Json::array({row}), bronx_schema()), std::runtime_error);
  EXPECT_THROW(InMemorySidewalkStore::fromJson(Json::object(), bronx_schema()), std::runtime_error);
}

TEST(InMemorySidewalkStore, LoadsFromFile)
{
  const auto path = std::filesystem::temp_directory_path() / "walkscore_store_test.json";
  {
    std::ofstream out(path);
    out << Json::array({bronx_row(40.0, -73.0, 40.1, -73.1, 4, 5)}).dump();
  }
  auto store = InMemorySidewalkStore::fromFile(path, bronx_schema());
  EXPECT_EQ(store.size(), 1u);
  std::filesystem::remove(path);
}

TEST(InMemorySidewalkStore, FileErrors)
{
  EXPECT_THROW(
    InMemorySidewalkStore::fromFile("/tmp/walkscore_does_not_exist.json", bronx_schema()),
    std::runtime_error);

  const auto path = std::filesystem::temp_directory_path() / "walkscore_store_broken.json";
  {
    std::ofstream out(path);
    out << "[{\"start_lat\": 40.0,";
  }
  EXPECT_THROW(InMemorySidewalkStore::fromFile(path, bronx_schema()), std::runtime_error);
  std::filesystem::remove(path);
}

TEST(InMemorySidewalkStore, NearestByEndpointIsAscending)
{
  InMemorySidewalkStore store({
    make_sidewalk(0.0, 3.0, 0.0, 4.0, 1),   // key 3
    make_sidewalk(5.0, 5.0, 0.0, 1.0, 2),   // key 1 (end)
    make_sidewalk(2.0, 0.0, 9.0, 9.0, 3),   // key 2
    make_sidewalk(0.5, 0.5, 7.0, 7.0, 4),   // key 1 (start), after #2
  });
  const auto got = store.nearest_by_endpoint(Coordinate{0.0, 0.0}, 3);
  ASSERT_EQ(got.size(), 3u);
  EXPECT_EQ(got[0].scores.at("id"), 2);
  EXPECT_EQ(got[1].scores.at("id"), 4);
  EXPECT_EQ(got[2].scores.at("id"), 3);
}

TEST(InMemorySidewalkStore, NearestByEndpointShortDataset)
{
  InMemorySidewalkStore store({make_sidewalk(0.0, 0.0, 0.0, 1.0, 1)});
  EXPECT_EQ(store.nearest_by_endpoint(Coordinate{0.0, 0.0}, 8).size(), 1u);
  EXPECT_TRUE(InMemorySidewalkStore({}).nearest_by_endpoint(Coordinate{0.0, 0.0}, 8).empty());
}

TEST(InMemorySidewalkStore, NonFiniteRowsSortLast)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  InMemorySidewalkStore store({
    make_sidewalk(nan, nan, nan, nan, 1),
    make_sidewalk(1.0, 1.0, 2.0, 2.0, 2),
  });
  const auto got = store.nearest_by_endpoint(Coordinate{0.0, 0.0}, 2);
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0].scores.at("id"), 2);
}

TEST(InMemorySidewalkStore, BoxQueries)
{
  const BoundingBox box{1.0, -1.0, -1.0, 1.0};
  InMemorySidewalkStore store({
    make_sidewalk(0.0, 0.0, 5.0, 5.0, 1),    // start inside
    make_sidewalk(1.0, -1.0, 3.0, 3.0, 2),   // start on the corner
    make_sidewalk(-5.0, 0.0, 5.0, 0.0, 3),   // crosses, no endpoint inside
    make_sidewalk(2.0, 2.0, 3.0, 3.0, 4),    // away
  });

  const auto endpoints = store.query_endpoints_in_bbox(box);
  ASSERT_EQ(endpoints.size(), 2u);
  EXPECT_EQ(endpoints[0].scores.at("id"), 1);
  EXPECT_EQ(endpoints[1].scores.at("id"), 2);

  const auto extent = store.query_extent_overlapping(box);
  ASSERT_EQ(extent.size(), 3u);
  EXPECT_EQ(extent[2].scores.at("id"), 3);
}
