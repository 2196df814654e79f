#include "core/GeoMath.hpp"
#include "core/InMemorySidewalkStore.hpp"
#include "http/http_handler.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <utility>

namespace
{

Sidewalk make_sidewalk(double slat, double slon, double elat, double elon, ScoreSet scores)
{
  Sidewalk s;
  s.start = Coordinate{slat, slon};
  s.end = Coordinate{elat, elon};
  s.scores = std::move(scores);
  return s;
}

httplib::Request make_request(
  std::initializer_list<std::pair<std::string, std::string>> params)
{
  httplib::Request req;
  for (const auto & [key, value] : params) {
    req.params.emplace(key, value);
  }
  return req;
}

class HttpHandlerTest : public ::testing::Test
{
protected:
  HttpHandlerTest()
  : walkspan_(
      {make_sidewalk(
        40.7316, -73.9360, 40.7316, -73.9340,
        {{"natural_beauty_score", 1}, {"safety_score", 3}})},
      "walkspan"),
    empty_({}, "empty"),
    handler_(catalog_)
  {
    catalog_.add("walkspan", walkspan_);
    catalog_.add("empty", empty_);
    catalog_.setDefaultSource("walkspan");
  }

  httplib::Response get(
    const std::string & action, std::initializer_list<std::pair<std::string, std::string>> params)
  {
    httplib::Response res;
    handler_.callGetHandler(action, make_request(params), res);
    return res;
  }

  static Json first_error(const httplib::Response & res)
  {
    const Json body = Json::parse(res.body);
    return body.at("errors").at(0);
  }

  InMemorySidewalkStore walkspan_;
  InMemorySidewalkStore empty_;
  SidewalkCatalog catalog_;
  HttpHandler handler_;
};

}  // namespace

// ============================== Validation ======================================== //

TEST_F(HttpHandlerTest, MissingLatitude)
{
  const auto res = get("score/gps", {{"longitude", "-73.9352"}});
  EXPECT_EQ(res.status, 400);
  const Json err = first_error(res);
  EXPECT_EQ(err["param"], "latitude");
  EXPECT_EQ(err["location"], "query");
  EXPECT_EQ(err["msg"], "Must be between -90 and 90");
}

TEST_F(HttpHandlerTest, RejectsNonNumericAndOutOfRange)
{
  auto res = get("score/gps", {{"latitude", "40.7abc"}, {"longitude", "-73.9352"}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(first_error(res)["param"], "latitude");

  res = get("score/gps", {{"latitude", "40.7306"}, {"longitude", "-181"}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(first_error(res)["param"], "longitude");
}

TEST_F(HttpHandlerTest, RangeMustBeAllowed)
{
  const auto res =
    get("score/range", {{"latitude", "40.7306"}, {"longitude", "-73.9352"}, {"range", "0.3"}});
  EXPECT_EQ(res.status, 400);
  const Json err = first_error(res);
  EXPECT_EQ(err["param"], "range");
  EXPECT_EQ(err["msg"], "Must be one of 0.25, 0.5, 1 miles");
}

TEST_F(HttpHandlerTest, UnknownSource)
{
  const auto res =
    get("score/gps", {{"latitude", "40.7306"}, {"longitude", "-73.9352"}, {"source", "queens"}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(first_error(res)["param"], "source");
}

TEST_F(HttpHandlerTest, IncludeRangeMustBeBoolean)
{
  const auto res = get(
    "score/gps", {{"latitude", "40.7306"}, {"longitude", "-73.9352"}, {"include_range", "yes"}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(first_error(res)["param"], "include_range");
}

// ============================== Responses ======================================== //

TEST_F(HttpHandlerTest, ScoreGpsReturnsFlatScores)
{
  const auto res = get("score/gps", {{"latitude", "40.7306"}, {"longitude", "-73.9352"}});
  const Json body = Json::parse(res.body);
  EXPECT_FALSE(body.contains("errors"));
  EXPECT_EQ(body["natural_beauty_score"], 1);
  EXPECT_EQ(body["safety_score"], 3);
  EXPECT_EQ(body["source"], "walkspan");
  EXPECT_FALSE(body.contains("sidewalks_in_range"));
  EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(HttpHandlerTest, ScoreGpsIncludesRangeOnRequest)
{
  const auto res = get(
    "score/gps", {{"latitude", "40.7306"},
                  {"longitude", "-73.9352"},
                  {"range", "0.25"},
                  {"include_range", "true"}});
  const Json body = Json::parse(res.body);
  EXPECT_DOUBLE_EQ(body["range"].get<double>(), 0.25);
  EXPECT_EQ(body["sidewalks_in_range"]["features"].size(), 1u);
}

TEST_F(HttpHandlerTest, ScoreRangeReturnsFeatureCollection)
{
  const auto res = get("score/range", {{"latitude", "40.7306"}, {"longitude", "-73.9352"}});
  const Json body = Json::parse(res.body);
  EXPECT_EQ(body["type"], "FeatureCollection");
  EXPECT_EQ(body["source"], "walkspan");
  EXPECT_DOUBLE_EQ(body["range"].get<double>(), 0.35);
  EXPECT_EQ(body["containment"], "any_endpoint");
  EXPECT_EQ(body["features"].size(), 1u);
}

TEST_F(HttpHandlerTest, ScoreRangeEchoesTheQueryBox)
{
  const auto res =
    get("score/range", {{"latitude", "40.7306"}, {"longitude", "-73.9352"}, {"range", "1"}});
  const Json body = Json::parse(res.body);
  const auto box = GeoMath::deriveBoundingBox(40.7306, -73.9352, 1.0);
  EXPECT_DOUBLE_EQ(body["box"]["topLat"].get<double>(), box.topLat);
  EXPECT_DOUBLE_EQ(body["box"]["bottomLat"].get<double>(), box.bottomLat);
  EXPECT_DOUBLE_EQ(body["box"]["leftLng"].get<double>(), box.leftLng);
  EXPECT_DOUBLE_EQ(body["box"]["rightLng"].get<double>(), box.rightLng);
}

TEST_F(HttpHandlerTest, EmptySourceIsNotFound)
{
  const auto res =
    get("score/gps", {{"latitude", "40.7306"}, {"longitude", "-73.9352"}, {"source", "empty"}});
  EXPECT_EQ(res.status, 404);
  EXPECT_TRUE(Json::parse(res.body).contains("error"));
}

TEST_F(HttpHandlerTest, PolarQueryIsBadRequest)
{
  const auto res = get("score/range", {{"latitude", "90"}, {"longitude", "0"}, {"range", "1"}});
  EXPECT_EQ(res.status, 400);
}

TEST_F(HttpHandlerTest, ListsSources)
{
  const auto res = get("sources", {});
  const Json body = Json::parse(res.body);
  EXPECT_EQ(body["sources"], Json::array({"empty", "walkspan"}));
  EXPECT_EQ(body["default"], "walkspan");
  EXPECT_EQ(body["candidate_count"], 8);
}

TEST_F(HttpHandlerTest, UnknownAction)
{
  const auto res = get("score/polygon", {});
  EXPECT_EQ(res.status, 404);
}

TEST_F(HttpHandlerTest, PingWithoutDatabasesIsOk)
{
  const auto res = get("dbping", {});
  EXPECT_EQ(Json::parse(res.body)["ok"], true);
}
