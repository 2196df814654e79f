#pragma once
#include "core/SidewalkStore.hpp"
#include <mutex>
#include <mysql/mysql.h>
#include <string>
#include <vector>

// Sidewalk dataset living in a MySQL table. The session is switched to
// read-only on connect. One connection is shared by all queries; the MySQL
// client forbids concurrent use of a handle, so calls are serialised.
class MySQLSidewalkStore final : public SidewalkStore {
public:
  MySQLSidewalkStore(const std::string &uri, const std::string &user,
                     const std::string &pass, const std::string &database,
                     SidewalkSchema schema = SidewalkSchema{});
  ~MySQLSidewalkStore();

  MySQLSidewalkStore(const MySQLSidewalkStore &) = delete;
  MySQLSidewalkStore &operator=(const MySQLSidewalkStore &) = delete;

  std::string describe() const override;
  std::vector<Sidewalk> nearest_by_endpoint(const Coordinate &p,
                                            std::size_t k) const override;
  std::vector<Sidewalk>
  query_endpoints_in_bbox(const BoundingBox &box) const override;
  std::vector<Sidewalk>
  query_extent_overlapping(const BoundingBox &box) const override;

  // Round trip to the server; false if the connection is gone.
  bool ping() const;

private:
  // Runs a prepared SELECT and maps every row to a Sidewalk. `limit` >= 0 is
  // bound after the double parameters.
  std::vector<Sidewalk> run_select(const std::string &sql,
                                   const std::vector<double> &params,
                                   long long limit = -1) const;

  MYSQL *conn_ = nullptr;
  SidewalkSchema schema_;
  std::string endpoint_; // host:port/database, for logs
  std::string nearest_sql_;
  std::string endpoints_sql_;
  std::string extent_sql_;
  mutable std::mutex mu_;
};

// ------ connection settings ------

struct MySQLEndpoint {
  std::string host;
  unsigned int port = 3306;
};

// "tcp://host:port", "host:port" or "host". Throws std::invalid_argument on a
// port that is not a number in [1, 65535].
MySQLEndpoint parse_mysql_uri(const std::string &uri);

// Connection settings of one "mysql" source from settings.json. Environment
// variables win over the file: <SOURCE>_DB_HOST, _DB_PORT, _DB_USER, _DB_PASS
// and _DB_NAME for that source (name upper-cased, other characters -> '_'),
// and the unprefixed DB_* set for the default source only.
struct MySQLConnectionConfig {
  std::string uri;
  std::string user;
  std::string password;
  std::string database;

  static MySQLConnectionConfig from_json(const Json &src,
                                         const std::string &source,
                                         bool isDefaultSource);
};

// Environment prefix of a source: "walkspan" -> "WALKSPAN_".
std::string source_env_prefix(const std::string &source);

// ------ SQL ------

// Backtick-quote a table/column name from configuration. Throws
// std::invalid_argument unless it is a plain [A-Za-z0-9_]+ identifier.
std::string quote_identifier(const std::string &name);

// Statements run by MySQLSidewalkStore. Every one selects the four
// coordinate columns followed by the score columns.
// Parameters: lat, lon, lat, lon, LIMIT. Rows with a NULL coordinate sort
// last; equal keys are ordered by the coordinate columns.
std::string nearest_by_endpoint_sql(const SidewalkSchema &schema);
// Parameters: bottom, top, left, right for the start, then for the end.
std::string endpoints_in_bbox_sql(const SidewalkSchema &schema);
// Parameters: top, bottom, right, left.
std::string extent_overlapping_sql(const SidewalkSchema &schema);
