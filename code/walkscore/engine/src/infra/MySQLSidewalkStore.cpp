// MySQLSidewalkStore answers the sidewalk store queries with prepared
// statements against a read-only session.

#include "MySQLSidewalkStore.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
// RAII wrapper so an exception between prepare and fetch never leaks the
// statement handle
struct StmtCloser {
  void operator()(MYSQL_STMT *stmt) const {
    if (stmt)
      mysql_stmt_close(stmt);
  }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtCloser>;

// One result column; NULL reads back as is_null = true.
struct ColumnSlot {
  double value = 0.0;
  bool is_null = false;
};
} // namespace

std::string quote_identifier(const std::string &name) {
  if (name.empty())
    throw std::invalid_argument("empty SQL identifier");
  for (unsigned char ch : name) {
    if (!std::isalnum(ch) && ch != '_')
      throw std::invalid_argument("invalid SQL identifier: " + name);
  }
  return "`" + name + "`";
}

// ===== settings =====

MySQLEndpoint parse_mysql_uri(const std::string &uri) {
  MySQLEndpoint ep;
  ep.host = uri;
  if (auto pos = uri.find("://"); pos != std::string::npos)
    ep.host = uri.substr(pos + 3);
  if (auto p = ep.host.find(':'); p != std::string::npos) {
    const std::string port = ep.host.substr(p + 1);
    ep.host = ep.host.substr(0, p);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos)
      throw std::invalid_argument("invalid MySQL port '" + port + "' in " +
                                  uri);
    const unsigned long n = std::stoul(port);
    if (n == 0 || n > 65535)
      throw std::invalid_argument("MySQL port out of range in " + uri);
    ep.port = static_cast<unsigned int>(n);
  }
  if (ep.host.empty())
    throw std::invalid_argument("missing MySQL host in " + uri);
  return ep;
}

std::string source_env_prefix(const std::string &source) {
  std::string prefix;
  for (unsigned char ch : source)
    prefix += std::isalnum(ch) ? static_cast<char>(std::toupper(ch)) : '_';
  return prefix + "_";
}

MySQLConnectionConfig
MySQLConnectionConfig::from_json(const Json &src, const std::string &source,
                                 bool isDefaultSource) {
  const std::string prefix = source_env_prefix(source);
  // <SOURCE>_DB_x, then DB_x (default source only), then the file
  auto setting = [&](const char *var, const std::string &fallback) {
    if (const char *v = std::getenv((prefix + var).c_str()))
      return std::string(v);
    if (isDefaultSource) {
      if (const char *v = std::getenv(var))
        return std::string(v);
    }
    return fallback;
  };

  MySQLConnectionConfig cfg;
  const std::string host = setting("DB_HOST", src.value("host", "127.0.0.1"));
  const std::string port =
      setting("DB_PORT", std::to_string(src.value("port", 3306)));
  cfg.uri = "tcp://" + host + ":" + port;
  cfg.user = setting("DB_USER", src.value("user", "walkscore_reader"));
  cfg.password = setting("DB_PASS", src.value("password", ""));
  cfg.database = setting("DB_NAME", src.value("database", "walkscore"));
  return cfg;
}

// ===== SQL =====

namespace {
std::string select_from(const SidewalkSchema &schema) {
  std::string sql = "SELECT " + quote_identifier(schema.start_lat) + ", " +
                    quote_identifier(schema.start_lon) + ", " +
                    quote_identifier(schema.end_lat) + ", " +
                    quote_identifier(schema.end_lon);
  for (const auto &col : schema.score_columns)
    sql += ", " + quote_identifier(col);
  return sql + " FROM " + quote_identifier(schema.table);
}
} // namespace

// LEAST is MySQL's scalar min. It is NULL when any coordinate is NULL and
// NULL sorts first under ASC, so rows with a NULL coordinate are pushed to
// the back explicitly.
std::string nearest_by_endpoint_sql(const SidewalkSchema &schema) {
  const std::string slat = quote_identifier(schema.start_lat);
  const std::string slon = quote_identifier(schema.start_lon);
  const std::string elat = quote_identifier(schema.end_lat);
  const std::string elon = quote_identifier(schema.end_lon);
  return select_from(schema) + " ORDER BY (" + slat + " IS NULL OR " + slon +
         " IS NULL OR " + elat + " IS NULL OR " + elon + " IS NULL), LEAST(ABS(" +
         slat + " - ?) + ABS(" + slon + " - ?), ABS(" + elat + " - ?) + ABS(" +
         elon + " - ?)) ASC, " + slat + ", " + slon + ", " + elat + ", " +
         elon + " LIMIT ?";
}

// Either endpoint inside the box, all bounds inclusive
std::string endpoints_in_bbox_sql(const SidewalkSchema &schema) {
  const std::string slat = quote_identifier(schema.start_lat);
  const std::string slon = quote_identifier(schema.start_lon);
  const std::string elat = quote_identifier(schema.end_lat);
  const std::string elon = quote_identifier(schema.end_lon);
  return select_from(schema) + " WHERE (? <= " + slat + " AND " + slat +
         " <= ? AND ? <= " + slon + " AND " + slon + " <= ?) OR (? <= " +
         elat + " AND " + elat + " <= ? AND ? <= " + elon + " AND " + elon +
         " <= ?)";
}

std::string extent_overlapping_sql(const SidewalkSchema &schema) {
  const std::string slat = quote_identifier(schema.start_lat);
  const std::string slon = quote_identifier(schema.start_lon);
  const std::string elat = quote_identifier(schema.end_lat);
  const std::string elon = quote_identifier(schema.end_lon);
  return select_from(schema) + " WHERE LEAST(" + slat + ", " + elat +
         ") <= ? AND GREATEST(" + slat + ", " + elat + ") >= ? AND LEAST(" +
         slon + ", " + elon + ") <= ? AND GREATEST(" + slon + ", " + elon +
         ") >= ?";
}

// ===== store =====

// Establish connection using URI and credentials
MySQLSidewalkStore::MySQLSidewalkStore(const std::string &uri,
                                       const std::string &user,
                                       const std::string &pass,
                                       const std::string &database,
                                       SidewalkSchema schema)
    : schema_(std::move(schema)) {
  // Validate identifiers and the URI before touching the network
  nearest_sql_ = nearest_by_endpoint_sql(schema_);
  endpoints_sql_ = endpoints_in_bbox_sql(schema_);
  extent_sql_ = extent_overlapping_sql(schema_);
  const MySQLEndpoint ep = parse_mysql_uri(uri);
  endpoint_ = ep.host + ":" + std::to_string(ep.port) + "/" + database + "." +
              schema_.table;

  conn_ = mysql_init(nullptr);
  if (!conn_)
    throw std::runtime_error("mysql_init failed");
  if (!mysql_real_connect(conn_, ep.host.c_str(), user.c_str(), pass.c_str(),
                          database.c_str(), ep.port, nullptr, 0)) {
    std::string err = mysql_error(conn_);
    mysql_close(conn_);
    throw std::runtime_error("connect failed: " + err);
  }
  if (mysql_query(conn_, "SET SESSION TRANSACTION READ ONLY")) {
    std::string err = mysql_error(conn_);
    mysql_close(conn_);
    throw std::runtime_error("cannot make session read-only: " + err);
  }
  std::cerr << "[MySQLSidewalkStore] connected to " << endpoint_ << "\n";
}

MySQLSidewalkStore::~MySQLSidewalkStore() { mysql_close(conn_); }

std::string MySQLSidewalkStore::describe() const {
  return "mysql://" + endpoint_;
}

bool MySQLSidewalkStore::ping() const {
  std::lock_guard<std::mutex> lock(mu_);
  return mysql_ping(conn_) == 0;
}

std::vector<Sidewalk>
MySQLSidewalkStore::run_select(const std::string &sql,
                               const std::vector<double> &params,
                               long long limit) const {
  std::lock_guard<std::mutex> lock(mu_);

  StmtPtr stmt(mysql_stmt_init(conn_));
  if (!stmt)
    throw std::runtime_error("mysql_stmt_init failed");
  if (mysql_stmt_prepare(stmt.get(), sql.c_str(),
                         static_cast<unsigned long>(sql.size())))
    throw std::runtime_error("prepare failed: " +
                             std::string(mysql_stmt_error(stmt.get())));

  // Bind parameters: doubles first, then the optional LIMIT
  std::vector<double> values(params);
  std::vector<MYSQL_BIND> pbind(values.size() + (limit >= 0 ? 1 : 0));
  memset(pbind.data(), 0, pbind.size() * sizeof(MYSQL_BIND));
  for (size_t i = 0; i < values.size(); ++i) {
    pbind[i].buffer_type = MYSQL_TYPE_DOUBLE;
    pbind[i].buffer = &values[i];
  }
  if (limit >= 0) {
    pbind.back().buffer_type = MYSQL_TYPE_LONGLONG;
    pbind.back().buffer = &limit;
  }
  if (!pbind.empty() && mysql_stmt_bind_param(stmt.get(), pbind.data()))
    throw std::runtime_error("bind params failed: " +
                             std::string(mysql_stmt_error(stmt.get())));

  if (mysql_stmt_execute(stmt.get()))
    throw std::runtime_error("execute failed: " +
                             std::string(mysql_stmt_error(stmt.get())));

  // Bind result columns: 4 coordinates, then the score columns in order
  const size_t ncols = 4 + schema_.score_columns.size();
  std::vector<ColumnSlot> slots(ncols);
  std::vector<MYSQL_BIND> rbind(ncols);
  memset(rbind.data(), 0, rbind.size() * sizeof(MYSQL_BIND));
  for (size_t i = 0; i < ncols; ++i) {
    rbind[i].buffer_type = MYSQL_TYPE_DOUBLE;
    rbind[i].buffer = &slots[i].value;
    rbind[i].is_null = &slots[i].is_null;
  }
  if (mysql_stmt_bind_result(stmt.get(), rbind.data()) ||
      mysql_stmt_store_result(stmt.get()))
    throw std::runtime_error("bind/store result failed: " +
                             std::string(mysql_stmt_error(stmt.get())));

  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto coord = [&](size_t i) { return slots[i].is_null ? nan : slots[i].value; };

  std::vector<Sidewalk> out;
  while (true) {
    int rc = mysql_stmt_fetch(stmt.get());
    if (rc == MYSQL_NO_DATA)
      break;
    if (rc == 1 || rc == MYSQL_DATA_TRUNCATED) {
      std::string e = mysql_stmt_error(stmt.get());
      mysql_stmt_free_result(stmt.get());
      throw std::runtime_error("fetch failed: " + e);
    }
    Sidewalk s;
    s.start = Coordinate{coord(0), coord(1)};
    s.end = Coordinate{coord(2), coord(3)};
    for (size_t c = 0; c < schema_.score_columns.size(); ++c) {
      if (!slots[4 + c].is_null)
        s.scores[schema_.score_columns[c]] = slots[4 + c].value;
    }
    out.push_back(std::move(s));
  }
  mysql_stmt_free_result(stmt.get());
  return out;
}

std::vector<Sidewalk>
MySQLSidewalkStore::nearest_by_endpoint(const Coordinate &p,
                                        std::size_t k) const {
  return run_select(nearest_sql_, {p.lat, p.lon, p.lat, p.lon},
                    static_cast<long long>(k));
}

std::vector<Sidewalk>
MySQLSidewalkStore::query_endpoints_in_bbox(const BoundingBox &box) const {
  return run_select(endpoints_sql_,
                    {box.bottomLat, box.topLat, box.leftLng, box.rightLng,
                     box.bottomLat, box.topLat, box.leftLng, box.rightLng});
}

std::vector<Sidewalk>
MySQLSidewalkStore::query_extent_overlapping(const BoundingBox &box) const {
  return run_select(extent_sql_,
                    {box.topLat, box.bottomLat, box.rightLng, box.leftLng});
}
