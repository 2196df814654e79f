#pragma once
#include "core/SidewalkIndex.hpp"
#include "core/SidewalkStore.hpp"
#include "models/params.hpp"
#include <map>
#include <string>
#include <vector>

// Named datasets covering (possibly) the same geography. Scores from
// different datasets use different scales, so every query picks exactly one
// source by name; results are never merged across sources.
class SidewalkCatalog {
public:
  explicit SidewalkCatalog(QueryParams params = QueryParams{})
      : params_(params) {}

  // The store is borrowed and must outlive the catalog.
  void add(const std::string &name, const SidewalkStore &store);
  void setDefaultSource(const std::string &name);

  bool contains(const std::string &name) const {
    return stores_.count(name) != 0;
  }
  // Throws UnknownSource when no default was configured.
  const std::string &defaultSource() const;
  std::vector<std::string> sources() const;

  // Query engine bound to the named source; throws UnknownSource.
  SidewalkIndex index(const std::string &name) const;

  const QueryParams &params() const noexcept { return params_; }

private:
  std::map<std::string, const SidewalkStore *> stores_;
  std::string default_source_;
  QueryParams params_;
};
