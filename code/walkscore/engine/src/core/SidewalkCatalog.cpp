#include "core/SidewalkCatalog.hpp"
#include "core/Errors.hpp"
#include <stdexcept>

void SidewalkCatalog::add(const std::string &name,
                          const SidewalkStore &store) {
  if (name.empty())
    throw std::invalid_argument("source name must not be empty");
  if (!stores_.emplace(name, &store).second)
    throw std::invalid_argument("source '" + name + "' registered twice");
}

void SidewalkCatalog::setDefaultSource(const std::string &name) {
  if (!contains(name))
    throw UnknownSource("default source '" + name + "' is not registered");
  default_source_ = name;
}

const std::string &SidewalkCatalog::defaultSource() const {
  if (default_source_.empty())
    throw UnknownSource("no default source configured");
  return default_source_;
}

std::vector<std::string> SidewalkCatalog::sources() const {
  std::vector<std::string> names;
  names.reserve(stores_.size());
  for (const auto &kv : stores_)
    names.push_back(kv.first);
  return names;
}

SidewalkIndex SidewalkCatalog::index(const std::string &name) const {
  auto it = stores_.find(name);
  if (it == stores_.end())
    throw UnknownSource("unknown source '" + name + "'");
  return SidewalkIndex(*it->second, params_);
}
