#pragma once
#include <stdexcept>
#include <string>

// Failures surfaced by the query engine. All of them mean "no usable
// result"; none is ever replaced by a default value.

// The store produced no candidate for a nearest query.
class SidewalkNotFound : public std::runtime_error {
public:
  explicit SidewalkNotFound(const std::string &what)
      : std::runtime_error(what) {}
};

// Query inputs the flat-earth box cannot represent (out-of-range degrees,
// non-positive range, latitude too close to a pole).
class InvalidGeometry : public std::runtime_error {
public:
  explicit InvalidGeometry(const std::string &what)
      : std::runtime_error(what) {}
};

// A stored sidewalk has non-finite or out-of-range coordinates.
class MalformedSegment : public std::runtime_error {
public:
  explicit MalformedSegment(const std::string &what)
      : std::runtime_error(what) {}
};

// The caller selected a dataset that was never registered.
class UnknownSource : public std::runtime_error {
public:
  explicit UnknownSource(const std::string &what)
      : std::runtime_error(what) {}
};
