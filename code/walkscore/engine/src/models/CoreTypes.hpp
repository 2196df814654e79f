#pragma once

#include <nlohmann/json.hpp>

using Json = nlohmann::json;

// Basic spatial coordinate in decimal degrees.
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
};

// Axis-aligned lat/lon box approximating a circular range around a point.
// All four edges are inclusive.
struct BoundingBox {
  double topLat = 0.0;
  double bottomLat = 0.0;
  double leftLng = 0.0;
  double rightLng = 0.0;

  bool contains(const Coordinate &c) const {
    return bottomLat <= c.lat && c.lat <= topLat && leftLng <= c.lon &&
           c.lon <= rightLng;
  }
};

inline void to_json(Json &j, const Coordinate &c) {
  j = Json{{"lat", c.lat}, {"lon", c.lon}};
}

inline void to_json(Json &j, const BoundingBox &b) {
  j = Json{{"topLat", b.topLat},
           {"bottomLat", b.bottomLat},
           {"leftLng", b.leftLng},
           {"rightLng", b.rightLng}};
}
