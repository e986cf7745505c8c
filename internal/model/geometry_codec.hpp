#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/model/geometry.hpp"

namespace mc3d::model {

/*
  JSON form of a geometry, shared by the store and raw import records:

    {
      "lattice": [[ax, ay, az], [bx, by, bz], [cx, cy, cz]],
      "sites":   [{"element": "Fe", "frac": [0, 0, 0], "occupancy": 1.0}, ...]
    }

  "occupancy" is optional on input and defaults to 1.
*/
google::protobuf::Value GeometryToJson(const Geometry& geometry);

// Throws util::FormatError naming `what` on malformed input.
Geometry GeometryFromJson(const google::protobuf::Value& value, const std::string& what);

} // namespace mc3d::model
