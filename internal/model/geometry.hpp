#pragma once

#include <array>
#include <string>
#include <vector>

namespace mc3d::model {

using Vec3 = std::array<double, 3>;

// Rows are the lattice vectors a, b, c in Cartesian Å.
using Lattice = std::array<Vec3, 3>;

struct Site {
  std::string element;
  Vec3        frac{};

  // < 1.0 on any site marks a partially occupied structure
  double occupancy = 1.0;
};

/*
  Crystal geometry as handed to the structure matcher and the symmetry
  detector. The clustering engine itself treats it as opaque.
*/
struct Geometry {
  Lattice           lattice{};
  std::vector<Site> sites;
};

} // namespace mc3d::model
