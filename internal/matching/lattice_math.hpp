#pragma once

#include <array>

#include "internal/model/geometry.hpp"

namespace mc3d::matching {

using Matrix3 = std::array<std::array<double, 3>, 3>;

double Dot(const model::Vec3& a, const model::Vec3& b);
double Norm(const model::Vec3& a);

// Signed volume a · (b × c).
double Volume(const model::Lattice& lattice);

// a, b, c
std::array<double, 3> Lengths(const model::Lattice& lattice);

// alpha (b^c), beta (a^c), gamma (a^b) in degrees
std::array<double, 3> AnglesDegrees(const model::Lattice& lattice);

// G_ij = a_i · a_j
Matrix3 Metric(const model::Lattice& lattice);

model::Vec3 ToCartesian(const model::Lattice& lattice, const model::Vec3& frac);

// Throws util::OracleFailure on non-finite values, empty site lists or a degenerate cell.
void ValidateGeometry(const model::Geometry& geometry);

} // namespace mc3d::matching
