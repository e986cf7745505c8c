#include "internal/matching/lattice_math.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

#include "internal/util/errors.hpp"

namespace mc3d::matching {

namespace {

constexpr double kMinVolume = 1e-6;

double AngleBetween(const model::Vec3& a, const model::Vec3& b) {
  const double cosine = Dot(a, b) / (Norm(a) * Norm(b));
  return std::acos(std::clamp(cosine, -1.0, 1.0)) * 180.0 / std::numbers::pi;
}

bool Finite(const model::Vec3& v) {
  return std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
}

} // namespace

double Dot(const model::Vec3& a, const model::Vec3& b) {
  return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

double Norm(const model::Vec3& a) {
  return std::sqrt(Dot(a, a));
}

double Volume(const model::Lattice& l) {
  const auto& a = l[0];
  const auto& b = l[1];
  const auto& c = l[2];
  return a[0] * (b[1] * c[2] - b[2] * c[1]) - a[1] * (b[0] * c[2] - b[2] * c[0]) + a[2] * (b[0] * c[1] - b[1] * c[0]);
}

std::array<double, 3> Lengths(const model::Lattice& lattice) {
  return {Norm(lattice[0]), Norm(lattice[1]), Norm(lattice[2])};
}

std::array<double, 3> AnglesDegrees(const model::Lattice& lattice) {
  return {AngleBetween(lattice[1], lattice[2]), AngleBetween(lattice[0], lattice[2]), AngleBetween(lattice[0], lattice[1])};
}

Matrix3 Metric(const model::Lattice& lattice) {
  Matrix3 g{};
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      g[i][j] = Dot(lattice[i], lattice[j]);
    }
  }
  return g;
}

model::Vec3 ToCartesian(const model::Lattice& lattice, const model::Vec3& frac) {
  model::Vec3 out{};
  for (int axis = 0; axis < 3; ++axis) {
    out[axis] = frac[0] * lattice[0][axis] + frac[1] * lattice[1][axis] + frac[2] * lattice[2][axis];
  }
  return out;
}

void ValidateGeometry(const model::Geometry& geometry) {
  for (const auto& row : geometry.lattice) {
    if (!Finite(row)) {
      throw util::OracleFailure("lattice contains non-finite values");
    }
  }
  if (std::abs(Volume(geometry.lattice)) < kMinVolume) {
    throw util::OracleFailure("degenerate lattice (volume " + std::to_string(Volume(geometry.lattice)) + ")");
  }
  if (geometry.sites.empty()) {
    throw util::OracleFailure("structure has no sites");
  }
  for (const auto& site : geometry.sites) {
    if (!Finite(site.frac) || site.element.empty()) {
      throw util::OracleFailure("malformed site");
    }
  }
}

} // namespace mc3d::matching
