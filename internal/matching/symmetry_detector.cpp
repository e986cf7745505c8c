#include "internal/matching/symmetry_detector.hpp"

#include <array>
#include <cmath>

#include "internal/matching/lattice_math.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::matching {

namespace {

using IntMatrix = std::array<std::array<int, 3>, 3>;

int Determinant(const IntMatrix& m) {
  return m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1]) - m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0]) +
         m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
}

bool PreservesMetric(const IntMatrix& m, const Matrix3& g, const std::array<double, 3>& lengths, double symprec) {
  for (int i = 0; i < 3; ++i) {
    for (int j = i; j < 3; ++j) {
      double transformed = 0.0;
      for (int k = 0; k < 3; ++k) {
        if (m[i][k] == 0) continue;
        for (int l = 0; l < 3; ++l) {
          if (m[j][l] == 0) continue;
          transformed += m[i][k] * m[j][l] * g[k][l];
        }
      }
      if (std::abs(transformed - g[i][j]) > symprec * (lengths[i] + lengths[j])) return false;
    }
  }
  return true;
}

} // namespace

int LatticeSymmetryDetector::CountLatticeOperations(const model::Lattice& lattice, double symprec) {
  const auto g       = Metric(lattice);
  const auto lengths = Lengths(lattice);

  int       count = 0;
  IntMatrix m{};
  // 3^9 candidate matrices, entries -1/0/1
  for (int code = 0; code < 19683; ++code) {
    int rest = code;
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 3; ++j) {
        m[i][j] = rest % 3 - 1;
        rest /= 3;
      }
    }
    const int det = Determinant(m);
    if (det != 1 && det != -1) continue;
    if (PreservesMetric(m, g, lengths, symprec)) ++count;
  }
  return count;
}

int LatticeSymmetryDetector::SpaceGroupNumber(const model::Geometry& geometry, double symprec) const {
  ValidateGeometry(geometry);
  if (!(symprec > 0.0)) {
    throw util::OracleFailure("symprec must be positive");
  }

  const int operations = CountLatticeOperations(geometry.lattice, symprec);
  if (operations >= 48) return 221;
  if (operations >= 24) return 191;
  if (operations >= 16) return 123;
  if (operations >= 12) return 166;
  if (operations >= 8) return 47;
  if (operations >= 4) return 10;
  return 2;
}

} // namespace mc3d::matching
