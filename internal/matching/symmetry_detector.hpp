#pragma once

#include "internal/model/geometry.hpp"

namespace mc3d::matching {

// Tolerance used when a bucket key needs a space group that is not recorded.
inline constexpr double kDefaultSymprec = 0.005;

/*
  Space-group detection capability.

  Implementations must be safe to call concurrently and throw
  util::OracleFailure on malformed geometry.
*/
class SymmetryDetector {
 public:
  virtual ~SymmetryDetector() = default;

  virtual int SpaceGroupNumber(const model::Geometry& geometry, double symprec) const = 0;
};

/*
  Built-in detector working on the lattice alone.

  Enumerates the integer basis changes with entries in {-1, 0, 1} that keep
  the metric tensor within symprec, and reports the symmorphic space group of
  the resulting holohedry:

    2 ops  P-1     (2)      12 ops  R-3m    (166)
    4 ops  P2/m    (10)     16 ops  P4/mmm  (123)
    8 ops  Pmmm    (47)     24 ops  P6/mmm  (191)
                            48 ops  Pm-3m   (221)

  Equivalent structures always receive the same number, which is all the
  bucketing stage relies on; the number is coarser than a full space-group
  analysis.
*/
class LatticeSymmetryDetector final : public SymmetryDetector {
 public:
  int SpaceGroupNumber(const model::Geometry& geometry, double symprec) const override;

  // Number of metric-preserving lattice operations (exposed for tests).
  static int CountLatticeOperations(const model::Lattice& lattice, double symprec);
};

} // namespace mc3d::matching
