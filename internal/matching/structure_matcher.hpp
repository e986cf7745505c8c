#pragma once

#include <cstddef>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/geometry.hpp"

namespace mc3d::matching {

/*
  Tolerances handed to the structure matcher.

  Defaults follow the usual StructureMatcher settings with primitive_cell
  switched off: structures reaching the matcher are primitive already.
*/
struct MatcherSettings {
  double ltol      = 0.2;  // fractional length tolerance
  double stol      = 0.3;  // site tolerance, in units of (V/N)^(1/3)
  double angle_tol = 5.0;  // degrees

  bool primitive_cell    = false;
  bool scale             = true;
  bool attempt_supercell = false;

  static MatcherSettings FromConfig(const mc3d::runtime::config::MatcherConfig& config);

  // ltol, stol and angle_tol multiplied by factor.
  MatcherSettings Scaled(double factor) const;
};

/*
  Geometric similarity oracle.

  Implementations must be pure and safe to call from several worker threads
  at once. Malformed geometry is reported with util::OracleFailure.
*/
class StructureMatcher {
 public:
  virtual ~StructureMatcher() = default;

  virtual bool Fit(const model::Geometry& a, const model::Geometry& b) const = 0;

  /*
    Bulk grouping. Returns groups of indices into `structures`; every index
    appears in exactly one group.

    Default: the first ungrouped structure becomes the reference and collects
    every remaining structure that fits it; repeat until none are left.
  */
  virtual std::vector<std::vector<size_t>> Group(const std::vector<const model::Geometry*>& structures) const;
};

} // namespace mc3d::matching
