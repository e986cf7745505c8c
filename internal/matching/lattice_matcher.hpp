#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

#include "internal/matching/structure_matcher.hpp"

namespace mc3d::matching {

/*
  Built-in fingerprint matcher.

  Two structures fit when
    - they carry the same species counts (proportional counts with
      attempt_supercell),
    - their sorted lattice lengths agree within ltol (after normalising to the
      same volume per site when scale is set),
    - their sorted lattice angles agree within angle_tol, folding θ and
      180° - θ together,
    - the per-species sorted nearest-neighbour distances agree within stol,
      measured in units of (V/N)^(1/3).

  Cells are compared as given; inputs are expected to be reduced primitive
  cells. This is a conservative stand-in for a full structure matcher.
*/
class LatticeMatcher final : public StructureMatcher {
 public:
  explicit LatticeMatcher(MatcherSettings settings = {});

  bool Fit(const model::Geometry& a, const model::Geometry& b) const override;

  const MatcherSettings& Settings() const {
    return settings_;
  }

 private:
  struct Fingerprint {
    std::map<std::string, long>                element_counts;
    std::array<double, 3>                      lengths{};
    std::array<double, 3>                      angles{};
    std::map<std::string, std::vector<double>> neighbour_distances;
  };

  Fingerprint Describe(const model::Geometry& geometry) const;

  bool CompositionsMatch(const Fingerprint& a, const Fingerprint& b) const;

  MatcherSettings settings_;
};

} // namespace mc3d::matching
