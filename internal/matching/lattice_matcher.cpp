#include "internal/matching/lattice_matcher.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/chem/formula.hpp"
#include "internal/matching/lattice_math.hpp"

namespace mc3d::matching {

namespace {

// Shortest distance between two sites over the 27 neighbouring images.
double MinImageDistance(const model::Lattice& lattice, const model::Vec3& from, const model::Vec3& to, bool same_site) {
  double best = std::numeric_limits<double>::infinity();
  for (int i = -1; i <= 1; ++i) {
    for (int j = -1; j <= 1; ++j) {
      for (int k = -1; k <= 1; ++k) {
        if (same_site && i == 0 && j == 0 && k == 0) continue;

        model::Vec3 delta{};
        for (int axis = 0; axis < 3; ++axis) delta[axis] = to[axis] - from[axis];
        delta[0] += i - std::round(delta[0]);
        delta[1] += j - std::round(delta[1]);
        delta[2] += k - std::round(delta[2]);

        best = std::min(best, Norm(ToCartesian(lattice, delta)));
      }
    }
  }
  return best;
}

} // namespace

LatticeMatcher::LatticeMatcher(MatcherSettings settings) : settings_(settings) {
}

LatticeMatcher::Fingerprint LatticeMatcher::Describe(const model::Geometry& geometry) const {
  ValidateGeometry(geometry);

  Fingerprint fingerprint;
  fingerprint.element_counts = chem::CountElements(geometry);

  const double volume_per_site = std::abs(Volume(geometry.lattice)) / static_cast<double>(geometry.sites.size());
  const double unit_length     = std::cbrt(volume_per_site);
  const double length_scale    = settings_.scale ? unit_length : 1.0;

  fingerprint.lengths = Lengths(geometry.lattice);
  for (auto& length : fingerprint.lengths) length /= length_scale;
  std::sort(fingerprint.lengths.begin(), fingerprint.lengths.end());

  fingerprint.angles = AnglesDegrees(geometry.lattice);
  for (auto& angle : fingerprint.angles) angle = std::min(angle, 180.0 - angle);
  std::sort(fingerprint.angles.begin(), fingerprint.angles.end());

  const auto& sites = geometry.sites;
  for (size_t i = 0; i < sites.size(); ++i) {
    double nearest = std::numeric_limits<double>::infinity();
    for (size_t j = 0; j < sites.size(); ++j) {
      nearest = std::min(nearest, MinImageDistance(geometry.lattice, sites[i].frac, sites[j].frac, i == j));
    }
    // site tolerance is always relative to the volume per site
    fingerprint.neighbour_distances[sites[i].element].push_back(nearest / unit_length);
  }
  for (auto& [_, distances] : fingerprint.neighbour_distances) {
    std::sort(distances.begin(), distances.end());
  }

  return fingerprint;
}

bool LatticeMatcher::CompositionsMatch(const Fingerprint& a, const Fingerprint& b) const {
  if (!settings_.attempt_supercell) {
    return a.element_counts == b.element_counts;
  }
  return chem::HillCompactFormula(a.element_counts) == chem::HillCompactFormula(b.element_counts);
}

bool LatticeMatcher::Fit(const model::Geometry& a, const model::Geometry& b) const {
  const auto fa = Describe(a);
  const auto fb = Describe(b);

  if (!CompositionsMatch(fa, fb)) return false;

  // supercells change the cell itself, only the local environment is comparable
  const bool compare_cells = !settings_.attempt_supercell || a.sites.size() == b.sites.size();
  if (compare_cells) {
    for (int i = 0; i < 3; ++i) {
      const double reference = std::min(fa.lengths[i], fb.lengths[i]);
      if (std::abs(fa.lengths[i] - fb.lengths[i]) > settings_.ltol * reference) return false;
      if (std::abs(fa.angles[i] - fb.angles[i]) > settings_.angle_tol) return false;
    }
  }

  for (const auto& [element, distances_a] : fa.neighbour_distances) {
    const auto& distances_b = fb.neighbour_distances.at(element);
    if (distances_a.size() != distances_b.size()) {
      // proportional compositions: compare the distinct environments only
      if (std::abs(distances_a.front() - distances_b.front()) > settings_.stol) return false;
      if (std::abs(distances_a.back() - distances_b.back()) > settings_.stol) return false;
      continue;
    }
    for (size_t i = 0; i < distances_a.size(); ++i) {
      if (std::abs(distances_a[i] - distances_b[i]) > settings_.stol) return false;
    }
  }

  return true;
}

} // namespace mc3d::matching
