#include "internal/matching/structure_matcher.hpp"

#include <list>

namespace mc3d::matching {

MatcherSettings MatcherSettings::FromConfig(const mc3d::runtime::config::MatcherConfig& config) {
  MatcherSettings settings;
  if (config.ltol() > 0.0) settings.ltol = config.ltol();
  if (config.stol() > 0.0) settings.stol = config.stol();
  if (config.angle_tol() > 0.0) settings.angle_tol = config.angle_tol();
  settings.primitive_cell    = config.primitive_cell();
  settings.scale             = config.has_scale() ? config.scale() : true;
  settings.attempt_supercell = config.attempt_supercell();
  return settings;
}

MatcherSettings MatcherSettings::Scaled(double factor) const {
  MatcherSettings scaled = *this;
  scaled.ltol *= factor;
  scaled.stol *= factor;
  scaled.angle_tol *= factor;
  return scaled;
}

std::vector<std::vector<size_t>> StructureMatcher::Group(const std::vector<const model::Geometry*>& structures) const {
  std::list<size_t> unmatched;
  for (size_t i = 0; i < structures.size(); ++i) unmatched.push_back(i);

  std::vector<std::vector<size_t>> groups;
  while (!unmatched.empty()) {
    const size_t reference = unmatched.front();
    unmatched.pop_front();

    std::vector<size_t> group{reference};
    for (auto it = unmatched.begin(); it != unmatched.end();) {
      if (Fit(*structures[reference], *structures[*it])) {
        group.push_back(*it);
        it = unmatched.erase(it);
      } else {
        ++it;
      }
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

} // namespace mc3d::matching
