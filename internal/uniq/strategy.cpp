#include "internal/uniq/strategy.hpp"

#include <map>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace mc3d::uniq {

namespace {

// Union-find with path halving; the smaller index always becomes the root.
class DisjointSets {
 public:
  explicit DisjointSets(size_t n) : parent_(n) {
    std::iota(parent_.begin(), parent_.end(), size_t{0});
  }

  size_t Find(size_t x) {
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x          = parent_[x];
    }
    return x;
  }

  void Unite(size_t a, size_t b) {
    a = Find(a);
    b = Find(b);
    if (a == b) return;
    if (b < a) std::swap(a, b);
    parent_[b] = a;
  }

 private:
  std::vector<size_t> parent_;
};

// Empty and single-structure buckets never reach the matcher.
bool Trivial(const Bucket& bucket, model::Partition* out) {
  if (bucket.empty()) return true;
  if (bucket.size() == 1) {
    out->push_back({model::Format(bucket.front().identity)});
    return true;
  }
  return false;
}

const model::Geometry& GeometryOf(const model::CandidateStructure& structure) {
  if (!structure.geometry) {
    throw util::OracleFailure("structure " + model::Format(structure.identity) + " has no geometry");
  }
  return *structure.geometry;
}

} // namespace

Method ParseMethod(std::string_view name) {
  if (name == "first" || name == "first-reference") return Method::kFirstReference;
  if (name == "seb" || name == "graph") return Method::kGraph;
  if (name == "pymatgen" || name == "exhaustive-grouping") return Method::kExhaustiveGrouping;
  throw std::invalid_argument("unknown uniqueness method '" + std::string(name) + "'");
}

std::string_view ToString(Method method) {
  switch (method) {
    case Method::kFirstReference:
      return "first-reference";
    case Method::kGraph:
      return "graph";
    case Method::kExhaustiveGrouping:
      return "exhaustive-grouping";
  }
  return "unknown";
}

model::Partition ClusterFirstReference(const Bucket& bucket, const matching::StructureMatcher& matcher) {
  model::Partition families;
  if (Trivial(bucket, &families)) return families;

  // representative geometry for each family, same index as `families`
  std::vector<const model::Geometry*> references;

  for (const auto& structure : bucket) {
    const auto& geometry = GeometryOf(structure);

    bool matched = false;
    for (size_t i = 0; i < references.size(); ++i) {
      if (matcher.Fit(geometry, *references[i])) {
        families[i].push_back(model::Format(structure.identity));
        matched = true;
        break;
      }
    }

    if (!matched) {
      references.push_back(&geometry);
      families.push_back({model::Format(structure.identity)});
    }
  }
  return families;
}

model::Partition ClusterGraph(const Bucket& bucket, const matching::StructureMatcher& matcher) {
  model::Partition families;
  if (Trivial(bucket, &families)) return families;

  const size_t n = bucket.size();
  DisjointSets components(n);

  for (size_t i = 0; i < n; ++i) {
    for (size_t j = i + 1; j < n; ++j) {
      if (matcher.Fit(GeometryOf(bucket[i]), GeometryOf(bucket[j]))) {
        components.Unite(i, j);
      }
    }
  }

  // roots are the smallest member index, so families come out in order of first appearance
  std::map<size_t, size_t> root_to_family;
  for (size_t i = 0; i < n; ++i) {
    const size_t root = components.Find(i);
    auto [it, inserted] = root_to_family.try_emplace(root, families.size());
    if (inserted) families.emplace_back();
    families[it->second].push_back(model::Format(bucket[i].identity));
  }
  return families;
}

model::Partition ClusterExhaustiveGrouping(const Bucket& bucket, const matching::StructureMatcher& matcher) {
  model::Partition families;
  if (Trivial(bucket, &families)) return families;

  std::vector<const model::Geometry*> geometries;
  geometries.reserve(bucket.size());
  for (const auto& structure : bucket) geometries.push_back(&GeometryOf(structure));

  const auto groups = matcher.Group(geometries);

  std::vector<bool> seen(bucket.size(), false);
  for (const auto& group : groups) {
    model::Family family;
    for (size_t index : group) {
      if (index >= bucket.size() || seen[index]) {
        throw util::OracleFailure("structure grouping returned an invalid or repeated index");
      }
      seen[index] = true;
      family.push_back(model::Format(bucket[index].identity));
    }
    if (!family.empty()) families.push_back(std::move(family));
  }

  for (size_t i = 0; i < seen.size(); ++i) {
    if (!seen[i]) {
      throw util::OracleFailure("structure grouping dropped " + model::Format(bucket[i].identity));
    }
  }
  return families;
}

model::Partition Cluster(Method method, const Bucket& bucket, const matching::StructureMatcher& matcher) {
  switch (method) {
    case Method::kFirstReference:
      return ClusterFirstReference(bucket, matcher);
    case Method::kGraph:
      return ClusterGraph(bucket, matcher);
    case Method::kExhaustiveGrouping:
      return ClusterExhaustiveGrouping(bucket, matcher);
  }
  throw std::invalid_argument("unhandled uniqueness method");
}

} // namespace mc3d::uniq
