#include "internal/curation/source_compare.hpp"

#include <stdexcept>

#include "internal/curation/candidate_loader.hpp"
#include "internal/matching/lattice_matcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::curation {

namespace {

db::StructureRecord Fetch(db::SourceIndex& index, db::StructureRepository& repository, const std::string& source) {
  const auto uuid = index.Require(source);

  auto tx     = repository.Begin();
  auto record = repository.GetStructure(*tx, uuid);
  tx->Rollback();
  if (!record) {
    throw util::NotFound("structure " + uuid + " for " + source + " not found");
  }
  return *record;
}

int Spacegroup(const db::StructureRecord& record, const matching::SymmetryDetector& detector) {
  if (auto recorded = RecordedSpacegroup(record)) return *recorded;
  return detector.SpaceGroupNumber(record.geometry, matching::kDefaultSymprec);
}

} // namespace

bool CompareSources(db::SourceIndex& index, db::StructureRepository& repository,
                    const matching::SymmetryDetector& detector, const std::string& reference,
                    const std::string& target, double tol_factor) {
  if (!(tol_factor > 0)) {
    throw std::invalid_argument("tol_factor must be positive");
  }

  const auto ref = Fetch(index, repository, reference);
  const auto tgt = Fetch(index, repository, target);

  matching::LatticeMatcher matcher(matching::MatcherSettings{}.Scaled(tol_factor));

  const bool fit        = matcher.Fit(ref.geometry, tgt.geometry);
  const bool same_group = fit && Spacegroup(ref, detector) == Spacegroup(tgt, detector);

  MC3D_LOG_DEBUG("Compared sources", {observability::StringField("reference", reference),
                                      observability::StringField("target", target),
                                      observability::DoubleField("tol_factor", tol_factor),
                                      observability::BoolField("fit", fit),
                                      observability::BoolField("match", same_group)});
  return same_group;
}

} // namespace mc3d::curation
