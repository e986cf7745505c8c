#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/matching/structure_matcher.hpp"
#include "internal/matching/symmetry_detector.hpp"
#include "internal/uniq/bucketing.hpp"
#include "internal/uniq/checkpoint.hpp"
#include "internal/uniq/progress_channel.hpp"
#include "internal/uniq/strategy.hpp"
#include "internal/uniq/worker_pool.hpp"

namespace mc3d::uniq {

struct UniquenessOptions {
  Method method             = Method::kFirstReference;
  bool   sort_by_spacegroup = true;

  // worker threads
  size_t parallelize = 5;

  // buckets per chunk; 0 puts every bucket in a single chunk
  size_t chunk_size = 0;

  // empty disables checkpointing / output
  std::filesystem::path checkpoint_path;
  std::filesystem::path output_path;

  double symprec = matching::kDefaultSymprec;

  std::chrono::milliseconds poll_interval{100};

  static UniquenessOptions FromConfig(const mc3d::runtime::config::UniqConfig& config);
};

struct UniquenessStats {
  size_t buckets_total       = 0;
  size_t buckets_checkpoint  = 0;
  size_t buckets_trivial     = 0;
  size_t buckets_computed    = 0;
  size_t chunks              = 0;
  size_t families            = 0;
  size_t bucketing_errors    = 0;
  size_t skipped_with_issue  = 0;
};

struct UniquenessResult {
  model::Partition            families;
  UniquenessStats             stats;
  std::vector<BucketingError> errors;
};

/*
  Coordinator of a uniqueness run.

      checkpoint → trivial buckets → chunks (largest first)
                 → worker pool → merge → checkpoint → ... → flatten

  Workers only read their bucket and report the bucket they start on a
  bounded ProgressChannel. The checkpoint is written by the coordinator
  alone, after every fully successful chunk. A failing bucket fails its
  chunk once all in-flight buckets of the chunk are done; nothing of that
  chunk is persisted. The remaining chunks still run, then
  util::OracleFailure is raised naming the failed buckets.
*/
class UniquenessEngine {
 public:
  UniquenessEngine(UniquenessOptions options, const matching::StructureMatcher& matcher,
                   const matching::SymmetryDetector& detector);

  UniquenessResult Run(const std::vector<model::CandidateStructure>& structures);

  // Clusters pre-bucketed input.
  UniquenessResult RunBuckets(const std::map<std::string, Bucket>& buckets);

 private:
  // keys ordered by bucket size descending, then key
  static std::vector<std::string> ProcessingOrder(const std::map<std::string, Bucket>& buckets,
                                                  const std::vector<std::string>& pending);

  ClusteringCheckpoint::Map RunChunk(WorkerPool& pool, ProgressChannel& progress,
                                     const std::map<std::string, Bucket>& buckets,
                                     const std::vector<std::string>& chunk);

  UniquenessOptions                 options_;
  const matching::StructureMatcher& matcher_;
  const matching::SymmetryDetector& detector_;
};

} // namespace mc3d::uniq
