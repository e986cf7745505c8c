#include "internal/uniq/uniqueness_engine.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::uniq {

using mc3d::observability::BoolField;
using mc3d::observability::DoubleField;
using mc3d::observability::IntField;
using mc3d::observability::StringField;

namespace {

int64_t AsInt(size_t n) {
  return static_cast<int64_t>(n);
}

} // namespace

UniquenessOptions UniquenessOptions::FromConfig(const mc3d::runtime::config::UniqConfig& config) {
  UniquenessOptions options;
  if (!config.method().empty()) options.method = ParseMethod(config.method());
  if (config.has_sort_by_spacegroup()) options.sort_by_spacegroup = config.sort_by_spacegroup();
  if (config.parallelize() > 0) options.parallelize = config.parallelize();
  options.chunk_size      = config.chunk_size();
  options.checkpoint_path = config.checkpoint_path();
  options.output_path     = config.output_path();
  if (config.symprec() > 0) options.symprec = config.symprec();
  return options;
}

UniquenessEngine::UniquenessEngine(UniquenessOptions options, const matching::StructureMatcher& matcher,
                                   const matching::SymmetryDetector& detector)
    : options_(std::move(options)), matcher_(matcher), detector_(detector) {
  if (options_.parallelize == 0) {
    throw std::invalid_argument("parallelize must be at least 1");
  }
}

UniquenessResult UniquenessEngine::Run(const std::vector<model::CandidateStructure>& structures) {
  if (options_.sort_by_spacegroup) {
    // Buckets whose keys differ only by an estimated space group are never
    // compared against each other.
    MC3D_LOG_WARN("Sorting by space group: duplicates with differing detected space groups are not compared",
                  {DoubleField("symprec", options_.symprec)});
  }

  auto bucketed = BucketStructures(structures, options_.sort_by_spacegroup, detector_, options_.symprec);

  auto result                     = RunBuckets(bucketed.buckets);
  result.errors                   = std::move(bucketed.errors);
  result.stats.bucketing_errors   = result.errors.size();
  result.stats.skipped_with_issue = bucketed.skipped_with_issue;
  return result;
}

UniquenessResult UniquenessEngine::RunBuckets(const std::map<std::string, Bucket>& buckets) {
  UniquenessResult result;
  auto&            stats = result.stats;
  stats.buckets_total    = buckets.size();

  // ------------------------------------------------------------
  // Init
  // ------------------------------------------------------------

  ClusteringCheckpoint checkpoint;
  if (!options_.checkpoint_path.empty()) {
    checkpoint = ClusteringCheckpoint::LoadOrEmpty(options_.checkpoint_path);
    if (checkpoint.Size() > 0) {
      MC3D_LOG_INFO("Loaded checkpoint", {StringField("path", options_.checkpoint_path.string()),
                                          IntField("buckets", AsInt(checkpoint.Size()))});
    }
  }

  std::vector<std::string> pending;
  for (const auto& [key, bucket] : buckets) {
    if (checkpoint.Contains(key)) {
      ++stats.buckets_checkpoint;
      continue;
    }

    if (bucket.size() <= 1) {
      model::Partition partition;
      if (!bucket.empty()) partition.push_back({model::Format(bucket.front().identity)});
      checkpoint.Put(key, std::move(partition));
      ++stats.buckets_trivial;
      continue;
    }

    pending.push_back(key);
  }

  // ------------------------------------------------------------
  // Chunks
  // ------------------------------------------------------------

  const auto order      = ProcessingOrder(buckets, pending);
  const size_t per_chunk = options_.chunk_size > 0 ? options_.chunk_size : std::max<size_t>(order.size(), 1);

  std::vector<std::vector<std::string>> chunks;
  for (size_t begin = 0; begin < order.size(); begin += per_chunk) {
    const size_t end = std::min(order.size(), begin + per_chunk);
    chunks.emplace_back(order.begin() + begin, order.begin() + end);
  }
  stats.chunks = chunks.size();

  MC3D_LOG_INFO("Starting uniqueness run", {StringField("method", std::string(ToString(options_.method))),
                                            BoolField("sort_by_spacegroup", options_.sort_by_spacegroup),
                                            IntField("buckets", AsInt(stats.buckets_total)),
                                            IntField("from_checkpoint", AsInt(stats.buckets_checkpoint)),
                                            IntField("trivial", AsInt(stats.buckets_trivial)),
                                            IntField("to_compute", AsInt(order.size())),
                                            IntField("chunks", AsInt(chunks.size())),
                                            IntField("workers", AsInt(options_.parallelize))});

  std::vector<std::string> failed_chunks;

  if (!chunks.empty()) {
    ProgressChannel progress;
    WorkerPool      pool(options_.parallelize);

    for (size_t i = 0; i < chunks.size(); ++i) {
      MC3D_LOG_INFO("Processing chunk", {IntField("chunk", AsInt(i + 1)), IntField("of", AsInt(chunks.size())),
                                         IntField("buckets", AsInt(chunks[i].size()))});

      ClusteringCheckpoint::Map chunk_result;
      try {
        chunk_result = RunChunk(pool, progress, buckets, chunks[i]);
      } catch (const util::OracleFailure& e) {
        // the chunk is redone on the next run; later chunks still proceed
        failed_chunks.emplace_back(e.what());
        continue;
      }

      stats.buckets_computed += chunk_result.size();
      checkpoint.Merge(chunk_result);
      if (!options_.checkpoint_path.empty()) {
        checkpoint.Save(options_.checkpoint_path);
        MC3D_LOG_DEBUG("Checkpoint written", {StringField("path", options_.checkpoint_path.string()),
                                              IntField("buckets", AsInt(checkpoint.Size()))});
      }
    }

    progress.Close();
    pool.Stop();
  }

  // trivial buckets are persisted even when no chunk completed
  if (stats.buckets_computed == 0 && stats.buckets_trivial > 0 && !options_.checkpoint_path.empty()) {
    checkpoint.Save(options_.checkpoint_path);
  }

  if (!failed_chunks.empty()) {
    std::string message = std::to_string(failed_chunks.size()) + " of " + std::to_string(chunks.size()) +
                          " chunks failed, rerun to retry them: ";
    for (size_t i = 0; i < failed_chunks.size(); ++i) {
      if (i > 0) message += "; ";
      message += failed_chunks[i];
    }
    MC3D_LOG_ERROR("Uniqueness run incomplete", {IntField("failed_chunks", AsInt(failed_chunks.size())),
                                                 IntField("computed", AsInt(stats.buckets_computed))});
    throw util::OracleFailure(message);
  }

  // ------------------------------------------------------------
  // Finalize
  // ------------------------------------------------------------

  result.families = checkpoint.Flatten();
  stats.families  = result.families.size();

  if (!options_.output_path.empty()) {
    SaveFamilies(options_.output_path, result.families);
  }

  MC3D_LOG_INFO("Uniqueness run finished", {IntField("families", AsInt(stats.families)),
                                            IntField("computed", AsInt(stats.buckets_computed)),
                                            StringField("output", options_.output_path.string())});
  return result;
}

std::vector<std::string> UniquenessEngine::ProcessingOrder(const std::map<std::string, Bucket>& buckets,
                                                           const std::vector<std::string>& pending) {
  std::vector<std::string> order = pending;
  std::stable_sort(order.begin(), order.end(), [&](const std::string& a, const std::string& b) {
    const auto size_a = buckets.at(a).size();
    const auto size_b = buckets.at(b).size();
    if (size_a != size_b) return size_a > size_b;
    return a < b;
  });
  return order;
}

ClusteringCheckpoint::Map UniquenessEngine::RunChunk(WorkerPool& pool, ProgressChannel& progress,
                                                     const std::map<std::string, Bucket>& buckets,
                                                     const std::vector<std::string>& chunk) {
  std::vector<std::pair<std::string, std::future<model::Partition>>> futures;
  futures.reserve(chunk.size());

  for (const auto& key : chunk) {
    const Bucket* bucket = &buckets.at(key);
    auto          method = options_.method;
    auto*         matcher = &matcher_;

    futures.emplace_back(key, pool.Submit([key, bucket, method, matcher, &progress] {
                           progress.Send(key);
                           try {
                             return Cluster(method, *bucket, *matcher);
                           } catch (const std::exception& e) {
                             throw util::OracleFailure("bucket '" + key + "': " + e.what());
                           }
                         }));
  }

  size_t started = 0;
  auto   drain   = [&] {
    for (const auto& key : progress.Drain()) {
      ++started;
      MC3D_LOG_DEBUG("Clustering bucket", {StringField("bucket", key), IntField("started", AsInt(started)),
                                           IntField("of", AsInt(chunk.size()))});
    }
  };

  // Every future is waited for, so no worker still reads the chunk when it fails.
  ClusteringCheckpoint::Map results;
  std::exception_ptr        failure;
  std::string               failed_bucket;

  for (auto& [key, future] : futures) {
    while (future.wait_for(options_.poll_interval) != std::future_status::ready) {
      drain();
    }
    drain();

    try {
      results.emplace(key, future.get());
    } catch (const std::exception& e) {
      MC3D_LOG_ERROR("Bucket failed", {StringField("bucket", key), StringField("error", e.what())});
      if (!failure) {
        failure       = std::current_exception();
        failed_bucket = key;
      }
    }
  }

  if (failure) {
    MC3D_LOG_ERROR("Chunk failed, results discarded",
                   {StringField("bucket", failed_bucket), IntField("buckets", AsInt(chunk.size()))});
    std::rethrow_exception(failure);
  }

  return results;
}

} // namespace mc3d::uniq
