#pragma once

#include <filesystem>
#include <map>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/model/candidate.hpp"

namespace mc3d::uniq {

/*
  Completed bucket partitions of a uniqueness run.

  On disk: JSON object, bucket key -> list of families, each family a list of
  source strings. Only the coordinator writes it, and only after a whole
  chunk succeeded; writes are atomic so the file is valid JSON at all times.
*/
class ClusteringCheckpoint {
 public:
  using Map = std::map<std::string, model::Partition>;

  ClusteringCheckpoint() = default;
  explicit ClusteringCheckpoint(Map buckets) : buckets_(std::move(buckets)) {
  }

  // Returns an empty checkpoint when the file does not exist.
  static ClusteringCheckpoint LoadOrEmpty(const std::filesystem::path& path);
  static ClusteringCheckpoint FromJson(const google::protobuf::Value& value);

  void Save(const std::filesystem::path& path) const;
  google::protobuf::Value ToJson() const;

  bool Contains(const std::string& bucket_key) const {
    return buckets_.contains(bucket_key);
  }

  // Adds or replaces the partitions of `results`.
  void Merge(const Map& results);
  void Put(const std::string& bucket_key, model::Partition partition);

  size_t Size() const {
    return buckets_.size();
  }

  const Map& Buckets() const {
    return buckets_;
  }

  // All families of all buckets.
  model::Partition Flatten() const;

 private:
  Map buckets_;
};

google::protobuf::Value PartitionToJson(const model::Partition& partition);
model::Partition        PartitionFromJson(const google::protobuf::Value& value, const std::string& what);

void             SaveFamilies(const std::filesystem::path& path, const model::Partition& families);
model::Partition LoadFamilies(const std::filesystem::path& path);

} // namespace mc3d::uniq
