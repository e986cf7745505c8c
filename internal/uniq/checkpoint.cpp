#include "internal/uniq/checkpoint.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace mc3d::uniq {

using google::protobuf::Value;

Value PartitionToJson(const model::Partition& partition) {
  Value value;
  auto* list = value.mutable_list_value();
  for (const auto& family : partition) {
    *list->add_values() = util::StringListValue(family);
  }
  return value;
}

model::Partition PartitionFromJson(const Value& value, const std::string& what) {
  if (value.kind_case() != Value::kListValue) {
    throw util::FormatError(what + ": expected a list of families");
  }

  model::Partition partition;
  partition.reserve(value.list_value().values_size());
  for (const auto& family : value.list_value().values()) {
    auto members = util::ToStringList(family, what);
    if (members.empty()) {
      throw util::FormatError(what + ": empty family");
    }
    partition.push_back(std::move(members));
  }
  return partition;
}

ClusteringCheckpoint ClusteringCheckpoint::FromJson(const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    throw util::FormatError("checkpoint: expected a JSON object");
  }

  Map buckets;
  for (const auto& [key, partition] : value.struct_value().fields()) {
    buckets.emplace(key, PartitionFromJson(partition, "checkpoint bucket '" + key + "'"));
  }
  return ClusteringCheckpoint(std::move(buckets));
}

ClusteringCheckpoint ClusteringCheckpoint::LoadOrEmpty(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return {};
  }
  return FromJson(util::ReadJsonFile(path));
}

Value ClusteringCheckpoint::ToJson() const {
  Value value;
  auto* fields = value.mutable_struct_value()->mutable_fields();
  for (const auto& [key, partition] : buckets_) {
    (*fields)[key] = PartitionToJson(partition);
  }
  return value;
}

void ClusteringCheckpoint::Save(const std::filesystem::path& path) const {
  util::WriteJsonFileAtomic(path, ToJson());
}

void ClusteringCheckpoint::Merge(const Map& results) {
  for (const auto& [key, partition] : results) {
    buckets_[key] = partition;
  }
}

void ClusteringCheckpoint::Put(const std::string& bucket_key, model::Partition partition) {
  buckets_[bucket_key] = std::move(partition);
}

model::Partition ClusteringCheckpoint::Flatten() const {
  model::Partition families;
  for (const auto& [_, partition] : buckets_) {
    families.insert(families.end(), partition.begin(), partition.end());
  }
  return families;
}

void SaveFamilies(const std::filesystem::path& path, const model::Partition& families) {
  util::WriteJsonFileAtomic(path, PartitionToJson(families), 4);
}

model::Partition LoadFamilies(const std::filesystem::path& path) {
  return PartitionFromJson(util::ReadJsonFile(path), path.string());
}

} // namespace mc3d::uniq
