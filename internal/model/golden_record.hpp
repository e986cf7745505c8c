#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/model/candidate.hpp"
#include "internal/model/source_identity.hpp"

namespace mc3d::model {

struct GoldenStructure {
  SourceIdentity     source;
  std::string        reduced_formula;
  std::optional<int> spglib_space_group;
  std::string        uuid;
};

/*
  One curated family: the representative plus every member considered
  identical to it (representative included).
*/
struct GoldenFamilyRecord {
  Family          duplicate_family;
  GoldenStructure golden_structure;
};

// stable id (MC3D id, or the golden source string for new families) -> record
using GoldenRecordMap = std::map<std::string, GoldenFamilyRecord>;

GoldenRecordMap LoadGoldenRecords(const std::filesystem::path& path);
void            SaveGoldenRecords(const std::filesystem::path& path, const GoldenRecordMap& records);

GoldenRecordMap         GoldenRecordsFromJson(const google::protobuf::Value& value);
google::protobuf::Value GoldenRecordsToJson(const GoldenRecordMap& records);

} // namespace mc3d::model
