#include "internal/model/golden_record.hpp"

#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace mc3d::model {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value* Field(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end()) return nullptr;
  return &it->second;
}

const Struct& RequireStruct(const Value* value, const std::string& what) {
  if (!value || value->kind_case() != Value::kStructValue) {
    throw util::FormatError(what + ": expected a JSON object");
  }
  return value->struct_value();
}

SourceFields ToSourceFields(const Struct& source) {
  SourceFields fields;
  for (const auto& [key, value] : source.fields()) {
    if (value.kind_case() == Value::kStringValue) {
      fields[key] = value.string_value();
    } else if (value.kind_case() == Value::kNumberValue) {
      // numeric ids are written without a fractional part
      fields[key] = std::to_string(static_cast<long long>(std::llround(value.number_value())));
    }
  }
  return fields;
}

GoldenFamilyRecord RecordFromJson(const std::string& stable_id, const Value& value) {
  const auto& object = RequireStruct(&value, "golden record '" + stable_id + "'");

  GoldenFamilyRecord record;
  const auto*        family = Field(object, "duplicate_family");
  if (!family) {
    throw util::FormatError("golden record '" + stable_id + "' has no duplicate_family");
  }
  record.duplicate_family = util::ToStringList(*family, "golden record '" + stable_id + "' duplicate_family");

  const auto& golden = RequireStruct(Field(object, "golden_structure"), "golden record '" + stable_id + "' golden_structure");
  record.golden_structure.source =
      FromFields(ToSourceFields(RequireStruct(Field(golden, "source"), "golden record '" + stable_id + "' source")));

  if (const auto* formula = Field(golden, "reduced_formula"); formula && formula->kind_case() == Value::kStringValue) {
    record.golden_structure.reduced_formula = formula->string_value();
  }
  if (const auto* spg = Field(golden, "spglib_space_group"); spg && spg->kind_case() == Value::kNumberValue) {
    record.golden_structure.spglib_space_group = static_cast<int>(spg->number_value());
  }
  if (const auto* uuid = Field(golden, "uuid"); uuid && uuid->kind_case() == Value::kStringValue) {
    record.golden_structure.uuid = uuid->string_value();
  }
  return record;
}

Value RecordToJson(const GoldenFamilyRecord& record) {
  Value value;
  auto* object = value.mutable_struct_value()->mutable_fields();

  (*object)["duplicate_family"] = util::StringListValue(record.duplicate_family);

  Value golden;
  auto* golden_fields = golden.mutable_struct_value()->mutable_fields();

  Value source;
  auto* source_fields         = source.mutable_struct_value()->mutable_fields();
  (*source_fields)["database"] = util::StringValue(record.golden_structure.source.database);
  (*source_fields)["version"]  = util::StringValue(record.golden_structure.source.version);
  (*source_fields)["id"]       = util::StringValue(record.golden_structure.source.id);
  (*golden_fields)["source"]   = std::move(source);

  (*golden_fields)["reduced_formula"] = util::StringValue(record.golden_structure.reduced_formula);
  if (record.golden_structure.spglib_space_group) {
    (*golden_fields)["spglib_space_group"].set_number_value(*record.golden_structure.spglib_space_group);
  } else {
    (*golden_fields)["spglib_space_group"].set_null_value(google::protobuf::NULL_VALUE);
  }
  (*golden_fields)["uuid"] = util::StringValue(record.golden_structure.uuid);

  (*object)["golden_structure"] = std::move(golden);
  return value;
}

} // namespace

GoldenRecordMap GoldenRecordsFromJson(const Value& value) {
  const auto&     object = RequireStruct(&value, "golden records");
  GoldenRecordMap records;
  for (const auto& [stable_id, record] : object.fields()) {
    records.emplace(stable_id, RecordFromJson(stable_id, record));
  }
  return records;
}

Value GoldenRecordsToJson(const GoldenRecordMap& records) {
  Value value;
  auto* object = value.mutable_struct_value()->mutable_fields();
  for (const auto& [stable_id, record] : records) {
    (*object)[stable_id] = RecordToJson(record);
  }
  return value;
}

GoldenRecordMap LoadGoldenRecords(const std::filesystem::path& path) {
  return GoldenRecordsFromJson(util::ReadJsonFile(path));
}

void SaveGoldenRecords(const std::filesystem::path& path, const GoldenRecordMap& records) {
  util::WriteJsonFileAtomic(path, GoldenRecordsToJson(records), 4);
}

} // namespace mc3d::model
