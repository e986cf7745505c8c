#include "internal/curation/record_importer.hpp"

#include <cmath>

#include "internal/chem/formula.hpp"
#include "internal/model/geometry_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"
#include "internal/util/uuid.hpp"

namespace mc3d::curation {

using google::protobuf::Value;
using mc3d::observability::IntField;
using mc3d::observability::StringField;

namespace {

// Versions and ids are sometimes numbers in raw dumps.
std::string ScalarToString(const Value& value, const std::string& what) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kNumberValue: {
      const double v = value.number_value();
      if (std::floor(v) != v) throw util::FormatError(what + " must be a string or an integer");
      return std::to_string(static_cast<long long>(v));
    }
    default:
      throw util::FormatError(what + " must be a string or an integer");
  }
}

int ToInt(const Value& value, const std::string& what) {
  if (value.kind_case() != Value::kNumberValue || std::floor(value.number_value()) != value.number_value()) {
    throw util::FormatError(what + " must be an integer");
  }
  return static_cast<int>(value.number_value());
}

} // namespace

db::StructureRecord RecordFromJson(const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    throw util::FormatError("record must be an object");
  }
  const auto& fields = value.struct_value().fields();

  auto source_it = fields.find("source");
  if (source_it == fields.end() || source_it->second.kind_case() != Value::kStructValue) {
    throw util::FormatError("record has no source object");
  }

  model::SourceFields source;
  for (const auto& [key, field] : source_it->second.struct_value().fields()) {
    if (field.kind_case() == Value::kNullValue) continue;
    source[key] = ScalarToString(field, "source." + key);
  }

  db::StructureRecord record;
  record.source   = model::FromFields(source);
  record.geometry = model::GeometryFromJson(value, model::Format(record.source));

  if (record.geometry.sites.empty()) {
    throw util::FormatError(model::Format(record.source) + ": no sites");
  }

  const auto counts      = chem::CountElements(record.geometry);
  record.formula         = chem::HillCompactFormula(counts);
  record.chemical_system = chem::ChemicalSystem(counts);

  if (auto it = fields.find("cif_spacegroup_numbers"); it != fields.end() && it->second.kind_case() != Value::kNullValue) {
    if (it->second.kind_case() != Value::kListValue) {
      throw util::FormatError("cif_spacegroup_numbers must be a list");
    }
    for (const auto& number : it->second.list_value().values()) {
      record.cif_spacegroup_numbers.push_back(ToInt(number, "cif_spacegroup_numbers"));
    }
  }

  if (auto it = fields.find("exit_status"); it != fields.end() && it->second.kind_case() != Value::kNullValue) {
    record.exit_status = ToInt(it->second, "exit_status");
  }

  return record;
}

ImportOutcome ImportRecords(db::StructureRepository& repository, const std::filesystem::path& path,
                            const std::string& group) {
  const auto document = util::ReadJsonFile(path);
  if (document.kind_case() != Value::kListValue) {
    throw util::FormatError(path.string() + ": expected a JSON array of records");
  }

  ImportOutcome            outcome;
  std::vector<db::StructureRecord> records;

  const auto& values = document.list_value().values();
  for (int i = 0; i < values.size(); ++i) {
    try {
      auto record = RecordFromJson(values.Get(i));
      record.uuid = util::NewUuidString();
      records.push_back(std::move(record));
    } catch (const util::FormatError& e) {
      outcome.errors.push_back({static_cast<size_t>(i), e.what()});
    } catch (const util::UnknownDatabaseError& e) {
      outcome.errors.push_back({static_cast<size_t>(i), e.what()});
    }
  }

  for (const auto& error : outcome.errors) {
    MC3D_LOG_WARN("Skipping record", {IntField("index", static_cast<int64_t>(error.index)), StringField("error", error.message)});
  }

  auto tx = repository.Begin();
  if (!repository.GroupExists(*tx, group)) {
    db::ThrowIfError(repository.CreateGroup(*tx, group), "create group " + group);
    MC3D_LOG_INFO("Created group", {StringField("group", group)});
  }

  std::vector<std::string> uuids;
  uuids.reserve(records.size());
  for (const auto& record : records) {
    db::ThrowIfError(repository.InsertStructure(*tx, record), "insert " + model::Format(record.source));
    uuids.push_back(record.uuid);
  }
  db::ThrowIfError(repository.AddToGroup(*tx, group, uuids), "add to group " + group);
  tx->Commit();

  outcome.imported = records.size();
  MC3D_LOG_INFO("Imported records", {StringField("path", path.string()), StringField("group", group),
                                     IntField("imported", static_cast<int64_t>(outcome.imported)),
                                     IntField("skipped", static_cast<int64_t>(outcome.errors.size()))});
  return outcome;
}

} // namespace mc3d::curation
