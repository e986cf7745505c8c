#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace mc3d::config {

using mc3d::runtime::config::MatcherConfig;
using mc3d::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static YAML::Node LoadYamlFile(const std::string& path) {
  try {
    return YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
}

static void YamlToMessage(const YAML::Node& yaml, google::protobuf::Message* message) {
  // an empty document is an empty config
  if (yaml.IsNull() || !yaml.IsDefined()) {
    return;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(MatcherConfig* matcher) {
  // pymatgen StructureMatcher defaults, primitive_cell off: inputs are primitive already
  if (matcher->ltol() <= 0.0) matcher->set_ltol(0.2);
  if (matcher->stol() <= 0.0) matcher->set_stol(0.3);
  if (matcher->angle_tol() <= 0.0) matcher->set_angle_tol(5.0);
  if (!matcher->has_scale()) matcher->set_scale(true);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* uniq = config->mutable_uniq();
  if (uniq->method().empty()) uniq->set_method("first");
  if (!uniq->has_sort_by_spacegroup()) uniq->set_sort_by_spacegroup(true);
  if (uniq->parallelize() == 0) uniq->set_parallelize(5);
  if (uniq->checkpoint_path().empty()) uniq->set_checkpoint_path("checkpoint.json");
  if (uniq->output_path().empty()) uniq->set_output_path("result.json");
  if (uniq->symprec() <= 0.0) uniq->set_symprec(0.005);

  ApplyDefaults(config->mutable_matcher());

  auto* selection = config->mutable_selection();
  if (selection->database_priority().empty()) {
    selection->add_database_priority("cod");
    selection->add_database_priority("icsd");
    selection->add_database_priority("mpds");
  }
  if (selection->new_uniques_group().empty()) selection->set_new_uniques_group("global/uniques/new");
  if (selection->selected_path().empty()) selection->set_selected_path("selected-families.json");
  if (selection->new_data_path().empty()) selection->set_new_data_path("new-mc3d-data.json");

  if (!config->database().has_memory() && !config->database().has_sqlite()) {
    config->mutable_database()->mutable_sqlite()->set_path("mc3d-source.sqlite");
  }
}

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  RuntimeConfig config;
  YamlToMessage(LoadYamlFile(path), &config);
  ApplyDefaults(&config);
  return config;
}

RuntimeConfig ConfigLoader::Default() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

MatcherConfig ConfigLoader::LoadMatcherSettings(const std::string& path) {
  MatcherConfig matcher;
  YamlToMessage(LoadYamlFile(path), &matcher);
  ApplyDefaults(&matcher);
  return matcher;
}

} // namespace mc3d::config
