#include "internal/util/json_file.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/util/errors.hpp"

namespace mc3d::util {

namespace {

std::string LeafToJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw FormatError("failed to serialize JSON value: " + std::string(status.message()));
  }
  return json;
}

void Newline(std::ostringstream& out, int indent, int depth) {
  if (indent <= 0) return;
  out << '\n' << std::string(static_cast<size_t>(indent * depth), ' ');
}

// MessageToJsonString leaves Struct key order to the map; keys are sorted here so ledger
// and golden-record files stay stable between cycles.
void Render(std::ostringstream& out, const google::protobuf::Value& value, int indent, int depth) {
  const char* separator = indent > 0 ? ": " : ":";

  switch (value.kind_case()) {
    case google::protobuf::Value::kStructValue: {
      const auto& fields = value.struct_value().fields();
      if (fields.empty()) {
        out << "{}";
        return;
      }

      std::vector<std::string> keys;
      keys.reserve(fields.size());
      for (const auto& [key, _] : fields) keys.push_back(key);
      std::sort(keys.begin(), keys.end());

      out << '{';
      bool first = true;
      for (const auto& key : keys) {
        if (!first) out << ',';
        first = false;
        Newline(out, indent, depth + 1);
        out << LeafToJson(StringValue(key)) << separator;
        Render(out, fields.at(key), indent, depth + 1);
      }
      Newline(out, indent, depth);
      out << '}';
      return;
    }

    case google::protobuf::Value::kListValue: {
      const auto& values = value.list_value().values();
      if (values.empty()) {
        out << "[]";
        return;
      }

      out << '[';
      bool first = true;
      for (const auto& item : values) {
        if (!first) out << ',';
        first = false;
        Newline(out, indent, depth + 1);
        Render(out, item, indent, depth + 1);
      }
      Newline(out, indent, depth);
      out << ']';
      return;
    }

    case google::protobuf::Value::KIND_NOT_SET:
      out << "null";
      return;

    default:
      out << LeafToJson(value);
      return;
  }
}

} // namespace

google::protobuf::Value ParseJson(const std::string& json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw FormatError("invalid JSON: " + std::string(status.message()));
  }
  return value;
}

google::protobuf::Value ReadJsonFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw NotFound("cannot open " + path.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();

  try {
    return ParseJson(buffer.str());
  } catch (const FormatError& e) {
    throw FormatError(path.string() + ": " + e.what());
  }
}

std::string ToJson(const google::protobuf::Value& value, int indent) {
  std::ostringstream out;
  Render(out, value, indent, 0);
  return out.str();
}

void WriteJsonFileAtomic(const std::filesystem::path& path, const google::protobuf::Value& value, int indent) {
  const auto rendered = ToJson(value, indent);
  const auto tmp_path = std::filesystem::path(path.string() + ".tmp");

  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp_path.string() + " for writing");
    }
    out << rendered << '\n';
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw std::runtime_error("failed writing " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path);
}

google::protobuf::Value StringValue(const std::string& s) {
  google::protobuf::Value value;
  value.set_string_value(s);
  return value;
}

google::protobuf::Value StringListValue(const std::vector<std::string>& items) {
  google::protobuf::Value value;
  auto*                   list = value.mutable_list_value();
  for (const auto& item : items) {
    list->add_values()->set_string_value(item);
  }
  return value;
}

std::vector<std::string> ToStringList(const google::protobuf::Value& value, const std::string& what) {
  if (value.kind_case() != google::protobuf::Value::kListValue) {
    throw FormatError(what + ": expected a JSON array");
  }

  std::vector<std::string> out;
  out.reserve(value.list_value().values_size());
  for (const auto& item : value.list_value().values()) {
    if (item.kind_case() != google::protobuf::Value::kStringValue) {
      throw FormatError(what + ": expected an array of strings");
    }
    out.push_back(item.string_value());
  }
  return out;
}

} // namespace mc3d::util
