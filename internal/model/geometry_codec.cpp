#include "internal/model/geometry_codec.hpp"

#include "internal/util/errors.hpp"

namespace mc3d::model {

using google::protobuf::Value;

namespace {

Value NumberValue(double v) {
  Value value;
  value.set_number_value(v);
  return value;
}

Value Vec3ToJson(const Vec3& v) {
  Value value;
  auto* list = value.mutable_list_value();
  for (double x : v) *list->add_values() = NumberValue(x);
  return value;
}

Vec3 Vec3FromJson(const Value& value, const std::string& what) {
  if (value.kind_case() != Value::kListValue || value.list_value().values_size() != 3) {
    throw util::FormatError(what + ": expected a list of three numbers");
  }

  Vec3 v{};
  for (int i = 0; i < 3; ++i) {
    const auto& x = value.list_value().values(i);
    if (x.kind_case() != Value::kNumberValue) {
      throw util::FormatError(what + ": expected a number");
    }
    v[static_cast<size_t>(i)] = x.number_value();
  }
  return v;
}

const Value& Field(const Value& object, const std::string& key, const std::string& what) {
  const auto& fields = object.struct_value().fields();
  auto        it     = fields.find(key);
  if (it == fields.end()) {
    throw util::FormatError(what + ": missing '" + key + "'");
  }
  return it->second;
}

} // namespace

Value GeometryToJson(const Geometry& geometry) {
  Value value;
  auto* fields = value.mutable_struct_value()->mutable_fields();

  Value lattice;
  for (const auto& row : geometry.lattice) {
    *lattice.mutable_list_value()->add_values() = Vec3ToJson(row);
  }
  (*fields)["lattice"] = lattice;

  Value sites;
  sites.mutable_list_value();
  for (const auto& site : geometry.sites) {
    Value entry;
    auto* site_fields = entry.mutable_struct_value()->mutable_fields();
    (*site_fields)["element"].set_string_value(site.element);
    (*site_fields)["frac"]      = Vec3ToJson(site.frac);
    (*site_fields)["occupancy"] = NumberValue(site.occupancy);
    *sites.mutable_list_value()->add_values() = entry;
  }
  (*fields)["sites"] = sites;

  return value;
}

Geometry GeometryFromJson(const Value& value, const std::string& what) {
  if (value.kind_case() != Value::kStructValue) {
    throw util::FormatError(what + ": expected a geometry object");
  }

  Geometry geometry;

  const auto& lattice = Field(value, "lattice", what);
  if (lattice.kind_case() != Value::kListValue || lattice.list_value().values_size() != 3) {
    throw util::FormatError(what + ": lattice must have three vectors");
  }
  for (int i = 0; i < 3; ++i) {
    geometry.lattice[static_cast<size_t>(i)] = Vec3FromJson(lattice.list_value().values(i), what + ": lattice");
  }

  const auto& sites = Field(value, "sites", what);
  if (sites.kind_case() != Value::kListValue) {
    throw util::FormatError(what + ": sites must be a list");
  }
  for (const auto& entry : sites.list_value().values()) {
    if (entry.kind_case() != Value::kStructValue) {
      throw util::FormatError(what + ": site must be an object");
    }

    Site site;
    const auto& element = Field(entry, "element", what);
    if (element.kind_case() != Value::kStringValue || element.string_value().empty()) {
      throw util::FormatError(what + ": site element must be a non-empty string");
    }
    site.element = element.string_value();
    site.frac    = Vec3FromJson(Field(entry, "frac", what), what + ": site");

    const auto& site_fields = entry.struct_value().fields();
    if (auto it = site_fields.find("occupancy"); it != site_fields.end()) {
      if (it->second.kind_case() != Value::kNumberValue) {
        throw util::FormatError(what + ": occupancy must be a number");
      }
      site.occupancy = it->second.number_value();
    }

    geometry.sites.push_back(std::move(site));
  }

  return geometry;
}

} // namespace mc3d::model
