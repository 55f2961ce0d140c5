#include "internal/db/sql/codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace strata::db::sql {

namespace {

std::string ToJson(const google::protobuf::ListValue& list) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(list, &out);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  return out;
}

google::protobuf::ListValue FromJson(const std::string& json) {
  google::protobuf::ListValue list;
  if (json.empty()) return list;
  auto status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw std::runtime_error("json decode failed: " + std::string(status.message()));
  }
  return list;
}

std::string Field(const google::protobuf::Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? std::string{} : it->second.string_value();
}

} // namespace

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& v : values) list.add_values()->set_string_value(v);
  return ToJson(list);
}

std::vector<std::string> DecodeStringList(const std::string& json) {
  std::vector<std::string> out;
  for (const auto& v : FromJson(json).values()) out.push_back(v.string_value());
  return out;
}

std::string EncodeColumns(const std::vector<model::ColumnDef>& columns) {
  google::protobuf::ListValue list;
  for (const auto& c : columns) {
    auto* fields = list.add_values()->mutable_struct_value()->mutable_fields();
    (*fields)["name"].set_string_value(c.name);
    (*fields)["type"].set_string_value(c.type);
    (*fields)["nullable"].set_bool_value(c.nullable);
  }
  return ToJson(list);
}

std::vector<model::ColumnDef> DecodeColumns(const std::string& json) {
  std::vector<model::ColumnDef> out;
  for (const auto& v : FromJson(json).values()) {
    const auto&      s = v.struct_value();
    model::ColumnDef c;
    c.name     = Field(s, "name");
    c.type     = Field(s, "type");
    auto it    = s.fields().find("nullable");
    c.nullable = it == s.fields().end() || it->second.bool_value();
    out.push_back(std::move(c));
  }
  return out;
}

std::string EncodeIndexes(const std::vector<model::IndexDef>& indexes) {
  google::protobuf::ListValue list;
  for (const auto& i : indexes) {
    auto* fields = list.add_values()->mutable_struct_value()->mutable_fields();
    (*fields)["name"].set_string_value(i.name);
    (*fields)["definition"].set_string_value(i.definition);
  }
  return ToJson(list);
}

std::vector<model::IndexDef> DecodeIndexes(const std::string& json) {
  std::vector<model::IndexDef> out;
  for (const auto& v : FromJson(json).values()) {
    out.push_back({Field(v.struct_value(), "name"), Field(v.struct_value(), "definition")});
  }
  return out;
}

bool IsSafeIdentifier(const std::string& name) {
  if (name.empty() || name.size() > 63) return false;
  if (!((name[0] >= 'a' && name[0] <= 'z') || name[0] == '_')) return false;
  for (char c : name) {
    if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_')) return false;
  }
  return true;
}

} // namespace strata::db::sql
