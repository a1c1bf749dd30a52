#include "json_columns.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"

namespace warranty::db::sql {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

std::string ToJson(const ListValue& list) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    // ListValue built from strings and numbers always serializes.
    WARRANTY_LOG_ERROR("json column encode failed", {observability::StringField("error", std::string(status.message()))});
    return "[]";
  }
  return json;
}

ListValue FromJson(const std::string& json) {
  ListValue list;
  if (json.empty()) return list;

  auto status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    WARRANTY_LOG_WARN("json column decode failed", {observability::StringField("error", std::string(status.message()))});
    return {};
  }
  return list;
}

std::string FieldString(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end()) return {};
  return it->second.string_value();
}

double FieldNumber(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end()) return 0.0;
  return it->second.number_value();
}

bool FieldBool(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end()) return false;
  return it->second.bool_value();
}

} // namespace

std::string EncodeStrings(const std::vector<std::string>& values) {
  ListValue list;
  for (const auto& v : values) {
    list.add_values()->set_string_value(v);
  }
  return ToJson(list);
}

std::vector<std::string> DecodeStrings(const std::string& json) {
  std::vector<std::string> out;
  for (const auto& v : FromJson(json).values()) {
    out.push_back(v.string_value());
  }
  return out;
}

std::string EncodeParts(const std::vector<model::PartUsage>& parts) {
  ListValue list;
  for (const auto& p : parts) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["name"].set_string_value(p.name);
    fields["part_number"].set_string_value(p.part_number);
    fields["quantity"].set_number_value(static_cast<double>(p.quantity));
    fields["unit_cost_cents"].set_number_value(static_cast<double>(p.unit_cost_cents));
  }
  return ToJson(list);
}

std::vector<model::PartUsage> DecodeParts(const std::string& json) {
  std::vector<model::PartUsage> out;
  for (const auto& v : FromJson(json).values()) {
    const auto&      s = v.struct_value();
    model::PartUsage p;
    p.name            = FieldString(s, "name");
    p.part_number     = FieldString(s, "part_number");
    p.quantity        = static_cast<uint32_t>(FieldNumber(s, "quantity"));
    p.unit_cost_cents = static_cast<int64_t>(FieldNumber(s, "unit_cost_cents"));
    out.push_back(std::move(p));
  }
  return out;
}

std::string EncodeTestResults(const std::vector<model::TestResult>& results) {
  ListValue list;
  for (const auto& r : results) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["name"].set_string_value(r.name);
    fields["passed"].set_bool_value(r.passed);
    fields["notes"].set_string_value(r.notes);
  }
  return ToJson(list);
}

std::vector<model::TestResult> DecodeTestResults(const std::string& json) {
  std::vector<model::TestResult> out;
  for (const auto& v : FromJson(json).values()) {
    const auto&       s = v.struct_value();
    model::TestResult r;
    r.name   = FieldString(s, "name");
    r.passed = FieldBool(s, "passed");
    r.notes  = FieldString(s, "notes");
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace warranty::db::sql
