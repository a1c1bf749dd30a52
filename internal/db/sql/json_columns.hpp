#pragma once

#include <string>
#include <vector>

#include "internal/db/model/repair_ticket_record.hpp"

namespace warranty::db::sql {

/*
  List-valued columns are stored as JSON text.

  Encoding goes through google.protobuf.ListValue so both SQL backends
  and any external reader see the same canonical JSON. Empty lists encode
  as "[]"; an empty or malformed column decodes as an empty list.
*/

std::string EncodeStrings(const std::vector<std::string>& values);
std::vector<std::string> DecodeStrings(const std::string& json);

std::string EncodeParts(const std::vector<model::PartUsage>& parts);
std::vector<model::PartUsage> DecodeParts(const std::string& json);

std::string EncodeTestResults(const std::vector<model::TestResult>& results);
std::vector<model::TestResult> DecodeTestResults(const std::string& json);

} // namespace warranty::db::sql
