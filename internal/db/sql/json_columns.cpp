#include "json_columns.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <sstream>

namespace vaultd::db::sql {

namespace {

std::string ScalarToString(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kNumberValue: {
      const double n = value.number_value();
      if (std::floor(n) == n && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<long long>(n));
      }
      std::ostringstream out;
      out << n;
      return out.str();
    }
    default:
      return {};
  }
}

} // namespace

std::string EncodeStringMap(const std::map<std::string, std::string>& values) {
  google::protobuf::Struct s;
  for (const auto& [key, value] : values) {
    (*s.mutable_fields())[key].set_string_value(value);
  }

  std::string out;
  if (!google::protobuf::util::MessageToJsonString(s, &out).ok()) {
    return "{}";
  }
  return out;
}

std::map<std::string, std::string> DecodeStringMap(const std::string& json) {
  std::map<std::string, std::string> out;
  if (json.empty() || json == "null") return out;

  google::protobuf::Struct s;
  if (!google::protobuf::util::JsonStringToMessage(json, &s).ok()) {
    return out;
  }

  for (const auto& [key, value] : s.fields()) {
    out[key] = ScalarToString(value);
  }
  return out;
}

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }

  std::string out;
  if (!google::protobuf::util::MessageToJsonString(list, &out).ok()) {
    return "[]";
  }
  return out;
}

std::vector<std::string> DecodeStringList(const std::string& json) {
  std::vector<std::string> out;
  if (json.empty() || json == "null") return out;

  google::protobuf::ListValue list;
  if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
    return out;
  }

  for (const auto& value : list.values()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      out.push_back(value.string_value());
    }
  }
  return out;
}

} // namespace vaultd::db::sql
