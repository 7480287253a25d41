#include "internal/llm/json_body.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace vaultd::llm {

std::string ToJson(const google::protobuf::Struct& body) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw util::ModelError("failed to encode request: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::Struct ParseJsonObject(const std::string& text, const std::string& what) {
  google::protobuf::Struct object;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(text, &object, options);
  if (!status.ok()) {
    throw util::ModelError(what + ": response is not a JSON object");
  }
  return object;
}

google::protobuf::Value TextMessage(const std::string& role, const std::string& content) {
  google::protobuf::Value message;
  auto&                   fields = *message.mutable_struct_value()->mutable_fields();
  fields["role"].set_string_value(role);
  fields["content"].set_string_value(content);
  return message;
}

std::string StringAt(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

} // namespace vaultd::llm
