#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

namespace vaultd::llm {

// Request/response bodies for the provider APIs.

std::string ToJson(const google::protobuf::Struct& body);

// Throws util::ModelError when text is not a JSON object.
google::protobuf::Struct ParseJsonObject(const std::string& text, const std::string& what);

google::protobuf::Value TextMessage(const std::string& role, const std::string& content);

// Empty string when the path does not lead to a string.
std::string StringAt(const google::protobuf::Struct& object, const std::string& key);

} // namespace vaultd::llm
